#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "demo_common.hpp"
#include "eagle_cpp/factory.hpp"
#include "eagle_cpp/string_utils.hpp"
#include "eagle_cpp/wav_io.hpp"

DEFINE_string(access_key, "", "AccessKey obtained from Picovoice Console (falls back to PICOVOICE_ACCESS_KEY)");
DEFINE_string(library_path, "", "Path to Eagle's dynamic library (default: EAGLE_LIBRARY_PATH or bundled)");
DEFINE_string(model_path, "", "Path to Eagle's model file (default: EAGLE_MODEL_PATH or bundled)");
DEFINE_string(device, "best", "Inference device: best, cpu, cpu:<threads>, gpu, gpu:<index>");
DEFINE_bool(show_inference_devices, false, "Print the devices Eagle can run on and exit");
DEFINE_bool(verbose, false, "Enable debug logging on stderr");

DEFINE_string(enroll_audio_paths, "", "[enroll] Comma-separated WAV files of the speaker");
DEFINE_string(output_profile_path, "", "[enroll] Where to save the speaker profile");

DEFINE_string(input_profile_paths, "", "[test] Comma-separated speaker profile files");
DEFINE_string(test_audio_path, "", "[test] WAV file to score");
DEFINE_string(csv_output_path, "", "[test] Write per-frame scores to this CSV instead of stdout");

using namespace std;
using namespace eagle_cpp;


namespace
{

EngineOptions engine_options()
{
  EngineOptions options;
  options.library_path = FLAGS_library_path;
  options.model_path = FLAGS_model_path;
  options.device = FLAGS_device;
  return options;
}

bool read_audio(const string & path, int sample_rate, vector<int16_t> & pcm)
{
  WavReader reader;
  WavAudio audio;
  if (!reader.read(path, sample_rate, audio)) {
    spdlog::error("{}", reader.last_error());
    return false;
  }
  if (audio.channels > 1) {
    printf(
      "Eagle processes single-channel audio but a %d-channel file is provided. "
      "Processing the first channel only.\n", audio.channels);
  }
  pcm = move(audio.samples);
  return true;
}

int show_inference_devices()
{
  try {
    const vector<string> devices = list_hardware_devices(FLAGS_library_path);
    for (const auto & device : devices) {
      printf("%s\n", device.c_str());
    }
  } catch (const EagleError & e) {
    return demo::report_error("Failed to list hardware devices", e);
  }
  return 0;
}

/// 등록 파일을 순서대로 enroll → 100% 도달 시 프로파일 저장
int run_enroll(const string & access_key)
{
  const vector<string> audio_paths = split_list(FLAGS_enroll_audio_paths);
  if (audio_paths.empty()) {
    fprintf(stderr, "Please provide at least one audio file with --enroll_audio_paths.\n");
    return 1;
  }
  for (const auto & path : audio_paths) {
    if (!ends_with(to_lower(path), ".wav")) {
      fprintf(stderr, "Given argument --enroll_audio_paths must have WAV file extension\n");
      return 1;
    }
  }
  if (FLAGS_output_profile_path.empty()) {
    fprintf(stderr, "--output_profile_path is required in enroll mode.\n");
    return 1;
  }

  unique_ptr<Profiler> profiler;
  try {
    profiler = create_profiler(access_key, engine_options());
  } catch (const EagleError & e) {
    return demo::report_error("Failed to initialize EagleProfiler", e);
  }
  printf("Eagle version: %s\n", profiler->version().c_str());

  try {
    float percentage = 0.0F;
    double processed_sec = 0.0;
    double audio_sec = 0.0;
    for (const auto & path : audio_paths) {
      vector<int16_t> pcm;
      if (!read_audio(path, profiler->sample_rate(), pcm)) {
        return 1;
      }

      const auto begin = chrono::steady_clock::now();
      const EnrollResult result = profiler->enroll(pcm);
      processed_sec += chrono::duration<double>(chrono::steady_clock::now() - begin).count();
      audio_sec += static_cast<double>(pcm.size()) / profiler->sample_rate();

      percentage = result.percentage;
      printf(
        "Enrolled audio file %s [Enrollment percentage: %.2f%% - Enrollment feedback: %s]\n",
        path.c_str(), percentage, demo::feedback_message(result.feedback));
    }
    if (audio_sec > 0.0) {
      printf("real time factor : %.3f\n", processed_sec / audio_sec);
    }

    if (percentage < 100.0F) {
      printf(
        "Failed to create speaker profile. Insufficient enrollment percentage: %.2f%%. "
        "Please add more audio files for enrollment.\n", percentage);
      return 1;
    }

    const Profile profile = profiler->export_profile();
    save_profile(profile, FLAGS_output_profile_path);
    printf("Speaker profile is saved to %s\n", FLAGS_output_profile_path.c_str());
  } catch (const EagleError & e) {
    return demo::report_error("Failed to perform enrollment", e);
  }
  return 0;
}

/// 프로파일 로드 → 테스트 오디오를 프레임 단위로 점수화 (stdout 또는 CSV)
int run_test(const string & access_key)
{
  const vector<string> profile_paths = split_list(FLAGS_input_profile_paths);
  if (profile_paths.empty()) {
    fprintf(stderr, "Please provide at least one speaker profile with --input_profile_paths.\n");
    return 1;
  }
  if (FLAGS_test_audio_path.empty()) {
    fprintf(stderr, "--test_audio_path is required in test mode.\n");
    return 1;
  }

  vector<string> labels;
  vector<Profile> profiles;
  unique_ptr<Recognizer> recognizer;
  try {
    profiles = demo::load_profiles(profile_paths, labels);
    recognizer = create_recognizer(access_key, profiles, engine_options());
  } catch (const EagleError & e) {
    return demo::report_error("Failed to initialize Eagle", e);
  }
  printf("Eagle version: %s\n", recognizer->version().c_str());

  vector<int16_t> pcm;
  if (!read_audio(FLAGS_test_audio_path, recognizer->sample_rate(), pcm)) {
    return 1;
  }

  ofstream csv;
  if (!FLAGS_csv_output_path.empty()) {
    csv.open(FLAGS_csv_output_path, ios::trunc);
    if (!csv.is_open()) {
      fprintf(stderr, "Failed to open '%s' for writing\n", FLAGS_csv_output_path.c_str());
      return 1;
    }
    csv << "time";
    for (size_t i = 0; i < profiles.size(); ++i) {
      csv << ",Speaker_" << i;
    }
    csv << "\n";
  }

  const size_t frame_length = static_cast<size_t>(recognizer->frame_length());
  const double frame_to_second =
    static_cast<double>(frame_length) / recognizer->sample_rate();
  const size_t num_frames = pcm.size() / frame_length;
  spdlog::debug("{} frames of {} samples", num_frames, frame_length);

  double processed_sec = 0.0;
  try {
    for (size_t i = 0; i < num_frames; ++i) {
      const auto begin = chrono::steady_clock::now();
      const vector<float> scores = recognizer->process(pcm.data() + i * frame_length, frame_length);
      processed_sec += chrono::duration<double>(chrono::steady_clock::now() - begin).count();

      const double time_sec = static_cast<double>(i) * frame_to_second;
      if (csv.is_open()) {
        csv << time_sec;
        for (float score : scores) {
          csv << "," << score;
        }
        csv << "\n";
      } else {
        printf(
          "time: %4.2f sec | scores -> %s\n",
          time_sec, demo::format_scores(scores, labels).c_str());
      }
    }
  } catch (const EagleError & e) {
    return demo::report_error("Failed to process audio", e);
  }

  if (csv.is_open()) {
    csv.flush();
    if (!csv.good()) {
      fprintf(stderr, "Failed to write '%s'\n", FLAGS_csv_output_path.c_str());
      return 1;
    }
    printf("Test result is saved to %s\n", FLAGS_csv_output_path.c_str());
  }
  if (num_frames > 0) {
    printf(
      "real time factor : %.3f\n",
      processed_sec / (static_cast<double>(num_frames) * frame_to_second));
  }
  return 0;
}

}  // namespace

int main(int argc, char ** argv)
{
  gflags::SetUsageMessage(
    "eagle_demo_file enroll --enroll_audio_paths=a.wav,b.wav --output_profile_path=p.eagle\n"
    "eagle_demo_file test --input_profile_paths=p.eagle --test_audio_path=t.wav");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  demo::init_logging(FLAGS_verbose);

  if (FLAGS_show_inference_devices) {
    return show_inference_devices();
  }

  if (argc < 2) {
    fprintf(stderr, "Please specify a mode: enroll or test\n");
    return 1;
  }
  const string mode = argv[1];
  const string access_key = resolve_access_key(FLAGS_access_key);

  if (mode == "enroll") {
    return run_enroll(access_key);
  }
  if (mode == "test") {
    return run_test(access_key);
  }
  fprintf(stderr, "Unknown mode `%s`. Please specify a mode: enroll or test\n", mode.c_str());
  return 1;
}
