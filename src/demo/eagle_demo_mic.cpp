#include <gflags/gflags.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "demo_common.hpp"
#include "eagle_cpp/audio_input.hpp"
#include "eagle_cpp/factory.hpp"
#include "eagle_cpp/frame_queue.hpp"
#include "eagle_cpp/string_utils.hpp"
#include "eagle_cpp/wav_io.hpp"

DEFINE_string(access_key, "", "AccessKey obtained from Picovoice Console (falls back to PICOVOICE_ACCESS_KEY)");
DEFINE_string(library_path, "", "Path to Eagle's dynamic library (default: EAGLE_LIBRARY_PATH or bundled)");
DEFINE_string(model_path, "", "Path to Eagle's model file (default: EAGLE_MODEL_PATH or bundled)");
DEFINE_string(device, "best", "Inference device: best, cpu, cpu:<threads>, gpu, gpu:<index>");
DEFINE_bool(show_audio_devices, false, "Print the available input devices and exit");
DEFINE_int32(audio_device_index, -1, "Index of the input device (-1: automatic)");
DEFINE_string(output_audio_path, "", "If set, the captured audio is saved to this WAV file");
DEFINE_bool(verbose, false, "Enable debug logging on stderr");

DEFINE_string(output_profile_path, "", "[enroll] Where to save the speaker profile");
DEFINE_string(input_profile_paths, "", "[test] Comma-separated speaker profile files");

using namespace std;
using namespace eagle_cpp;


namespace
{

constexpr int kCaptureFrameLength = 512;
constexpr chrono::milliseconds kPopTimeout(100);

EngineOptions engine_options()
{
  EngineOptions options;
  options.library_path = FLAGS_library_path;
  options.model_path = FLAGS_model_path;
  options.device = FLAGS_device;
  return options;
}

int show_audio_devices()
{
  vector<AudioDeviceInfo> devices;
  string error;
  if (!AudioInput::available_devices(devices, error)) {
    fprintf(stderr, "Failed to list audio devices: %s\n", error.c_str());
    return 1;
  }
  for (const auto & device : devices) {
    printf("Device #%d: %s\n", device.index, device.name.c_str());
  }
  return 0;
}

/// 마이크 캡처 → FrameQueue 연결. 녹음 데이터는 --output_audio_path 용으로 누적
class MicSession
{
public:
  MicSession(int sample_rate, int frame_length, size_t queue_capacity)
  : queue_(queue_capacity), sample_rate_(sample_rate), frame_length_(frame_length)
  {
  }

  ~MicSession()
  {
    stop();
  }

  bool start()
  {
    if (!input_.configure(FLAGS_audio_device_index, sample_rate_, frame_length_)) {
      fprintf(stderr, "Invalid audio configuration: %s\n", input_.last_error().c_str());
      return false;
    }
    input_.set_callback([this](const AudioInput::Frame & frame) {queue_.push(frame);});
    if (!input_.start()) {
      fprintf(stderr, "Failed to start audio capture: %s\n", input_.last_error().c_str());
      return false;
    }
    printf("Recording audio from '%s'\n", input_.selected_device_name().c_str());
    return true;
  }

  /// Returns false when interrupted.
  bool read(FrameQueue::Frame & frame)
  {
    while (!demo::interrupted()) {
      if (queue_.pop_for(frame, kPopTimeout)) {
        if (!FLAGS_output_audio_path.empty()) {
          recorded_.insert(recorded_.end(), frame.begin(), frame.end());
        }
        return true;
      }
    }
    return false;
  }

  void discard_pending()
  {
    queue_.clear();
  }

  void stop()
  {
    if (queue_.closed()) {
      return;
    }
    input_.stop();
    queue_.close();
    if (queue_.dropped() > 0) {
      spdlog::warn("{} audio frames were dropped", queue_.dropped());
    }
  }

  void save_recording() const
  {
    if (FLAGS_output_audio_path.empty()) {
      return;
    }
    WavWriter writer;
    if (!writer.write_pcm16_mono(FLAGS_output_audio_path, recorded_, sample_rate_)) {
      spdlog::error("failed to write audio to `{}`", FLAGS_output_audio_path);
      return;
    }
    spdlog::info("saved {} samples to `{}`", recorded_.size(), FLAGS_output_audio_path);
  }

private:
  AudioInput input_;
  FrameQueue queue_;
  int sample_rate_;
  int frame_length_;
  vector<int16_t> recorded_;
};

int run_enroll(const string & access_key)
{
  if (FLAGS_output_profile_path.empty()) {
    fprintf(stderr, "--output_profile_path is required in enroll mode.\n");
    return 1;
  }

  unique_ptr<Profiler> profiler;
  try {
    profiler = create_profiler(access_key, engine_options());
  } catch (const EagleError & e) {
    return demo::report_error("Failed to initialize Eagle", e);
  }
  printf("Eagle version: %s\n", profiler->version().c_str());

  // 최소 등록 길이를 캡처 프레임 단위로 내림
  size_t num_enroll_frames =
    static_cast<size_t>(profiler->min_enroll_samples() / kCaptureFrameLength);
  if (num_enroll_frames == 0) {
    num_enroll_frames = 1;
  }

  MicSession mic(profiler->sample_rate(), kCaptureFrameLength, num_enroll_frames * 2);
  if (!mic.start()) {
    return 1;
  }

  demo::EnrollmentAnimation animation;
  printf("Please keep speaking until the enrollment percentage reaches 100%%\n");
  int exit_code = 0;
  try {
    float percentage = 0.0F;
    animation.start();
    while (percentage < 100.0F) {
      vector<int16_t> enroll_pcm;
      enroll_pcm.reserve(num_enroll_frames * kCaptureFrameLength);
      FrameQueue::Frame frame;
      for (size_t i = 0; i < num_enroll_frames; ++i) {
        if (!mic.read(frame)) {
          break;
        }
        enroll_pcm.insert(enroll_pcm.end(), frame.begin(), frame.end());
      }
      if (demo::interrupted()) {
        break;
      }

      const EnrollResult result = profiler->enroll(enroll_pcm);
      percentage = result.percentage;
      animation.update(percentage, demo::feedback_message(result.feedback));
      mic.discard_pending();
    }
    animation.stop();

    if (demo::interrupted()) {
      printf("\nStopping enrollment. No speaker profile is saved.\n");
    } else {
      const Profile profile = profiler->export_profile();
      save_profile(profile, FLAGS_output_profile_path);
      printf("\nSpeaker profile is saved to %s\n", FLAGS_output_profile_path.c_str());
    }
  } catch (const EagleError & e) {
    animation.stop();
    printf("\n");
    exit_code = demo::report_error("Failed to enroll speaker", e);
  }

  mic.stop();
  mic.save_recording();
  return exit_code;
}

int run_test(const string & access_key)
{
  const vector<string> profile_paths = split_list(FLAGS_input_profile_paths);
  if (profile_paths.empty()) {
    fprintf(stderr, "Please provide at least one speaker profile with --input_profile_paths.\n");
    return 1;
  }

  vector<string> labels;
  unique_ptr<Recognizer> recognizer;
  try {
    const vector<Profile> profiles = demo::load_profiles(profile_paths, labels);
    recognizer = create_recognizer(access_key, profiles, engine_options());
  } catch (const EagleError & e) {
    return demo::report_error("Failed to initialize Eagle", e);
  }
  printf("Eagle version: %s\n", recognizer->version().c_str());

  MicSession mic(recognizer->sample_rate(), recognizer->frame_length(), 64);
  if (!mic.start()) {
    return 1;
  }

  printf("Listening for audio... (press Ctrl+C to stop)\n");
  int exit_code = 0;
  try {
    FrameQueue::Frame frame;
    while (mic.read(frame)) {
      const vector<float> scores = recognizer->process(frame);
      printf("\rscores -> %s", demo::format_scores(scores, labels).c_str());
      fflush(stdout);
    }
    printf("\nStopping...\n");
  } catch (const EagleError & e) {
    printf("\n");
    exit_code = demo::report_error("Failed to process audio", e);
  }

  mic.stop();
  mic.save_recording();
  return exit_code;
}

}  // namespace

int main(int argc, char ** argv)
{
  gflags::SetUsageMessage(
    "eagle_demo_mic enroll --output_profile_path=p.eagle\n"
    "eagle_demo_mic test --input_profile_paths=a.eagle,b.eagle");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  demo::init_logging(FLAGS_verbose);

  if (FLAGS_show_audio_devices) {
    return show_audio_devices();
  }

  if (argc < 2) {
    fprintf(stderr, "Please specify a mode: enroll or test\n");
    return 1;
  }
  const string mode = argv[1];
  const string access_key = resolve_access_key(FLAGS_access_key);
  demo::install_interrupt_handler();

  if (mode == "enroll") {
    return run_enroll(access_key);
  }
  if (mode == "test") {
    return run_test(access_key);
  }
  fprintf(stderr, "Unknown mode `%s`. Please specify a mode: enroll or test\n", mode.c_str());
  return 1;
}
