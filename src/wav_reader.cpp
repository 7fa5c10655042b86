#include "eagle_cpp/wav_io.hpp"

#include <sndfile.h>

#include <filesystem>

using namespace std;


namespace eagle_cpp
{

WavReader::WavReader() = default;

bool WavReader::read(const string & file_path, int expected_sample_rate, WavAudio & audio)
{
  last_error_.clear();
  audio = WavAudio{};

  error_code ec;
  if (!filesystem::is_regular_file(file_path, ec)) {
    last_error_ = "wav file not found: " + file_path;
    return false;
  }

  SF_INFO sf_info{};
  SNDFILE * snd = sf_open(file_path.c_str(), SFM_READ, &sf_info);
  if (!snd) {
    last_error_ = "failed to open wav file: " + string(sf_strerror(nullptr));
    return false;
  }

  if ((sf_info.format & SF_FORMAT_TYPEMASK) != SF_FORMAT_WAV ||
    (sf_info.format & SF_FORMAT_SUBMASK) != SF_FORMAT_PCM_16)
  {
    sf_close(snd);
    last_error_ = "audio file must be a 16-bit PCM WAV: " + file_path;
    return false;
  }
  if (sf_info.samplerate != expected_sample_rate) {
    sf_close(snd);
    last_error_ = "audio file must have a sample rate of " + std::to_string(expected_sample_rate) +
      " Hz (got " + std::to_string(sf_info.samplerate) + "): " + file_path;
    return false;
  }
  if (sf_info.channels <= 0) {
    sf_close(snd);
    last_error_ = "wav channel count is invalid";
    return false;
  }

  const size_t channels = static_cast<size_t>(sf_info.channels);
  vector<int16_t> interleaved(static_cast<size_t>(sf_info.frames) * channels, 0);
  const sf_count_t read_frames = sf_readf_short(snd, interleaved.data(), sf_info.frames);
  sf_close(snd);

  if (read_frames < 0 || (sf_info.frames > 0 && read_frames == 0)) {
    last_error_ = "failed to read wav samples (libsndfile)";
    return false;
  }

  // 첫 번째 채널만 추출
  audio.samples.resize(static_cast<size_t>(read_frames));
  for (sf_count_t i = 0; i < read_frames; ++i) {
    audio.samples[static_cast<size_t>(i)] = interleaved[static_cast<size_t>(i) * channels];
  }
  audio.sample_rate = sf_info.samplerate;
  audio.channels = sf_info.channels;
  return true;
}

string WavReader::last_error() const
{
  return last_error_;
}

}  // namespace eagle_cpp
