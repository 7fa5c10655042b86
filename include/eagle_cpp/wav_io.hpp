#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace eagle_cpp
{

struct WavAudio
{
  std::vector<int16_t> samples;
  int sample_rate = 0;
  int channels = 0;
};

/// libsndfile 기반 16-bit PCM WAV 리더. 다채널 파일은 첫 번째 채널만 사용.
class WavReader
{
public:
  WavReader();

  bool read(const std::string & file_path, int expected_sample_rate, WavAudio & audio);
  std::string last_error() const;

private:
  std::string last_error_;
};

class WavWriter
{
public:
  WavWriter();

  bool ensure_output_dir(const std::string & dir) const;
  bool write_pcm16_mono(
    const std::string & file_path,
    const std::vector<int16_t> & audio,
    int sample_rate) const;
};

}  // namespace eagle_cpp
