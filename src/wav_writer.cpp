#include "eagle_cpp/wav_io.hpp"

#include <sndfile.h>

#include <filesystem>

using namespace std;


namespace eagle_cpp
{

WavWriter::WavWriter() = default;

bool WavWriter::ensure_output_dir(const string & dir) const
{
  if (dir.empty()) {
    return true;
  }
  error_code ec;
  filesystem::create_directories(dir, ec);
  return !ec;
}

/// PCM16 mono 버퍼를 WAV 파일로 저장 (상위 디렉터리가 없으면 생성)
bool WavWriter::write_pcm16_mono(
  const string & file_path,
  const vector<int16_t> & audio,
  int sample_rate) const
{
  if (sample_rate <= 0) {
    return false;
  }
  if (!ensure_output_dir(filesystem::path(file_path).parent_path().string())) {
    return false;
  }

  SF_INFO sf_info{};
  sf_info.samplerate = sample_rate;
  sf_info.channels = 1;
  sf_info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

  SNDFILE * snd = sf_open(file_path.c_str(), SFM_WRITE, &sf_info);
  if (!snd) {
    return false;
  }

  const sf_count_t frames = static_cast<sf_count_t>(audio.size());
  const sf_count_t written = frames > 0 ? sf_writef_short(snd, audio.data(), frames) : 0;
  const int close_status = sf_close(snd);
  return written == frames && close_status == 0;
}

}  // namespace eagle_cpp
