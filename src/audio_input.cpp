#include "eagle_cpp/audio_input.hpp"

#include <algorithm>
#include <string>
#include <utility>

#include "eagle_cpp/string_utils.hpp"

using namespace std;


namespace eagle_cpp
{

AudioInput::AudioInput()
: device_index_(-1),
  sample_rate_(16000),
  frame_length_(512),
  selected_device_index_(paNoDevice),
  running_(false),
  initialized_(false),
  stream_(nullptr),
  frame_buf_(512, 0)
{
}

AudioInput::~AudioInput()
{
  stop();
}

bool AudioInput::configure(int device_index, int sample_rate, int frame_length)
{
  if (is_running()) {return false;}  // 실행 중 설정 변경 금지

  device_index_ = device_index;
  sample_rate_ = sample_rate;
  frame_length_ = frame_length;

  if (!validate_config_()) {
    last_error_ = "invalid_audio_config";
    return false;
  }
  return true;
}

void AudioInput::set_preferred_device_keywords(const vector<string> & keywords)
{
  if (is_running()) {return;}
  preferred_device_keywords_.clear();
  preferred_device_keywords_.reserve(keywords.size());
  for (const auto & keyword : keywords) {
    const string normalized = to_lower(keyword);
    if (!normalized.empty()) {
      preferred_device_keywords_.push_back(normalized);
    }
  }
}

bool AudioInput::validate_config_() const
{
  return sample_rate_ > 0 && frame_length_ > 0;
}

bool AudioInput::supports_mono_int16_(int device_index) const
{
  const PaDeviceInfo * info = Pa_GetDeviceInfo(device_index);
  if (!info || info->maxInputChannels < 1) {return false;}

  PaStreamParameters in_params{};
  in_params.device = device_index;
  in_params.channelCount = 1;
  in_params.sampleFormat = paInt16;
  in_params.suggestedLatency = info->defaultLowInputLatency;
  in_params.hostApiSpecificStreamInfo = nullptr;

  return Pa_IsFormatSupported(
    &in_params, nullptr, static_cast<double>(sample_rate_)) == paFormatIsSupported;
}

/// 오디오 입력 디바이스 선택 우선순위:
/// 1) 지정된 인덱스  2) 선호 키워드가 이름에 포함된 장치
/// 3) 시스템 기본 장치  4) 포맷을 지원하는 첫 장치
int AudioInput::resolve_device_index_() const
{
  const int device_count = Pa_GetDeviceCount();
  if (device_count <= 0) {return paNoDevice;}

  if (device_index_ >= 0) {
    // 명시적으로 지정한 장치는 다른 장치로 대체하지 않음
    if (device_index_ < device_count && supports_mono_int16_(device_index_)) {
      return device_index_;
    }
    return paNoDevice;
  }

  int first_supported = paNoDevice;
  for (int i = 0; i < device_count; ++i) {
    if (!supports_mono_int16_(i)) {continue;}
    if (first_supported == paNoDevice) {first_supported = i;}

    const PaDeviceInfo * info = Pa_GetDeviceInfo(i);
    const string name = to_lower(info && info->name ? info->name : "");
    for (const auto & keyword : preferred_device_keywords_) {
      if (name.find(keyword) != string::npos) {
        return i;
      }
    }
  }

  const int default_device = Pa_GetDefaultInputDevice();
  if (default_device != paNoDevice && supports_mono_int16_(default_device)) {
    return default_device;
  }

  return first_supported;
}

void AudioInput::set_callback(FrameCallback cb)
{
  lock_guard<mutex> lock(cb_mutex_);
  callback_ = move(cb);
}

/// PortAudio 초기화 → 디바이스 선택 → mono int16 스트림 오픈 → 콜백 루프 시작
bool AudioInput::start()
{
  if (running_) {return true;}

  if (!validate_config_()) {
    last_error_ = "invalid_audio_config";
    return false;
  }
  last_error_.clear();
  selected_device_index_ = paNoDevice;
  selected_device_name_.clear();

  PaError err;

  if (!initialized_) {
    err = Pa_Initialize();
    if (err != paNoError) {
      last_error_ = Pa_GetErrorText(err);
      return false;
    }
    initialized_ = true;
  }

  const int dev = resolve_device_index_();
  if (dev == paNoDevice) {
    last_error_ = device_index_ >= 0 ?
      "audio device " + std::to_string(device_index_) + " cannot record mono int16 at " +
      std::to_string(sample_rate_) + " Hz" :
      "no_supported_input_device";
    return false;
  }

  const PaDeviceInfo * dev_info = Pa_GetDeviceInfo(dev);
  if (!dev_info) {
    last_error_ = "invalid_device_info";
    return false;
  }
  selected_device_index_ = dev;
  selected_device_name_ = dev_info->name ? dev_info->name : "";

  PaStreamParameters in_params;
  in_params.device = dev;
  in_params.channelCount = 1;
  in_params.sampleFormat = paInt16;
  in_params.suggestedLatency = dev_info->defaultLowInputLatency;
  in_params.hostApiSpecificStreamInfo = nullptr;

  if (stream_) {
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }

  frame_buf_.assign(static_cast<size_t>(frame_length_), 0);

  err = Pa_OpenStream(
    &stream_,
    &in_params,
    nullptr,
    sample_rate_,
    static_cast<unsigned long>(frame_length_),
    paNoFlag,
    &AudioInput::pa_callback,
    this);

  if (err != paNoError) {
    stream_ = nullptr;
    last_error_ = Pa_GetErrorText(err);
    return false;
  }

  running_ = true;
  err = Pa_StartStream(stream_);
  if (err != paNoError) {
    running_ = false;
    Pa_CloseStream(stream_);
    stream_ = nullptr;
    last_error_ = Pa_GetErrorText(err);
    return false;
  }

  return true;
}

void AudioInput::stop()
{
  running_ = false;

  if (stream_) {
    if (Pa_IsStreamActive(stream_) == 1) {
      Pa_StopStream(stream_);
    }
    Pa_CloseStream(stream_);
    stream_ = nullptr;
  }

  if (initialized_) {
    Pa_Terminate();
    initialized_ = false;
  }
}

bool AudioInput::is_running() const
{
  return running_.load();
}

int AudioInput::sample_rate() const
{
  return sample_rate_;
}

int AudioInput::frame_length() const
{
  return frame_length_;
}

int AudioInput::selected_device_index() const
{
  return selected_device_index_;
}

string AudioInput::selected_device_name() const
{
  return selected_device_name_;
}

string AudioInput::last_error() const
{
  return last_error_;
}

bool AudioInput::available_devices(vector<AudioDeviceInfo> & devices, string & error)
{
  devices.clear();
  error.clear();

  PaError err = Pa_Initialize();
  if (err != paNoError) {
    error = Pa_GetErrorText(err);
    return false;
  }

  const int device_count = Pa_GetDeviceCount();
  if (device_count < 0) {
    error = Pa_GetErrorText(device_count);
    Pa_Terminate();
    return false;
  }

  for (int i = 0; i < device_count; ++i) {
    const PaDeviceInfo * info = Pa_GetDeviceInfo(i);
    if (!info || info->maxInputChannels < 1) {continue;}
    AudioDeviceInfo device;
    device.index = i;
    device.name = info->name ? info->name : "";
    devices.push_back(move(device));
  }

  Pa_Terminate();
  return true;
}

/// PortAudio 콜백 (오디오 스레드): PCM 프레임을 frame_buf_에 복사 후 등록된 콜백 호출
int AudioInput::pa_callback(
  const void * input,
  void * /*output*/,
  unsigned long frameCount,
  const PaStreamCallbackTimeInfo * /*timeInfo*/,
  PaStreamCallbackFlags /*statusFlags*/,
  void * userData)
{
  auto * self = static_cast<AudioInput *>(userData);
  if (!self || !self->running_.load()) {return paComplete;}

  const auto * in = static_cast<const int16_t *>(input);
  if (!in) {
    fill(self->frame_buf_.begin(), self->frame_buf_.end(), 0);
  } else {
    const unsigned long n =
      min<unsigned long>(frameCount, static_cast<unsigned long>(self->frame_buf_.size()));
    copy(in, in + n, self->frame_buf_.begin());
    if (n < self->frame_buf_.size()) {
      fill(self->frame_buf_.begin() + n, self->frame_buf_.end(), 0);
    }
  }

  AudioInput::FrameCallback cb;
  {
    lock_guard<mutex> lock(self->cb_mutex_);
    cb = self->callback_;
  }
  if (cb) {
    cb(self->frame_buf_);
  }

  return paContinue;
}

}  // namespace eagle_cpp
