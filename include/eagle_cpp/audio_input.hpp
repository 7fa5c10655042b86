#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include <portaudio.h>

namespace eagle_cpp
{

struct AudioDeviceInfo
{
  int index = -1;
  std::string name;
};

/// PortAudio mono int16 capture. Delivers fixed-length frames from the
/// PortAudio callback thread.
class AudioInput
{
public:
  using Frame = std::vector<int16_t>;
  using FrameCallback = std::function<void (const Frame & frame)>;

  AudioInput();
  ~AudioInput();

  AudioInput(const AudioInput &) = delete;
  AudioInput & operator=(const AudioInput &) = delete;

  /// device_index < 0 selects automatically (keywords → default → first supported).
  bool configure(int device_index, int sample_rate, int frame_length);
  void set_preferred_device_keywords(const std::vector<std::string> & keywords);

  bool start();
  void stop();
  bool is_running() const;
  int sample_rate() const;
  int frame_length() const;
  int selected_device_index() const;
  std::string selected_device_name() const;
  std::string last_error() const;

  void set_callback(FrameCallback cb);

  /// Input-capable devices. Initializes PortAudio for the duration of the call.
  static bool available_devices(std::vector<AudioDeviceInfo> & devices, std::string & error);

private:
  static int pa_callback(
    const void * input,
    void * output,
    unsigned long frameCount,
    const PaStreamCallbackTimeInfo * timeInfo,
    PaStreamCallbackFlags statusFlags,
    void * userData);

  bool validate_config_() const;
  bool supports_mono_int16_(int device_index) const;
  int resolve_device_index_() const;

private:
  int device_index_;
  int sample_rate_;
  int frame_length_;
  std::vector<std::string> preferred_device_keywords_;
  int selected_device_index_;
  std::string selected_device_name_;
  std::string last_error_;

  std::atomic<bool> running_;
  std::atomic<bool> initialized_;

  PaStream * stream_;

  std::mutex cb_mutex_;
  FrameCallback callback_;

  // PortAudio callback 스레드에서 사용하는 고정 길이 프레임 버퍼
  Frame frame_buf_;
};

}  // namespace eagle_cpp
