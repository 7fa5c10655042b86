#include "eagle_cpp/factory.hpp"

#include <cstdlib>

#include "eagle_cpp/errors.hpp"
#include "native_library.hpp"

#ifndef EAGLE_CPP_RESOURCE_DIR
#define EAGLE_CPP_RESOURCE_DIR "."
#endif

using namespace std;


namespace eagle_cpp
{

namespace
{
string env_or_empty(const char * name)
{
  const char * value = getenv(name);
  return value ? string(value) : string();
}

/// lib/ 아래 플랫폼/아키텍처 디렉터리 (엔진 배포 패키지 레이아웃)
string platform_library_subdir()
{
#if defined(__APPLE__)
#if defined(__aarch64__) || defined(__arm64__)
  return "mac/arm64/libpv_eagle.dylib";
#else
  return "mac/x86_64/libpv_eagle.dylib";
#endif
#elif defined(__linux__)
#if defined(__x86_64__)
  return "linux/x86_64/libpv_eagle.so";
#elif defined(__aarch64__)
  return "raspberry-pi/cortex-a76-aarch64/libpv_eagle.so";
#else
  throw EagleError(ErrorKind::RUNTIME, "Unsupported CPU architecture for Eagle on Linux");
#endif
#else
  throw EagleError(ErrorKind::RUNTIME, "Unsupported platform for Eagle");
#endif
}

EngineOptions with_defaults(const EngineOptions & options)
{
  EngineOptions resolved = options;
  if (resolved.model_path.empty()) {
    resolved.model_path = default_model_path();
  }
  if (resolved.library_path.empty()) {
    resolved.library_path = default_library_path();
  }
  if (resolved.device.empty()) {
    resolved.device = "best";
  }
  return resolved;
}

/// pv_eagle_free_hardware_devices 호출 보장
class HardwareDeviceListGuard
{
public:
  HardwareDeviceListGuard(void (*free_fn)(char **, int32_t), char ** devices, int32_t count)
  : free_fn_(free_fn), devices_(devices), count_(count)
  {
  }

  ~HardwareDeviceListGuard()
  {
    if (free_fn_ && devices_) {
      free_fn_(devices_, count_);
    }
  }

  HardwareDeviceListGuard(const HardwareDeviceListGuard &) = delete;
  HardwareDeviceListGuard & operator=(const HardwareDeviceListGuard &) = delete;

private:
  void (*free_fn_)(char **, int32_t);
  char ** devices_;
  int32_t count_;
};
}  // namespace

string default_library_path()
{
  const string env_path = env_or_empty("EAGLE_LIBRARY_PATH");
  if (!env_path.empty()) {
    return env_path;
  }
  return string(EAGLE_CPP_RESOURCE_DIR) + "/lib/" + platform_library_subdir();
}

string default_model_path()
{
  const string env_path = env_or_empty("EAGLE_MODEL_PATH");
  if (!env_path.empty()) {
    return env_path;
  }
  return string(EAGLE_CPP_RESOURCE_DIR) + "/lib/common/eagle_params.pv";
}

string resolve_access_key(const string & configured)
{
  if (!configured.empty()) {
    return configured;
  }
  return env_or_empty("PICOVOICE_ACCESS_KEY");
}

unique_ptr<Profiler> create_profiler(const string & access_key, const EngineOptions & options)
{
  const EngineOptions resolved = with_defaults(options);

  ProfilerConfig config;
  config.access_key = access_key;
  config.model_path = resolved.model_path;
  config.library_path = resolved.library_path;
  config.device = resolved.device;
  return make_unique<Profiler>(config);
}

unique_ptr<Recognizer> create_recognizer(
  const string & access_key,
  const vector<Profile> & speaker_profiles,
  const EngineOptions & options)
{
  const EngineOptions resolved = with_defaults(options);

  RecognizerConfig config;
  config.access_key = access_key;
  config.model_path = resolved.model_path;
  config.library_path = resolved.library_path;
  config.device = resolved.device;
  config.speaker_profiles = speaker_profiles;
  return make_unique<Recognizer>(config);
}

unique_ptr<Recognizer> create_recognizer(
  const string & access_key,
  const Profile & speaker_profile,
  const EngineOptions & options)
{
  return create_recognizer(access_key, vector<Profile>{speaker_profile}, options);
}

vector<string> list_hardware_devices(const string & library_path)
{
  const string path = library_path.empty() ? default_library_path() : library_path;
  const auto library = detail::NativeLibrary::load(path);
  const detail::NativeApi & api = library->api();

  if (!api.list_hardware_devices || !api.free_hardware_devices) {
    throw EagleError(
      ErrorKind::RUNTIME,
      "Eagle's dynamic library at `" + path + "` does not support listing hardware devices");
  }

  char ** raw_devices = nullptr;
  int32_t count = 0;
  const int32_t status = api.list_hardware_devices(&raw_devices, &count);
  if (!detail::succeeded(status)) {
    detail::throw_native_error(api, status, "Failed to get available devices");
  }

  HardwareDeviceListGuard guard(api.free_hardware_devices, raw_devices, count);

  vector<string> devices;
  if (!raw_devices || count <= 0) {
    return devices;
  }
  devices.reserve(static_cast<size_t>(count));
  for (int32_t i = 0; i < count; ++i) {
    devices.emplace_back(raw_devices[i] ? raw_devices[i] : "");
  }
  return devices;
}

}  // namespace eagle_cpp
