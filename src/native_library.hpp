#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace eagle_cpp
{
namespace detail
{

/// 엔진 라이브러리가 반환하는 상태 코드 (pv_status_t)
enum class NativeStatus : int32_t
{
  SUCCESS = 0,
  OUT_OF_MEMORY = 1,
  IO_ERROR = 2,
  INVALID_ARGUMENT = 3,
  STOP_ITERATION = 4,
  KEY_ERROR = 5,
  INVALID_STATE = 6,
  RUNTIME_ERROR = 7,
  ACTIVATION_ERROR = 8,
  ACTIVATION_LIMIT_REACHED = 9,
  ACTIVATION_THROTTLED = 10,
  ACTIVATION_REFUSED = 11
};

// Opaque session objects owned by the engine.
struct NativeProfiler;
struct NativeRecognizer;

/// Function table resolved from the engine library. Optional entries may be null.
struct NativeApi
{
  // optional
  void (*set_sdk)(const char *) = nullptr;
  int32_t (*list_hardware_devices)(char ***, int32_t *) = nullptr;
  void (*free_hardware_devices)(char **, int32_t) = nullptr;

  int32_t (*get_error_stack)(char ***, int32_t *) = nullptr;
  void (*free_error_stack)(char **) = nullptr;
  int32_t (*sample_rate)() = nullptr;
  int32_t (*frame_length)() = nullptr;
  const char * (*version)() = nullptr;

  int32_t (*profiler_init)(const char *, const char *, const char *, NativeProfiler **) = nullptr;
  void (*profiler_delete)(NativeProfiler *) = nullptr;
  int32_t (*profiler_enroll)(NativeProfiler *, const int16_t *, int32_t, int *, float *) = nullptr;
  int32_t (*profiler_enroll_min_audio_length_samples)(const NativeProfiler *, int32_t *) = nullptr;
  int32_t (*profiler_export_size)(const NativeProfiler *, int32_t *) = nullptr;
  int32_t (*profiler_export)(const NativeProfiler *, void *) = nullptr;
  int32_t (*profiler_reset)(NativeProfiler *) = nullptr;

  int32_t (*recognizer_init)(
    const char *, const char *, const char *, int32_t, const void * const *,
    NativeRecognizer **) = nullptr;
  void (*recognizer_delete)(NativeRecognizer *) = nullptr;
  int32_t (*recognizer_process)(NativeRecognizer *, const int16_t *, float *) = nullptr;
  int32_t (*recognizer_reset)(NativeRecognizer *) = nullptr;
};

class NativeLibrary
{
public:
  /// Opens the library at `path`, or returns the instance already opened for it.
  /// Throws EagleError(IO) if the file cannot be loaded and EagleError(RUNTIME)
  /// if a required symbol is missing.
  static std::shared_ptr<const NativeLibrary> load(const std::string & path);

  ~NativeLibrary();

  NativeLibrary(const NativeLibrary &) = delete;
  NativeLibrary & operator=(const NativeLibrary &) = delete;

  const NativeApi & api() const;
  const std::string & path() const;

private:
  NativeLibrary(void * handle, const std::string & path);
  void resolve_symbols_();
  void * symbol_(const char * name, bool required) const;

  void * handle_;
  std::string path_;
  NativeApi api_;
};

/// Local argument checks shared by both bindings; nothing is sent to the engine.
/// Throws EagleError(INVALID_ARGUMENT) for an empty key and EagleError(IO) for
/// a missing model or library file.
void validate_engine_arguments(
  const std::string & access_key,
  const std::string & model_path,
  const std::string & library_path);

/// Drains the engine's diagnostic stack. The native buffer is released even if
/// copying fails. Must be called before any other engine call after a failure.
std::vector<std::string> capture_error_stack(const NativeApi & api);

/// Throws EagleError for a failed engine call, attaching the diagnostic stack.
[[noreturn]] void throw_native_error(
  const NativeApi & api,
  int32_t status,
  const std::string & message);

inline bool succeeded(int32_t status)
{
  return status == static_cast<int32_t>(NativeStatus::SUCCESS);
}

}  // namespace detail
}  // namespace eagle_cpp
