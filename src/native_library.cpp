#include "native_library.hpp"

#include <dlfcn.h>

#include <filesystem>
#include <mutex>
#include <system_error>
#include <unordered_map>

#include "eagle_cpp/errors.hpp"

using namespace std;


namespace eagle_cpp
{
namespace detail
{

namespace
{
constexpr const char * kSdkName = "cpp";

mutex & library_cache_mutex()
{
  static mutex m;
  return m;
}

unordered_map<string, shared_ptr<const NativeLibrary>> & library_cache()
{
  static unordered_map<string, shared_ptr<const NativeLibrary>> cache;
  return cache;
}

/// pv_free_error_stack 을 스코프 종료 시 반드시 호출하기 위한 가드
class ErrorStackGuard
{
public:
  ErrorStackGuard(void (*free_fn)(char **), char ** stack)
  : free_fn_(free_fn), stack_(stack)
  {
  }

  ~ErrorStackGuard()
  {
    if (free_fn_ && stack_) {
      free_fn_(stack_);
    }
  }

  ErrorStackGuard(const ErrorStackGuard &) = delete;
  ErrorStackGuard & operator=(const ErrorStackGuard &) = delete;

private:
  void (*free_fn_)(char **);
  char ** stack_;
};
}  // namespace

shared_ptr<const NativeLibrary> NativeLibrary::load(const string & path)
{
  lock_guard<mutex> lock(library_cache_mutex());

  auto & cache = library_cache();
  const auto it = cache.find(path);
  if (it != cache.end()) {
    return it->second;
  }

  void * handle = dlopen(path.c_str(), RTLD_NOW | RTLD_LOCAL);
  if (!handle) {
    const char * reason = dlerror();
    throw EagleError(
      ErrorKind::IO,
      "Failed to load Eagle's dynamic library at `" + path + "`: " +
      (reason ? reason : "unknown error"));
  }

  // 생성자가 private 이므로 make_shared 대신 직접 생성
  shared_ptr<NativeLibrary> library(new NativeLibrary(handle, path));
  library->resolve_symbols_();
  if (library->api_.set_sdk) {
    library->api_.set_sdk(kSdkName);
  }

  cache.emplace(path, library);
  return library;
}

NativeLibrary::NativeLibrary(void * handle, const string & path)
: handle_(handle), path_(path)
{
}

NativeLibrary::~NativeLibrary()
{
  if (handle_) {
    dlclose(handle_);
    handle_ = nullptr;
  }
}

const NativeApi & NativeLibrary::api() const
{
  return api_;
}

const string & NativeLibrary::path() const
{
  return path_;
}

void * NativeLibrary::symbol_(const char * name, bool required) const
{
  dlerror();
  void * sym = dlsym(handle_, name);
  if (!sym && required) {
    throw EagleError(
      ErrorKind::RUNTIME,
      "Failed to load symbol `" + string(name) + "` from `" + path_ + "`");
  }
  return sym;
}

void NativeLibrary::resolve_symbols_()
{
  // dlsym 결과(void*)를 함수 포인터 타입으로 변환
  const auto bind = [this](auto & fn, const char * name, bool required) {
      fn = reinterpret_cast<typename remove_reference<decltype(fn)>::type>(
        symbol_(name, required));
    };

  bind(api_.set_sdk, "pv_set_sdk", false);
  bind(api_.list_hardware_devices, "pv_eagle_list_hardware_devices", false);
  bind(api_.free_hardware_devices, "pv_eagle_free_hardware_devices", false);

  bind(api_.get_error_stack, "pv_get_error_stack", true);
  bind(api_.free_error_stack, "pv_free_error_stack", true);
  bind(api_.sample_rate, "pv_sample_rate", true);
  bind(api_.frame_length, "pv_eagle_frame_length", true);
  bind(api_.version, "pv_eagle_version", true);

  bind(api_.profiler_init, "pv_eagle_profiler_init", true);
  bind(api_.profiler_delete, "pv_eagle_profiler_delete", true);
  bind(api_.profiler_enroll, "pv_eagle_profiler_enroll", true);
  bind(
    api_.profiler_enroll_min_audio_length_samples,
    "pv_eagle_profiler_enroll_min_audio_length_samples", true);
  bind(api_.profiler_export_size, "pv_eagle_profiler_export_size", true);
  bind(api_.profiler_export, "pv_eagle_profiler_export", true);
  bind(api_.profiler_reset, "pv_eagle_profiler_reset", true);

  bind(api_.recognizer_init, "pv_eagle_init", true);
  bind(api_.recognizer_delete, "pv_eagle_delete", true);
  bind(api_.recognizer_process, "pv_eagle_process", true);
  bind(api_.recognizer_reset, "pv_eagle_reset", true);
}

void validate_engine_arguments(
  const string & access_key,
  const string & model_path,
  const string & library_path)
{
  if (access_key.empty()) {
    throw EagleError(ErrorKind::INVALID_ARGUMENT, "`access_key` should be a non-empty string.");
  }
  error_code ec;
  if (model_path.empty() || !filesystem::is_regular_file(model_path, ec)) {
    throw EagleError(ErrorKind::IO, "Could not find model file at `" + model_path + "`.");
  }
  if (library_path.empty() || !filesystem::is_regular_file(library_path, ec)) {
    throw EagleError(
      ErrorKind::IO, "Could not find Eagle's dynamic library at `" + library_path + "`.");
  }
}

vector<string> capture_error_stack(const NativeApi & api)
{
  char ** raw_stack = nullptr;
  int32_t depth = 0;
  const int32_t status = api.get_error_stack(&raw_stack, &depth);
  if (!succeeded(status)) {
    throw EagleError(status_to_error_kind(status), "Unable to get Eagle error state");
  }

  ErrorStackGuard guard(api.free_error_stack, raw_stack);

  vector<string> stack;
  if (!raw_stack || depth <= 0) {
    return stack;
  }
  stack.reserve(static_cast<size_t>(depth));
  for (int32_t i = 0; i < depth; ++i) {
    stack.emplace_back(raw_stack[i] ? raw_stack[i] : "");
  }
  return stack;
}

void throw_native_error(const NativeApi & api, int32_t status, const string & message)
{
  vector<string> stack = capture_error_stack(api);
  throw EagleError(status_to_error_kind(status), message, move(stack));
}

}  // namespace detail
}  // namespace eagle_cpp
