#include "eagle_cpp/profiler.hpp"

#include <limits>

#include "eagle_cpp/errors.hpp"
#include "native_library.hpp"

using namespace std;


namespace eagle_cpp
{

struct Profiler::Impl
{
  shared_ptr<const detail::NativeLibrary> library;
  detail::NativeProfiler * handle{nullptr};
};

const char * to_string(EnrollFeedback feedback)
{
  switch (feedback) {
    case EnrollFeedback::AUDIO_OK:
      return "AUDIO_OK";
    case EnrollFeedback::AUDIO_TOO_SHORT:
      return "AUDIO_TOO_SHORT";
    case EnrollFeedback::UNKNOWN_SPEAKER:
      return "UNKNOWN_SPEAKER";
    case EnrollFeedback::NO_VOICE_FOUND:
      return "NO_VOICE_FOUND";
    case EnrollFeedback::QUALITY_ISSUE:
      return "QUALITY_ISSUE";
  }
  return "UNKNOWN";
}

/// 인자 검증 → 라이브러리 로드 → 네이티브 프로파일러 생성 → 고정 속성 조회/캐시
Profiler::Profiler(const ProfilerConfig & config)
: impl_(make_unique<Impl>()), sample_rate_(0), min_enroll_samples_(0), profile_size_(0),
  device_(config.device)
{
  detail::validate_engine_arguments(config.access_key, config.model_path, config.library_path);

  impl_->library = detail::NativeLibrary::load(config.library_path);
  const detail::NativeApi & api = impl_->library->api();

  int32_t status = api.profiler_init(
    config.access_key.c_str(),
    config.model_path.c_str(),
    config.device.c_str(),
    &impl_->handle);
  if (!detail::succeeded(status)) {
    impl_->handle = nullptr;
    detail::throw_native_error(api, status, "Profiler initialization failed");
  }

  // 초기화 이후 조회 실패 시: 에러 스택을 먼저 읽고 핸들을 해제한 뒤 throw
  const auto fail_after_init = [this, &api](int32_t failed_status, const char * message) {
      vector<string> stack;
      try {
        stack = detail::capture_error_stack(api);
      } catch (...) {
        release();
        throw;
      }
      release();
      throw EagleError(status_to_error_kind(failed_status), message, move(stack));
    };

  int32_t profile_size = 0;
  status = api.profiler_export_size(impl_->handle, &profile_size);
  if (!detail::succeeded(status)) {
    fail_after_init(status, "Failed to get profile size");
  }

  int32_t min_enroll_samples = 0;
  status = api.profiler_enroll_min_audio_length_samples(impl_->handle, &min_enroll_samples);
  if (!detail::succeeded(status)) {
    fail_after_init(status, "Failed to get min audio length sample");
  }

  profile_size_ = profile_size;
  min_enroll_samples_ = min_enroll_samples;
  sample_rate_ = api.sample_rate();
  const char * version = api.version();
  version_ = version ? version : "";
}

Profiler::~Profiler()
{
  release();
}

EnrollResult Profiler::enroll(const vector<int16_t> & pcm)
{
  return enroll(pcm.data(), pcm.size());
}

EnrollResult Profiler::enroll(const int16_t * pcm, size_t num_samples)
{
  ensure_live_("enroll");
  if (num_samples > static_cast<size_t>(numeric_limits<int32_t>::max())) {
    throw EagleError(ErrorKind::INVALID_ARGUMENT, "Enrollment audio is too long");
  }

  const detail::NativeApi & api = impl_->library->api();
  int feedback_code = 0;
  float percentage = 0.0F;
  const int32_t status = api.profiler_enroll(
    impl_->handle,
    pcm,
    static_cast<int32_t>(num_samples),
    &feedback_code,
    &percentage);
  if (!detail::succeeded(status)) {
    detail::throw_native_error(api, status, "Enrollment failed");
  }

  if (feedback_code < static_cast<int>(EnrollFeedback::AUDIO_OK) ||
    feedback_code > static_cast<int>(EnrollFeedback::QUALITY_ISSUE))
  {
    throw EagleError(
      ErrorKind::RUNTIME,
      "Unknown enrollment feedback code " + std::to_string(feedback_code));
  }

  EnrollResult result;
  result.percentage = percentage;
  result.feedback = static_cast<EnrollFeedback>(feedback_code);
  return result;
}

Profile Profiler::export_profile() const
{
  ensure_live_("export");

  const detail::NativeApi & api = impl_->library->api();
  vector<uint8_t> buffer(static_cast<size_t>(profile_size_), 0);
  const int32_t status = api.profiler_export(impl_->handle, buffer.data());
  if (!detail::succeeded(status)) {
    detail::throw_native_error(api, status, "Export failed");
  }
  return Profile::from_bytes(buffer);
}

void Profiler::reset()
{
  ensure_live_("reset");

  const detail::NativeApi & api = impl_->library->api();
  const int32_t status = api.profiler_reset(impl_->handle);
  if (!detail::succeeded(status)) {
    detail::throw_native_error(api, status, "Profile reset failed");
  }
}

void Profiler::release()
{
  if (impl_ && impl_->handle) {
    impl_->library->api().profiler_delete(impl_->handle);
    impl_->handle = nullptr;
  }
}

bool Profiler::released() const
{
  return !impl_->handle;
}

int Profiler::sample_rate() const
{
  return sample_rate_;
}

int Profiler::min_enroll_samples() const
{
  return min_enroll_samples_;
}

int Profiler::profile_size() const
{
  return profile_size_;
}

const string & Profiler::version() const
{
  return version_;
}

const string & Profiler::device() const
{
  return device_;
}

void Profiler::ensure_live_(const char * operation) const
{
  if (!impl_->handle) {
    throw EagleError(
      ErrorKind::INVALID_STATE,
      string("Cannot ") + operation + ": profiler has been released");
  }
}

}  // namespace eagle_cpp
