#include "eagle_cpp/recognizer.hpp"

#include <limits>

#include "eagle_cpp/errors.hpp"
#include "native_library.hpp"

using namespace std;


namespace eagle_cpp
{

struct Recognizer::Impl
{
  shared_ptr<const detail::NativeLibrary> library;
  detail::NativeRecognizer * handle{nullptr};
  vector<float> scores;
};

Recognizer::Recognizer(const RecognizerConfig & config)
: impl_(make_unique<Impl>()), sample_rate_(0), frame_length_(0),
  num_speakers_(config.speaker_profiles.size()), device_(config.device)
{
  detail::validate_engine_arguments(config.access_key, config.model_path, config.library_path);
  if (config.speaker_profiles.empty()) {
    throw EagleError(
      ErrorKind::INVALID_ARGUMENT, "Eagle requires at least one speaker profile.");
  }
  if (config.speaker_profiles.size() > static_cast<size_t>(numeric_limits<int32_t>::max())) {
    throw EagleError(ErrorKind::INVALID_ARGUMENT, "Too many speaker profiles");
  }

  impl_->library = detail::NativeLibrary::load(config.library_path);
  const detail::NativeApi & api = impl_->library->api();

  // 엔진은 프로파일 포인터 배열만 받으므로 초기화 호출 동안만 유지
  vector<const void *> profile_ptrs;
  profile_ptrs.reserve(config.speaker_profiles.size());
  for (const auto & profile : config.speaker_profiles) {
    profile_ptrs.push_back(profile.data());
  }

  const int32_t status = api.recognizer_init(
    config.access_key.c_str(),
    config.model_path.c_str(),
    config.device.c_str(),
    static_cast<int32_t>(profile_ptrs.size()),
    profile_ptrs.data(),
    &impl_->handle);
  if (!detail::succeeded(status)) {
    impl_->handle = nullptr;
    detail::throw_native_error(api, status, "Initialization failed");
  }

  impl_->scores.assign(num_speakers_, 0.0F);
  sample_rate_ = api.sample_rate();
  frame_length_ = api.frame_length();
  const char * version = api.version();
  version_ = version ? version : "";
}

Recognizer::~Recognizer()
{
  release();
}

vector<float> Recognizer::process(const vector<int16_t> & pcm)
{
  return process(pcm.data(), pcm.size());
}

vector<float> Recognizer::process(const int16_t * pcm, size_t num_samples)
{
  ensure_live_("process");
  if (!pcm || num_samples != static_cast<size_t>(frame_length_)) {
    throw EagleError(
      ErrorKind::INVALID_ARGUMENT,
      "Length of input frame " + std::to_string(num_samples) +
      " does not match required frame length " + std::to_string(frame_length_));
  }

  const detail::NativeApi & api = impl_->library->api();
  const int32_t status = api.recognizer_process(impl_->handle, pcm, impl_->scores.data());
  if (!detail::succeeded(status)) {
    detail::throw_native_error(api, status, "Process failed");
  }
  return impl_->scores;
}

void Recognizer::reset()
{
  ensure_live_("reset");

  const detail::NativeApi & api = impl_->library->api();
  const int32_t status = api.recognizer_reset(impl_->handle);
  if (!detail::succeeded(status)) {
    detail::throw_native_error(api, status, "Reset failed");
  }
}

void Recognizer::release()
{
  if (impl_ && impl_->handle) {
    impl_->library->api().recognizer_delete(impl_->handle);
    impl_->handle = nullptr;
  }
}

bool Recognizer::released() const
{
  return !impl_->handle;
}

int Recognizer::sample_rate() const
{
  return sample_rate_;
}

int Recognizer::frame_length() const
{
  return frame_length_;
}

size_t Recognizer::num_speakers() const
{
  return num_speakers_;
}

const string & Recognizer::version() const
{
  return version_;
}

const string & Recognizer::device() const
{
  return device_;
}

void Recognizer::ensure_live_(const char * operation) const
{
  if (!impl_->handle) {
    throw EagleError(
      ErrorKind::INVALID_STATE,
      string("Cannot ") + operation + ": recognizer has been released");
  }
}

}  // namespace eagle_cpp
