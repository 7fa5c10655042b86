// Deterministic stand-in for the Eagle engine library, used by the unit tests.
//
// Exports the same C function table as libpv_eagle. Behavior:
//   - speaker identity of a buffer is its first sample; a buffer is "voiced"
//     when its peak amplitude is at least kMinVoicedAmplitude
//   - enrollment reaches 100% after 2 * kMinEnrollSamples accepted samples
//   - recognizer score per speaker: s = 0.5 * s + 0.5 * match
//   - special access keys trigger activation failures and partial-init failures

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <string>
#include <vector>

#define MOCK_EAGLE_API extern "C" __attribute__((visibility("default")))

namespace
{

constexpr int32_t kStatusSuccess = 0;
constexpr int32_t kStatusOutOfMemory = 1;
constexpr int32_t kStatusIoError = 2;
constexpr int32_t kStatusInvalidArgument = 3;
constexpr int32_t kStatusInvalidState = 6;
constexpr int32_t kStatusRuntimeError = 7;
constexpr int32_t kStatusActivationError = 8;
constexpr int32_t kStatusActivationLimitReached = 9;
constexpr int32_t kStatusActivationThrottled = 10;
constexpr int32_t kStatusActivationRefused = 11;

constexpr int32_t kSampleRate = 16000;
constexpr int32_t kFrameLength = 512;
constexpr int32_t kMinEnrollSamples = 8000;
constexpr int32_t kProfileSize = 64;
constexpr int16_t kMinVoicedAmplitude = 64;
constexpr char kProfileMagic[4] = {'M', 'E', 'G', 'L'};

enum Feedback : int
{
  AUDIO_OK = 0,
  AUDIO_TOO_SHORT = 1,
  UNKNOWN_SPEAKER = 2,
  NO_VOICE_FOUND = 3,
  QUALITY_ISSUE = 4
};

struct EngineState
{
  std::mutex mutex;
  std::vector<std::string> error_stack;
  int outstanding_error_stacks = 0;
  int live_objects = 0;
  bool fail_next_error_stack = false;
  std::string sdk;
};

EngineState & state()
{
  static EngineState s;
  return s;
}

int32_t fail(int32_t status, std::vector<std::string> stack)
{
  std::lock_guard<std::mutex> lock(state().mutex);
  state().error_stack = std::move(stack);
  return status;
}

void object_created()
{
  std::lock_guard<std::mutex> lock(state().mutex);
  ++state().live_objects;
}

void object_deleted()
{
  std::lock_guard<std::mutex> lock(state().mutex);
  --state().live_objects;
}

bool is_number(const std::string & s)
{
  if (s.empty()) {
    return false;
  }
  for (char c : s) {
    if (c < '0' || c > '9') {
      return false;
    }
  }
  return true;
}

bool valid_device(const std::string & device)
{
  if (device == "best" || device == "cpu" || device == "gpu") {
    return true;
  }
  if (device.rfind("cpu:", 0) == 0 || device.rfind("gpu:", 0) == 0) {
    return is_number(device.substr(4));
  }
  return false;
}

/// Common checks of both initializers. Returns kStatusSuccess when the object may be created.
int32_t check_init_arguments(const char * access_key, const char * model_path, const char * device)
{
  if (!access_key || !model_path || !device) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }

  const std::string key = access_key;
  if (key == "invalid") {
    return fail(
      kStatusActivationError,
      {"AccessKey `invalid` is invalid", "Activation failed: key validation (code 101)"});
  }
  if (key == "limit") {
    return fail(kStatusActivationLimitReached, {"AccessKey has reached its usage limit"});
  }
  if (key == "throttled") {
    return fail(kStatusActivationThrottled, {"AccessKey has been throttled"});
  }
  if (key == "refused") {
    return fail(kStatusActivationRefused, {"AccessKey was refused"});
  }
  if (key == "stack_failure") {
    std::lock_guard<std::mutex> lock(state().mutex);
    state().fail_next_error_stack = true;
    return kStatusRuntimeError;
  }

  FILE * model = std::fopen(model_path, "rb");
  if (!model) {
    return fail(
      kStatusIoError,
      {std::string("Failed to open model file at `") + model_path + "`", "Loading parameters failed"});
  }
  std::fclose(model);

  if (!valid_device(device)) {
    return fail(
      kStatusInvalidArgument,
      {std::string("Device `") + device + "` is not a valid device selector"});
  }
  return kStatusSuccess;
}

int16_t peak_amplitude(const int16_t * pcm, int32_t num_samples)
{
  int32_t peak = 0;
  for (int32_t i = 0; i < num_samples; ++i) {
    const int32_t v = pcm[i] < 0 ? -static_cast<int32_t>(pcm[i]) : pcm[i];
    if (v > peak) {
      peak = v;
    }
  }
  return static_cast<int16_t>(peak > 32767 ? 32767 : peak);
}

}  // namespace

struct pv_eagle_profiler
{
  std::string access_key;
  bool has_speaker = false;
  int16_t speaker = 0;
  int64_t accepted_samples = 0;
  float percentage = 0.0F;
};

struct pv_eagle
{
  std::vector<int16_t> speakers;
  std::vector<float> scores;
};

MOCK_EAGLE_API void pv_set_sdk(const char * sdk)
{
  std::lock_guard<std::mutex> lock(state().mutex);
  state().sdk = sdk ? sdk : "";
}

MOCK_EAGLE_API int32_t pv_get_error_stack(char *** message_stack, int32_t * message_stack_depth)
{
  if (!message_stack || !message_stack_depth) {
    return kStatusInvalidArgument;
  }

  std::lock_guard<std::mutex> lock(state().mutex);
  if (state().fail_next_error_stack) {
    state().fail_next_error_stack = false;
    return kStatusOutOfMemory;
  }

  const std::vector<std::string> stack = std::move(state().error_stack);
  state().error_stack.clear();

  // NULL 종료 배열로 할당해 free 시 길이를 알 수 있게 함
  char ** out = static_cast<char **>(std::calloc(stack.size() + 1, sizeof(char *)));
  if (!out) {
    return kStatusOutOfMemory;
  }
  for (size_t i = 0; i < stack.size(); ++i) {
    out[i] = static_cast<char *>(std::malloc(stack[i].size() + 1));
    if (out[i]) {
      std::memcpy(out[i], stack[i].c_str(), stack[i].size() + 1);
    }
  }

  *message_stack = out;
  *message_stack_depth = static_cast<int32_t>(stack.size());
  ++state().outstanding_error_stacks;
  return kStatusSuccess;
}

MOCK_EAGLE_API void pv_free_error_stack(char ** message_stack)
{
  if (!message_stack) {
    return;
  }
  for (char ** it = message_stack; *it; ++it) {
    std::free(*it);
  }
  std::free(message_stack);

  std::lock_guard<std::mutex> lock(state().mutex);
  --state().outstanding_error_stacks;
}

MOCK_EAGLE_API int32_t pv_sample_rate()
{
  return kSampleRate;
}

MOCK_EAGLE_API int32_t pv_eagle_frame_length()
{
  return kFrameLength;
}

MOCK_EAGLE_API const char * pv_eagle_version()
{
  return "1.0.0-mock";
}

MOCK_EAGLE_API int32_t pv_eagle_list_hardware_devices(char *** hardware_devices, int32_t * num_devices)
{
  if (!hardware_devices || !num_devices) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }
  static const char * const kDevices[] = {"cpu", "gpu:0"};
  constexpr int32_t kNumDevices = 2;

  char ** out = static_cast<char **>(std::calloc(kNumDevices, sizeof(char *)));
  if (!out) {
    return fail(kStatusOutOfMemory, {"Failed to allocate device list"});
  }
  for (int32_t i = 0; i < kNumDevices; ++i) {
    const size_t len = std::strlen(kDevices[i]) + 1;
    out[i] = static_cast<char *>(std::malloc(len));
    if (out[i]) {
      std::memcpy(out[i], kDevices[i], len);
    }
  }
  *hardware_devices = out;
  *num_devices = kNumDevices;
  object_created();
  return kStatusSuccess;
}

MOCK_EAGLE_API void pv_eagle_free_hardware_devices(char ** hardware_devices, int32_t num_devices)
{
  if (!hardware_devices) {
    return;
  }
  for (int32_t i = 0; i < num_devices; ++i) {
    std::free(hardware_devices[i]);
  }
  std::free(hardware_devices);
  object_deleted();
}

// ---------------------------------------------------------------------------
// profiler

MOCK_EAGLE_API int32_t pv_eagle_profiler_init(
  const char * access_key,
  const char * model_path,
  const char * device,
  pv_eagle_profiler ** object)
{
  if (!object) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }
  const int32_t status = check_init_arguments(access_key, model_path, device);
  if (status != kStatusSuccess) {
    return status;
  }

  auto * profiler = new pv_eagle_profiler();
  profiler->access_key = access_key;
  *object = profiler;
  object_created();
  return kStatusSuccess;
}

MOCK_EAGLE_API void pv_eagle_profiler_delete(pv_eagle_profiler * object)
{
  if (!object) {
    return;
  }
  delete object;
  object_deleted();
}

MOCK_EAGLE_API int32_t pv_eagle_profiler_enroll(
  pv_eagle_profiler * object,
  const int16_t * pcm,
  int32_t num_samples,
  int * feedback,
  float * percentage)
{
  if (!object || !feedback || !percentage || num_samples < 0 || (!pcm && num_samples > 0)) {
    return fail(kStatusInvalidArgument, {"Invalid enrollment arguments"});
  }

  *percentage = object->percentage;
  if (num_samples < kMinEnrollSamples) {
    *feedback = AUDIO_TOO_SHORT;
    return kStatusSuccess;
  }

  const int16_t peak = peak_amplitude(pcm, num_samples);
  if (peak == 0) {
    *feedback = NO_VOICE_FOUND;
    return kStatusSuccess;
  }
  if (peak < kMinVoicedAmplitude) {
    *feedback = QUALITY_ISSUE;
    return kStatusSuccess;
  }
  if (object->has_speaker && pcm[0] != object->speaker) {
    *feedback = UNKNOWN_SPEAKER;
    return kStatusSuccess;
  }

  object->has_speaker = true;
  object->speaker = pcm[0];
  object->accepted_samples += num_samples;
  const double progress =
    100.0 * static_cast<double>(object->accepted_samples) / (2.0 * kMinEnrollSamples);
  object->percentage = static_cast<float>(progress > 100.0 ? 100.0 : progress);

  *feedback = AUDIO_OK;
  *percentage = object->percentage;
  return kStatusSuccess;
}

MOCK_EAGLE_API int32_t pv_eagle_profiler_enroll_min_audio_length_samples(
  const pv_eagle_profiler * object,
  int32_t * num_samples)
{
  if (!object || !num_samples) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }
  if (object->access_key == "fail_min_length") {
    return fail(kStatusRuntimeError, {"Min audio length query failed"});
  }
  *num_samples = kMinEnrollSamples;
  return kStatusSuccess;
}

MOCK_EAGLE_API int32_t pv_eagle_profiler_export_size(
  const pv_eagle_profiler * object,
  int32_t * speaker_profile_size_bytes)
{
  if (!object || !speaker_profile_size_bytes) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }
  if (object->access_key == "fail_export_size") {
    return fail(kStatusRuntimeError, {"Export size query failed", "Internal state corrupted"});
  }
  *speaker_profile_size_bytes = kProfileSize;
  return kStatusSuccess;
}

MOCK_EAGLE_API int32_t pv_eagle_profiler_export(
  const pv_eagle_profiler * object,
  void * speaker_profile)
{
  if (!object || !speaker_profile) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }
  if (object->percentage < 100.0F) {
    return fail(kStatusInvalidState, {"Enrollment is not complete"});
  }

  auto * out = static_cast<uint8_t *>(speaker_profile);
  std::memcpy(out, kProfileMagic, sizeof(kProfileMagic));
  const uint16_t speaker = static_cast<uint16_t>(object->speaker);
  out[4] = static_cast<uint8_t>(speaker & 0xFF);
  out[5] = static_cast<uint8_t>((speaker >> 8) & 0xFF);
  for (int32_t i = 6; i < kProfileSize; ++i) {
    out[i] = static_cast<uint8_t>((speaker + i) & 0xFF);
  }
  return kStatusSuccess;
}

MOCK_EAGLE_API int32_t pv_eagle_profiler_reset(pv_eagle_profiler * object)
{
  if (!object) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }
  object->has_speaker = false;
  object->speaker = 0;
  object->accepted_samples = 0;
  object->percentage = 0.0F;
  return kStatusSuccess;
}

// ---------------------------------------------------------------------------
// recognizer

MOCK_EAGLE_API int32_t pv_eagle_init(
  const char * access_key,
  const char * model_path,
  const char * device,
  int32_t num_speakers,
  const void * const * speaker_profiles,
  pv_eagle ** object)
{
  if (!object) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }
  const int32_t status = check_init_arguments(access_key, model_path, device);
  if (status != kStatusSuccess) {
    return status;
  }
  if (num_speakers <= 0 || !speaker_profiles) {
    return fail(kStatusInvalidArgument, {"At least one speaker profile is required"});
  }

  auto * eagle = new pv_eagle();
  for (int32_t i = 0; i < num_speakers; ++i) {
    const auto * profile = static_cast<const uint8_t *>(speaker_profiles[i]);
    if (!profile || std::memcmp(profile, kProfileMagic, sizeof(kProfileMagic)) != 0) {
      delete eagle;
      return fail(
        kStatusInvalidArgument,
        {"Speaker profile #" + std::to_string(i) + " is invalid"});
    }
    const uint16_t speaker = static_cast<uint16_t>(profile[4] | (profile[5] << 8));
    eagle->speakers.push_back(static_cast<int16_t>(speaker));
  }
  eagle->scores.assign(eagle->speakers.size(), 0.0F);

  *object = eagle;
  object_created();
  return kStatusSuccess;
}

MOCK_EAGLE_API void pv_eagle_delete(pv_eagle * object)
{
  if (!object) {
    return;
  }
  delete object;
  object_deleted();
}

MOCK_EAGLE_API int32_t pv_eagle_process(pv_eagle * object, const int16_t * pcm, float * scores)
{
  if (!object || !pcm || !scores) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }

  const bool voiced = peak_amplitude(pcm, kFrameLength) >= kMinVoicedAmplitude;
  for (size_t i = 0; i < object->speakers.size(); ++i) {
    const float match = (voiced && pcm[0] == object->speakers[i]) ? 1.0F : 0.0F;
    object->scores[i] = 0.5F * object->scores[i] + 0.5F * match;
    scores[i] = object->scores[i];
  }
  return kStatusSuccess;
}

MOCK_EAGLE_API int32_t pv_eagle_reset(pv_eagle * object)
{
  if (!object) {
    return fail(kStatusInvalidArgument, {"Argument must not be null"});
  }
  object->scores.assign(object->speakers.size(), 0.0F);
  return kStatusSuccess;
}

// ---------------------------------------------------------------------------
// test introspection

MOCK_EAGLE_API int mock_eagle_outstanding_error_stacks()
{
  std::lock_guard<std::mutex> lock(state().mutex);
  return state().outstanding_error_stacks;
}

MOCK_EAGLE_API int mock_eagle_live_objects()
{
  std::lock_guard<std::mutex> lock(state().mutex);
  return state().live_objects;
}

MOCK_EAGLE_API const char * mock_eagle_sdk()
{
  std::lock_guard<std::mutex> lock(state().mutex);
  return state().sdk.c_str();
}
