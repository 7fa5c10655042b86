#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "eagle_cpp/profile.hpp"

namespace eagle_cpp
{

/// Classification of the most recent enrollment attempt.
enum class EnrollFeedback
{
  AUDIO_OK = 0,
  AUDIO_TOO_SHORT,
  UNKNOWN_SPEAKER,
  NO_VOICE_FOUND,
  QUALITY_ISSUE
};

const char * to_string(EnrollFeedback feedback);

struct EnrollResult
{
  float percentage = 0.0F;
  EnrollFeedback feedback = EnrollFeedback::AUDIO_OK;
};

struct ProfilerConfig
{
  std::string access_key;
  std::string model_path;
  std::string library_path;
  // "best", "gpu", "gpu:<index>", "cpu", "cpu:<threads>" (passed to the engine as is)
  std::string device = "best";
};

/// Enrollment session for one speaker.
///
/// Every call goes straight into the engine and is not synchronized; a single
/// instance must not be used from two threads at once. Distinct instances are
/// independent.
class Profiler
{
public:
  /// Throws EagleError on invalid arguments, missing files, or engine failure.
  explicit Profiler(const ProfilerConfig & config);
  ~Profiler();

  Profiler(const Profiler &) = delete;
  Profiler & operator=(const Profiler &) = delete;

  /// Feeds one utterance of arbitrary length. Call repeatedly with audio of the
  /// same speaker until the returned percentage reaches 100. Audio shorter than
  /// min_enroll_samples() is reported as AUDIO_TOO_SHORT by the engine.
  EnrollResult enroll(const std::vector<int16_t> & pcm);
  EnrollResult enroll(const int16_t * pcm, size_t num_samples);

  /// Exports the profile accumulated so far. Whether it is usable below 100%
  /// is up to the engine; callers should check the enrollment percentage.
  Profile export_profile() const;

  /// Drops all enrollment data. Required before enrolling another speaker.
  void reset();

  /// Frees the engine session. Safe to call more than once; any other call
  /// afterwards throws EagleError(INVALID_STATE).
  void release();
  bool released() const;

  int sample_rate() const;
  int min_enroll_samples() const;
  int profile_size() const;
  const std::string & version() const;
  const std::string & device() const;

private:
  void ensure_live_(const char * operation) const;

  struct Impl;
  std::unique_ptr<Impl> impl_;
  int sample_rate_;
  int min_enroll_samples_;
  int profile_size_;
  std::string version_;
  std::string device_;
};

}  // namespace eagle_cpp
