#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "eagle_cpp/profile.hpp"

namespace eagle_cpp
{

struct RecognizerConfig
{
  std::string access_key;
  std::string model_path;
  std::string library_path;
  std::string device = "best";
  // score order of process() follows this order
  std::vector<Profile> speaker_profiles;
};

/// Scores consecutive fixed-size frames against a fixed set of speaker profiles.
/// Same threading rules as Profiler: one caller at a time per instance.
class Recognizer
{
public:
  explicit Recognizer(const RecognizerConfig & config);
  ~Recognizer();

  Recognizer(const Recognizer &) = delete;
  Recognizer & operator=(const Recognizer &) = delete;

  /// Processes exactly frame_length() samples and returns one score in [0, 1]
  /// per speaker profile. A frame of any other length throws
  /// EagleError(INVALID_ARGUMENT) without reaching the engine.
  std::vector<float> process(const std::vector<int16_t> & pcm);
  std::vector<float> process(const int16_t * pcm, size_t num_samples);

  /// Clears temporal state. Call between unrelated audio streams.
  void reset();

  void release();
  bool released() const;

  int sample_rate() const;
  int frame_length() const;
  size_t num_speakers() const;
  const std::string & version() const;
  const std::string & device() const;

private:
  void ensure_live_(const char * operation) const;

  struct Impl;
  std::unique_ptr<Impl> impl_;
  int sample_rate_;
  int frame_length_;
  size_t num_speakers_;
  std::string version_;
  std::string device_;
};

}  // namespace eagle_cpp
