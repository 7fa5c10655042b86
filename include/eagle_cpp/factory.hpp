#pragma once

#include <memory>
#include <string>
#include <vector>

#include "eagle_cpp/profile.hpp"
#include "eagle_cpp/profiler.hpp"
#include "eagle_cpp/recognizer.hpp"

namespace eagle_cpp
{

/// Empty paths are replaced with default_model_path() / default_library_path().
struct EngineOptions
{
  std::string model_path;
  std::string library_path;
  std::string device = "best";
};

/// EAGLE_LIBRARY_PATH, else the engine library bundled under the resource directory
/// for the current platform (lib/<platform>/<arch>/libpv_eagle.<so|dylib>).
std::string default_library_path();

/// EAGLE_MODEL_PATH, else <resource dir>/lib/common/eagle_params.pv.
std::string default_model_path();

/// Returns `configured` when non-empty, else PICOVOICE_ACCESS_KEY, else "".
std::string resolve_access_key(const std::string & configured = "");

std::unique_ptr<Profiler> create_profiler(
  const std::string & access_key,
  const EngineOptions & options = EngineOptions());

std::unique_ptr<Recognizer> create_recognizer(
  const std::string & access_key,
  const std::vector<Profile> & speaker_profiles,
  const EngineOptions & options = EngineOptions());

std::unique_ptr<Recognizer> create_recognizer(
  const std::string & access_key,
  const Profile & speaker_profile,
  const EngineOptions & options = EngineOptions());

/// Devices the engine can run on (e.g. "cpu", "gpu:0"). Throws EagleError(RUNTIME)
/// if the engine library does not provide device enumeration.
std::vector<std::string> list_hardware_devices(const std::string & library_path = "");

}  // namespace eagle_cpp
