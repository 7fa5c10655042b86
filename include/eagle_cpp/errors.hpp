#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace eagle_cpp
{

/// 네이티브 엔진 상태 코드와 1:1로 대응하는 에러 종류
enum class ErrorKind
{
  MEMORY,
  IO,
  INVALID_ARGUMENT,
  STOP_ITERATION,
  KEY,
  INVALID_STATE,
  RUNTIME,
  ACTIVATION,
  ACTIVATION_LIMIT,
  ACTIVATION_THROTTLED,
  ACTIVATION_REFUSED
};

/// Maps a non-success engine status code to its error kind.
/// Codes outside the published table map to RUNTIME.
ErrorKind status_to_error_kind(int32_t status);

const char * to_string(ErrorKind kind);

class EagleError : public std::runtime_error
{
public:
  EagleError(
    ErrorKind kind,
    const std::string & message,
    std::vector<std::string> message_stack = {});

  ErrorKind kind() const;
  const std::string & message() const;

  /// Diagnostic frames in the order the engine reported them.
  const std::vector<std::string> & message_stack() const;

  bool is_activation_error() const;

private:
  static std::string format(
    const std::string & message,
    const std::vector<std::string> & message_stack);

  ErrorKind kind_;
  std::string message_;
  std::vector<std::string> message_stack_;
};

}  // namespace eagle_cpp
