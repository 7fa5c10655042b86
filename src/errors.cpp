#include "eagle_cpp/errors.hpp"

#include <sstream>
#include <utility>

#include "native_library.hpp"

using namespace std;
using eagle_cpp::detail::NativeStatus;


namespace eagle_cpp
{

ErrorKind status_to_error_kind(int32_t status)
{
  switch (static_cast<NativeStatus>(status)) {
    case NativeStatus::OUT_OF_MEMORY:
      return ErrorKind::MEMORY;
    case NativeStatus::IO_ERROR:
      return ErrorKind::IO;
    case NativeStatus::INVALID_ARGUMENT:
      return ErrorKind::INVALID_ARGUMENT;
    case NativeStatus::STOP_ITERATION:
      return ErrorKind::STOP_ITERATION;
    case NativeStatus::KEY_ERROR:
      return ErrorKind::KEY;
    case NativeStatus::INVALID_STATE:
      return ErrorKind::INVALID_STATE;
    case NativeStatus::RUNTIME_ERROR:
      return ErrorKind::RUNTIME;
    case NativeStatus::ACTIVATION_ERROR:
      return ErrorKind::ACTIVATION;
    case NativeStatus::ACTIVATION_LIMIT_REACHED:
      return ErrorKind::ACTIVATION_LIMIT;
    case NativeStatus::ACTIVATION_THROTTLED:
      return ErrorKind::ACTIVATION_THROTTLED;
    case NativeStatus::ACTIVATION_REFUSED:
      return ErrorKind::ACTIVATION_REFUSED;
    default:
      return ErrorKind::RUNTIME;
  }
}

const char * to_string(ErrorKind kind)
{
  switch (kind) {
    case ErrorKind::MEMORY:
      return "OUT_OF_MEMORY";
    case ErrorKind::IO:
      return "IO_ERROR";
    case ErrorKind::INVALID_ARGUMENT:
      return "INVALID_ARGUMENT";
    case ErrorKind::STOP_ITERATION:
      return "STOP_ITERATION";
    case ErrorKind::KEY:
      return "KEY_ERROR";
    case ErrorKind::INVALID_STATE:
      return "INVALID_STATE";
    case ErrorKind::RUNTIME:
      return "RUNTIME_ERROR";
    case ErrorKind::ACTIVATION:
      return "ACTIVATION_ERROR";
    case ErrorKind::ACTIVATION_LIMIT:
      return "ACTIVATION_LIMIT_REACHED";
    case ErrorKind::ACTIVATION_THROTTLED:
      return "ACTIVATION_THROTTLED";
    case ErrorKind::ACTIVATION_REFUSED:
      return "ACTIVATION_REFUSED";
  }
  return "RUNTIME_ERROR";
}

EagleError::EagleError(
  ErrorKind kind,
  const string & message,
  vector<string> message_stack)
: runtime_error(format(message, message_stack)),
  kind_(kind),
  message_(message),
  message_stack_(move(message_stack))
{
}

ErrorKind EagleError::kind() const
{
  return kind_;
}

const string & EagleError::message() const
{
  return message_;
}

const vector<string> & EagleError::message_stack() const
{
  return message_stack_;
}

bool EagleError::is_activation_error() const
{
  return kind_ == ErrorKind::ACTIVATION ||
    kind_ == ErrorKind::ACTIVATION_LIMIT ||
    kind_ == ErrorKind::ACTIVATION_THROTTLED ||
    kind_ == ErrorKind::ACTIVATION_REFUSED;
}

/// 요약 메시지 뒤에 "  [i] frame" 형식으로 진단 스택을 덧붙임
string EagleError::format(const string & message, const vector<string> & message_stack)
{
  if (message_stack.empty()) {
    return message;
  }

  ostringstream oss;
  oss << message << ":";
  for (size_t i = 0; i < message_stack.size(); ++i) {
    oss << "\n  [" << i << "] " << message_stack[i];
  }
  return oss.str();
}

}  // namespace eagle_cpp
