#include "demo_common.hpp"

#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <memory>

using namespace std;


namespace eagle_cpp
{
namespace demo
{

namespace
{
volatile sig_atomic_t g_interrupted = 0;

void handle_interrupt(int /*signum*/)
{
  g_interrupted = 1;
}

const char * const kAnimationFrames[] = {" .  ", " .. ", " ...", "  ..", "   .", "    "};
}  // namespace

const char * feedback_message(EnrollFeedback feedback)
{
  switch (feedback) {
    case EnrollFeedback::AUDIO_OK:
      return "Good audio";
    case EnrollFeedback::AUDIO_TOO_SHORT:
      return "Insufficient audio length";
    case EnrollFeedback::UNKNOWN_SPEAKER:
      return "Different speaker in audio";
    case EnrollFeedback::NO_VOICE_FOUND:
      return "No voice found in audio";
    case EnrollFeedback::QUALITY_ISSUE:
      return "Low audio quality due to bad microphone or environment";
  }
  return "Unknown feedback";
}

string profile_label(const string & profile_path)
{
  return filesystem::path(profile_path).stem().string();
}

vector<Profile> load_profiles(const vector<string> & profile_paths, vector<string> & labels)
{
  vector<Profile> profiles;
  labels.clear();
  profiles.reserve(profile_paths.size());
  for (const auto & path : profile_paths) {
    profiles.push_back(load_profile(path));
    labels.push_back(profile_label(path));
    spdlog::debug("loaded speaker profile `{}` ({} bytes)", path, profiles.back().size());
  }
  return profiles;
}

string format_scores(const vector<float> & scores, const vector<string> & labels)
{
  string line;
  char buf[32];
  for (size_t i = 0; i < scores.size(); ++i) {
    if (i > 0) {
      line += ", ";
    }
    snprintf(buf, sizeof(buf), "%.2f", static_cast<double>(scores[i]));
    const string label = i < labels.size() ? labels[i] : "Speaker_" + std::to_string(i);
    line += "`" + label + "`: " + buf;
  }
  return line;
}

int report_error(const char * context, const EagleError & e)
{
  if (e.kind() == ErrorKind::ACTIVATION_LIMIT) {
    cout << "AccessKey has reached its processing limit" << endl;
  } else {
    cout << context << ": " << e.what() << endl;
  }
  spdlog::debug("{} ({})", context, to_string(e.kind()));
  return 1;
}

void init_logging(bool verbose)
{
  auto logger = spdlog::stderr_logger_mt("eagle_demo");
  logger->set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(move(logger));
}

void install_interrupt_handler()
{
  g_interrupted = 0;
  signal(SIGINT, handle_interrupt);
  signal(SIGTERM, handle_interrupt);
}

bool interrupted()
{
  return g_interrupted != 0;
}

EnrollmentAnimation::EnrollmentAnimation(int interval_ms)
: interval_ms_(interval_ms), running_(false), percentage_(0.0F)
{
}

EnrollmentAnimation::~EnrollmentAnimation()
{
  stop();
}

void EnrollmentAnimation::start()
{
  if (running_.exchange(true)) {
    return;
  }
  thread_ = thread(&EnrollmentAnimation::run_, this);
}

/// 스레드 종료 후 마지막 상태를 애니메이션 없이 한 번 더 출력
void EnrollmentAnimation::stop()
{
  if (!running_.exchange(false)) {
    return;
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  cout << "\033[2K\033[1G\r" << status_line_() << flush;
}

void EnrollmentAnimation::update(float percentage, const string & feedback)
{
  lock_guard<mutex> lock(mutex_);
  percentage_ = percentage;
  feedback_ = feedback;
}

string EnrollmentAnimation::status_line_() const
{
  lock_guard<mutex> lock(mutex_);
  char buf[16];
  snprintf(buf, sizeof(buf), "[%3d%%]", static_cast<int>(percentage_));
  return feedback_.empty() ? string(buf) : string(buf) + " - " + feedback_;
}

void EnrollmentAnimation::run_()
{
  while (running_) {
    for (const char * frame : kAnimationFrames) {
      if (!running_) {
        break;
      }
      cout << "\033[2K\033[1G\r" << status_line_() << frame << flush;
      this_thread::sleep_for(chrono::milliseconds(interval_ms_));
    }
  }
}

}  // namespace demo
}  // namespace eagle_cpp
