#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "eagle_cpp/errors.hpp"
#include "eagle_cpp/factory.hpp"
#include "eagle_cpp/profiler.hpp"

namespace eagle_cpp
{
namespace demo
{

/// 데모 출력용 피드백 설명 문구
const char * feedback_message(EnrollFeedback feedback);

/// 프로파일 파일 경로 → 라벨 (디렉터리와 확장자 제거)
std::string profile_label(const std::string & profile_path);

std::vector<Profile> load_profiles(
  const std::vector<std::string> & profile_paths,
  std::vector<std::string> & labels);

/// Score line: "`label`: 0.12, `label2`: 0.98"
std::string format_scores(const std::vector<float> & scores, const std::vector<std::string> & labels);

/// Prints the EagleError the way both demos report it. Returns the process exit code.
int report_error(const char * context, const EagleError & e);

/// stderr spdlog logger; debug level when `verbose`.
void init_logging(bool verbose);

/// SIGINT/SIGTERM → interrupted() 플래그
void install_interrupt_handler();
bool interrupted();

/// 마이크 등록 진행률 표시 스레드 (출력 전용)
class EnrollmentAnimation
{
public:
  explicit EnrollmentAnimation(int interval_ms = 100);
  ~EnrollmentAnimation();

  EnrollmentAnimation(const EnrollmentAnimation &) = delete;
  EnrollmentAnimation & operator=(const EnrollmentAnimation &) = delete;

  void start();
  void stop();
  void update(float percentage, const std::string & feedback);

private:
  void run_();
  std::string status_line_() const;

  int interval_ms_;
  std::atomic<bool> running_;
  std::thread thread_;
  mutable std::mutex mutex_;
  float percentage_;
  std::string feedback_;
};

}  // namespace demo
}  // namespace eagle_cpp
