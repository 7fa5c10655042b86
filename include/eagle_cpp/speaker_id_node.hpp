#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "rclcpp/rclcpp.hpp"
#include "rcl_interfaces/msg/set_parameters_result.hpp"
#include "std_msgs/msg/empty.hpp"
#include "std_msgs/msg/float32_multi_array.hpp"
#include "std_msgs/msg/string.hpp"

#include "eagle_cpp/audio_input.hpp"
#include "eagle_cpp/factory.hpp"
#include "eagle_cpp/frame_queue.hpp"
#include "eagle_cpp/recognizer.hpp"

namespace eagle_cpp
{

/// 마이크 입력으로 등록된 화자들의 점수를 계산해 퍼블리시하는 노드
class SpeakerIdNode : public rclcpp::Node
{
public:
  /// Throws EagleError when the recognizer cannot be created.
  SpeakerIdNode();
  ~SpeakerIdNode() override;

private:
  void declare_and_get_parameters();
  void initialize_recognizer();
  bool start_audio_input_with_fallback();
  rcl_interfaces::msg::SetParametersResult on_set_parameters(
    const std::vector<rclcpp::Parameter> & parameters);
  void on_audio_frame(const AudioInput::Frame & frame);
  void on_reset(const std_msgs::msg::Empty::SharedPtr msg);
  void processing_loop();
  void publish_scores(const std::vector<float> & scores);

  rclcpp::Publisher<std_msgs::msg::Float32MultiArray>::SharedPtr pub_scores_;
  rclcpp::Publisher<std_msgs::msg::String>::SharedPtr pub_speaker_;
  rclcpp::Subscription<std_msgs::msg::Empty>::SharedPtr sub_reset_;

  AudioInput audio_input_;
  FrameQueue frame_queue_;
  std::unique_ptr<Recognizer> recognizer_;

  std::string access_key_;
  std::string library_path_;
  std::string model_path_;
  std::string device_;
  std::vector<std::string> profile_paths_;
  std::vector<std::string> speaker_labels_;
  int audio_device_index_;
  std::string audio_device_hint_;
  std::atomic<double> score_threshold_;

  std::string last_speaker_;
  std::thread processing_thread_;
  std::atomic<bool> running_;
  std::atomic<bool> reset_requested_;
  OnSetParametersCallbackHandle::SharedPtr parameter_cb_handle_;
};

}  // namespace eagle_cpp
