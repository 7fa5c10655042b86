#include "eagle_cpp/speaker_id_node.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <functional>

#include "eagle_cpp/errors.hpp"
#include "eagle_cpp/profile.hpp"

using namespace std;


namespace eagle_cpp
{

namespace
{
constexpr size_t kFrameQueueCapacity = 64;
constexpr const char * kUnknownSpeaker = "unknown";
}  // namespace

/// 노드 초기화: 파라미터 로드 → 인식기 생성 → 퍼블리셔/서브스크라이버 생성 → 오디오 스트림 시작
SpeakerIdNode::SpeakerIdNode()
: Node("speaker_id_node"), frame_queue_(kFrameQueueCapacity), audio_device_index_(-1),
  score_threshold_(0.5), running_(true), reset_requested_(false)
{
  declare_and_get_parameters();
  initialize_recognizer();

  pub_scores_ = create_publisher<std_msgs::msg::Float32MultiArray>("/speaker_id/scores", 10);
  pub_speaker_ = create_publisher<std_msgs::msg::String>("/speaker_id/speaker", 10);
  sub_reset_ = create_subscription<std_msgs::msg::Empty>(
    "/speaker_id/reset", 10, bind(&SpeakerIdNode::on_reset, this, placeholders::_1));

  processing_thread_ = thread(&SpeakerIdNode::processing_loop, this);

  audio_input_.set_callback(
    bind(&SpeakerIdNode::on_audio_frame, this, placeholders::_1));
  start_audio_input_with_fallback();

  parameter_cb_handle_ = add_on_set_parameters_callback(
    bind(&SpeakerIdNode::on_set_parameters, this, placeholders::_1));

  RCLCPP_INFO(
    get_logger(), "speaker_id_node started: %zu speaker(s), eagle %s",
    speaker_labels_.size(), recognizer_->version().c_str());
}

SpeakerIdNode::~SpeakerIdNode()
{
  running_.store(false);
  audio_input_.stop();
  frame_queue_.close();
  if (processing_thread_.joinable()) {
    processing_thread_.join();
  }
  if (recognizer_) {
    recognizer_->release();
  }
}

void SpeakerIdNode::declare_and_get_parameters()
{
  declare_parameter<string>("access_key", "");
  declare_parameter<string>("library_path", "");
  declare_parameter<string>("model_path", "");
  declare_parameter<string>("device", "best");
  declare_parameter<vector<string>>("profile_paths", vector<string>{});
  declare_parameter<int>("audio_device_index", -1);
  declare_parameter<string>("audio_device_hint", "");
  declare_parameter<double>("score_threshold", 0.5);

  // 파라미터에 키가 없으면 환경변수에서 가져옴
  access_key_ = resolve_access_key(get_parameter("access_key").as_string());
  library_path_ = get_parameter("library_path").as_string();
  model_path_ = get_parameter("model_path").as_string();
  device_ = get_parameter("device").as_string();
  profile_paths_ = get_parameter("profile_paths").as_string_array();
  audio_device_index_ = static_cast<int>(get_parameter("audio_device_index").as_int());
  audio_device_hint_ = get_parameter("audio_device_hint").as_string();

  const double threshold = get_parameter("score_threshold").as_double();
  if (threshold < 0.0 || threshold > 1.0) {
    RCLCPP_WARN(get_logger(), "score_threshold %.2f out of [0, 1]. using 0.5", threshold);
  } else {
    score_threshold_.store(threshold);
  }
}

/// 프로파일 파일 로드 → Recognizer 생성 (실패 시 EagleError 전파)
void SpeakerIdNode::initialize_recognizer()
{
  vector<Profile> profiles;
  speaker_labels_.clear();
  for (const auto & path : profile_paths_) {
    profiles.push_back(load_profile(path));
    speaker_labels_.push_back(filesystem::path(path).stem().string());
    RCLCPP_INFO(get_logger(), "speaker profile loaded: %s", path.c_str());
  }

  EngineOptions options;
  options.library_path = library_path_;
  options.model_path = model_path_;
  options.device = device_;
  recognizer_ = create_recognizer(access_key_, profiles, options);
}

bool SpeakerIdNode::start_audio_input_with_fallback()
{
  audio_input_.set_preferred_device_keywords(
    audio_device_hint_.empty() ? vector<string>{} : vector<string>{audio_device_hint_});
  if (!audio_input_.configure(
      audio_device_index_, recognizer_->sample_rate(), recognizer_->frame_length()))
  {
    RCLCPP_ERROR(
      get_logger(), "invalid audio configuration: %s", audio_input_.last_error().c_str());
    return false;
  }
  if (audio_input_.start()) {
    RCLCPP_INFO(
      get_logger(), "audio input started: index=%d name=%s",
      audio_input_.selected_device_index(),
      audio_input_.selected_device_name().c_str());
    return true;
  }

  const string first_err = audio_input_.last_error();
  if (audio_device_index_ >= 0) {
    RCLCPP_WARN(
      get_logger(), "audio start failed(index=%d): %s. retrying with auto fallback",
      audio_device_index_, first_err.c_str());
    audio_input_.stop();
    if (audio_input_.configure(-1, recognizer_->sample_rate(), recognizer_->frame_length()) &&
      audio_input_.start())
    {
      RCLCPP_INFO(
        get_logger(), "audio input fallback started: index=%d name=%s",
        audio_input_.selected_device_index(),
        audio_input_.selected_device_name().c_str());
      return true;
    }
  }

  RCLCPP_ERROR(
    get_logger(), "failed to start audio input stream: %s",
    audio_input_.last_error().c_str());
  return false;
}

rcl_interfaces::msg::SetParametersResult SpeakerIdNode::on_set_parameters(
  const vector<rclcpp::Parameter> & parameters)
{
  auto result = rcl_interfaces::msg::SetParametersResult();
  result.successful = true;
  result.reason = "ok";

  int new_audio_device_index = audio_device_index_;
  string new_audio_hint = audio_device_hint_;
  double new_threshold = score_threshold_.load();
  bool audio_config_changed = false;

  for (const auto & p : parameters) {
    if (p.get_name() == "score_threshold" &&
      (p.get_type() == rclcpp::ParameterType::PARAMETER_DOUBLE ||
      p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER))
    {
      new_threshold = (p.get_type() == rclcpp::ParameterType::PARAMETER_DOUBLE) ?
        p.as_double() : static_cast<double>(p.as_int());
      if (new_threshold < 0.0 || new_threshold > 1.0) {
        result.successful = false;
        result.reason = "score_threshold must be within [0, 1]";
        return result;
      }
    } else if (p.get_name() == "audio_device_index" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_INTEGER)
    {
      new_audio_device_index = static_cast<int>(p.as_int());
      audio_config_changed = true;
    } else if (p.get_name() == "audio_device_hint" &&
      p.get_type() == rclcpp::ParameterType::PARAMETER_STRING)
    {
      new_audio_hint = p.as_string();
      audio_config_changed = true;
    } else if (p.get_name() == "access_key" || p.get_name() == "library_path" ||
      p.get_name() == "model_path" || p.get_name() == "device" ||
      p.get_name() == "profile_paths")
    {
      result.successful = false;
      result.reason = p.get_name() + " can only be set at startup";
      return result;
    }
  }

  score_threshold_.store(new_threshold);

  if (audio_config_changed) {
    audio_device_index_ = new_audio_device_index;
    audio_device_hint_ = new_audio_hint;
    audio_input_.stop();
    frame_queue_.clear();
    if (!start_audio_input_with_fallback()) {
      result.successful = false;
      result.reason = "failed_to_restart_audio_input";
      return result;
    }
  }

  return result;
}

/// PortAudio 콜백에서 호출됨 → 큐가 가득 차면 오래된 프레임 드롭
void SpeakerIdNode::on_audio_frame(const AudioInput::Frame & frame)
{
  if (!running_.load()) {
    return;
  }
  frame_queue_.push(frame);
}

/// 인식기는 처리 스레드에서만 사용하므로 플래그로 전달
void SpeakerIdNode::on_reset(const std_msgs::msg::Empty::SharedPtr /*msg*/)
{
  reset_requested_.store(true);
  RCLCPP_INFO(get_logger(), "speaker recognizer reset requested");
}

void SpeakerIdNode::processing_loop()
{
  AudioInput::Frame frame;
  while (running_.load()) {
    if (!frame_queue_.pop_for(frame, chrono::milliseconds(100))) {
      if (frame_queue_.closed()) {
        return;
      }
      continue;
    }

    try {
      if (reset_requested_.exchange(false)) {
        recognizer_->reset();
        last_speaker_.clear();
      }
      publish_scores(recognizer_->process(frame));
    } catch (const EagleError & e) {
      if (e.kind() == ErrorKind::ACTIVATION_LIMIT) {
        RCLCPP_ERROR(get_logger(), "AccessKey has reached its processing limit. stopping");
        running_.store(false);
        return;
      }
      RCLCPP_ERROR(get_logger(), "speaker recognition failed: %s", e.what());
      if (e.is_activation_error()) {
        running_.store(false);
        return;
      }
    }
  }
}

/// 점수 퍼블리시 + 임계값 이상인 최고 점수 화자가 바뀌었을 때만 화자 퍼블리시
void SpeakerIdNode::publish_scores(const vector<float> & scores)
{
  std_msgs::msg::Float32MultiArray scores_msg;
  scores_msg.data = scores;
  pub_scores_->publish(scores_msg);

  string speaker = kUnknownSpeaker;
  if (!scores.empty()) {
    const auto best = max_element(scores.begin(), scores.end());
    const size_t index = static_cast<size_t>(distance(scores.begin(), best));
    if (static_cast<double>(*best) >= score_threshold_.load() && index < speaker_labels_.size()) {
      speaker = speaker_labels_[index];
    }
  }

  if (speaker != last_speaker_) {
    last_speaker_ = speaker;
    std_msgs::msg::String speaker_msg;
    speaker_msg.data = speaker;
    pub_speaker_->publish(speaker_msg);
    RCLCPP_INFO(get_logger(), "speaker: %s", speaker.c_str());
  }
}

}  // namespace eagle_cpp

int main(int argc, char ** argv)
{
  rclcpp::init(argc, argv);
  int exit_code = 0;
  try {
    auto node = make_shared<eagle_cpp::SpeakerIdNode>();
    rclcpp::spin(node);
  } catch (const eagle_cpp::EagleError & e) {
    RCLCPP_FATAL(rclcpp::get_logger("speaker_id_node"), "failed to start: %s", e.what());
    exit_code = 1;
  }
  rclcpp::shutdown();
  return exit_code;
}
