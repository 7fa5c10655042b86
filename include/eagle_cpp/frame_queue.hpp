#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>
#include <vector>

namespace eagle_cpp
{

/// PortAudio 콜백 스레드 → 처리 스레드 간 프레임 전달용 큐.
/// 가득 차면 가장 오래된 프레임을 버린다.
class FrameQueue
{
public:
  using Frame = std::vector<int16_t>;

  explicit FrameQueue(size_t capacity)
  : capacity_(capacity == 0 ? 1 : capacity), dropped_(0), closed_(false)
  {
  }

  /// Returns false once the queue has been closed.
  bool push(const Frame & frame)
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (closed_) {
        return false;
      }
      if (frames_.size() >= capacity_) {
        frames_.pop_front();
        ++dropped_;
      }
      frames_.push_back(frame);
    }
    cv_.notify_one();
    return true;
  }

  /// Blocks until a frame is available. Returns false when closed and drained.
  bool pop(Frame & frame)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() {return closed_ || !frames_.empty();});
    if (frames_.empty()) {
      return false;
    }
    frame = std::move(frames_.front());
    frames_.pop_front();
    return true;
  }

  /// Waits at most `timeout`. Returns false on timeout or when closed and drained.
  bool pop_for(Frame & frame, std::chrono::milliseconds timeout)
  {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [this]() {return closed_ || !frames_.empty();})) {
      return false;
    }
    if (frames_.empty()) {
      return false;
    }
    frame = std::move(frames_.front());
    frames_.pop_front();
    return true;
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  void clear()
  {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
  }

  size_t size() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
  }

  size_t dropped() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
  }

  bool closed() const
  {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
  }

private:
  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Frame> frames_;
  size_t dropped_;
  bool closed_;
};

}  // namespace eagle_cpp
