/**
 * @file test_frame_queue.cpp
 * @brief Unit tests for the capture → processing FrameQueue.
 */

#include "eagle_cpp/frame_queue.hpp"

#include <chrono>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

using eagle_cpp::FrameQueue;

TEST(FrameQueueTest, PreservesOrder) {
  FrameQueue queue(4);
  queue.push({1});
  queue.push({2});

  FrameQueue::Frame frame;
  ASSERT_TRUE(queue.pop(frame));
  EXPECT_EQ(frame, FrameQueue::Frame{1});
  ASSERT_TRUE(queue.pop(frame));
  EXPECT_EQ(frame, FrameQueue::Frame{2});
}

TEST(FrameQueueTest, DropsOldestWhenFull) {
  FrameQueue queue(2);
  queue.push({1});
  queue.push({2});
  queue.push({3});
  EXPECT_EQ(queue.size(), 2u);
  EXPECT_EQ(queue.dropped(), 1u);

  FrameQueue::Frame frame;
  ASSERT_TRUE(queue.pop(frame));
  EXPECT_EQ(frame, FrameQueue::Frame{2});
}

TEST(FrameQueueTest, PopForTimesOut) {
  FrameQueue queue(2);
  FrameQueue::Frame frame;
  EXPECT_FALSE(queue.pop_for(frame, std::chrono::milliseconds(10)));
}

TEST(FrameQueueTest, CloseWakesBlockedConsumerAfterDraining) {
  FrameQueue queue(8);
  queue.push({42});

  std::vector<FrameQueue::Frame> received;
  std::thread consumer([&] {
    FrameQueue::Frame frame;
    while (queue.pop(frame)) {
      received.push_back(frame);
    }
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  queue.close();
  consumer.join();

  ASSERT_EQ(received.size(), 1u);
  EXPECT_EQ(received[0], FrameQueue::Frame{42});
  EXPECT_FALSE(queue.push({1}));
}

TEST(FrameQueueTest, ProducerAndConsumerThreads) {
  FrameQueue queue(1024);
  constexpr int kFrames = 500;

  std::thread producer([&] {
    for (int i = 0; i < kFrames; ++i) {
      queue.push({static_cast<int16_t>(i)});
    }
    queue.close();
  });

  int expected = 0;
  FrameQueue::Frame frame;
  while (queue.pop(frame)) {
    ASSERT_EQ(frame[0], expected);
    ++expected;
  }
  producer.join();
  EXPECT_EQ(expected, kFrames);
}
