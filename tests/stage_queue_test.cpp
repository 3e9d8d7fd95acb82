#include "net_stage/stage_queue.hpp"
#include "net_stage/cancellation.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace net_stage {
namespace {

using namespace std::chrono_literals;

// **---- StageQueue ----**

TEST(StageQueueTest, PopsInFifoOrder) {
  StageQueue queue;
  queue.push("a");
  queue.push("b");
  queue.push("c");
  EXPECT_EQ(queue.size(), 3u);

  std::string key;
  ASSERT_TRUE(queue.pop_for(key, 10ms));
  EXPECT_EQ(key, "a");
  ASSERT_TRUE(queue.pop_for(key, 10ms));
  EXPECT_EQ(key, "b");
  ASSERT_TRUE(queue.pop_for(key, 10ms));
  EXPECT_EQ(key, "c");
  EXPECT_TRUE(queue.empty());
}

TEST(StageQueueTest, PopTimesOutWhenEmpty) {
  StageQueue queue;
  std::string key = "unchanged";
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(queue.pop_for(key, 30ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 25ms);
  EXPECT_EQ(key, "unchanged");
}

TEST(StageQueueTest, PushWakesWaitingConsumer) {
  StageQueue queue;
  std::thread producer([&queue] {
    std::this_thread::sleep_for(20ms);
    queue.push("late");
  });

  std::string key;
  EXPECT_TRUE(queue.pop_for(key, 2000ms));
  EXPECT_EQ(key, "late");
  producer.join();
}

TEST(StageQueueTest, ClearDropsEverything) {
  StageQueue queue;
  queue.push("a");
  queue.push("b");
  queue.clear();
  EXPECT_TRUE(queue.empty());
  std::string key;
  EXPECT_FALSE(queue.pop_for(key, 1ms));
}

TEST(StageQueueTest, ConcurrentProducersAndConsumersLoseNothing) {
  StageQueue queue;
  constexpr int kPerProducer = 500;
  std::atomic<int> consumed{0};
  std::mutex seen_mutex;
  std::set<std::string> seen;

  std::vector<std::thread> threads;
  for (int p = 0; p < 2; ++p) {
    threads.emplace_back([&queue, p] {
      for (int i = 0; i < kPerProducer; ++i)
        queue.push(std::to_string(p) + ":" + std::to_string(i));
    });
  }
  for (int c = 0; c < 2; ++c) {
    threads.emplace_back([&] {
      std::string key;
      while (consumed.load() < 2 * kPerProducer) {
        if (queue.pop_for(key, 5ms)) {
          std::lock_guard<std::mutex> lock(seen_mutex);
          seen.insert(key);
          consumed++;
        }
      }
    });
  }
  for (auto &t : threads)
    t.join();

  EXPECT_EQ(seen.size(), static_cast<size_t>(2 * kPerProducer));
}

// **---- CancellationToken ----**

TEST(CancellationTokenTest, RequestAndReset) {
  CancellationToken token;
  EXPECT_FALSE(token.requested());
  token.request();
  EXPECT_TRUE(token.requested());
  token.request();
  EXPECT_TRUE(token.requested());
  token.reset();
  EXPECT_FALSE(token.requested());
}

TEST(CancellationTokenTest, SleepRunsFullDurationWithoutRequest) {
  CancellationToken token;
  auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(token.sleep_for(60ms));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 55ms);
}

TEST(CancellationTokenTest, SleepWakesEarlyOnRequest) {
  CancellationToken token;
  std::thread canceller([&token] {
    std::this_thread::sleep_for(30ms);
    token.request();
  });

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(token.sleep_for(10s));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  canceller.join();
}

TEST(ShutdownListenerTest, StopWithoutStartIsHarmless) {
  CancellationToken token;
  ShutdownListener listener(token);
  EXPECT_FALSE(listener.active());
  listener.stop();
  EXPECT_FALSE(token.requested());
}

} // namespace
} // namespace net_stage
