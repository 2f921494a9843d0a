#include <atomic>
#include <chrono>
#include <memory>
#include <gtest/gtest.h>
#include <thread>
#include <vector>

#include "common/utils/LockedQueue.h"

namespace ostmig::test {
namespace {

TEST(TestLockedQueue, Fifo) {
  LockedQueue<int> queue;
  ASSERT_TRUE(queue.empty());
  ASSERT_FALSE(queue.tryPop().has_value());

  for (int i = 0; i < 3; ++i) {
    queue.push(i);
  }
  ASSERT_EQ(queue.size(), 3u);
  for (int i = 0; i < 3; ++i) {
    auto v = queue.tryPop();
    ASSERT_TRUE(v.has_value());
    ASSERT_EQ(*v, i);
  }
  ASSERT_TRUE(queue.empty());
}

TEST(TestLockedQueue, PushRunsCallbackUnderLock) {
  LockedQueue<std::unique_ptr<int>> queue;
  bool marked = false;
  queue.push(std::make_unique<int>(7), [&] { marked = true; });
  ASSERT_TRUE(marked);
  auto item = queue.tryPop();
  ASSERT_TRUE(item.has_value());
  ASSERT_EQ(**item, 7);
}

TEST(TestLockedQueue, WaitingConsumerSeesSideEffect) {
  LockedQueue<int> queue;
  std::atomic<bool> marked = false;
  std::atomic<bool> markedWhenPopped = false;

  std::jthread consumer([&] {
    auto v = queue.popFor(std::chrono::seconds(10));
    markedWhenPopped = v.has_value() && marked;
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  queue.push(1, [&] {
    // the consumer is woken by the push but cannot take the lock yet
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    marked = true;
  });
  consumer.join();
  ASSERT_TRUE(markedWhenPopped);
  ASSERT_TRUE(queue.empty());
}

TEST(TestLockedQueue, PopForTimesOut) {
  LockedQueue<int> queue;
  auto begin = std::chrono::steady_clock::now();
  ASSERT_FALSE(queue.popFor(std::chrono::milliseconds(20)).has_value());
  ASSERT_GE(std::chrono::steady_clock::now() - begin, std::chrono::milliseconds(20));
}

TEST(TestLockedQueue, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kItems = 1000;
  LockedQueue<int> queue;
  std::atomic<int> consumed = 0;
  std::atomic<int64_t> sum = 0;

  std::vector<std::jthread> consumers;
  for (int i = 0; i < 2; ++i) {
    consumers.emplace_back([&] {
      while (consumed < kProducers * kItems) {
        if (auto v = queue.popFor(std::chrono::milliseconds(1))) {
          sum += *v;
          ++consumed;
        }
      }
    });
  }
  {
    std::vector<std::jthread> producers;
    for (int p = 0; p < kProducers; ++p) {
      producers.emplace_back([&] {
        for (int i = 1; i <= kItems; ++i) {
          queue.push(i);
        }
      });
    }
  }
  consumers.clear();
  ASSERT_EQ(consumed, kProducers * kItems);
  ASSERT_EQ(sum, int64_t(kProducers) * kItems * (kItems + 1) / 2);
  ASSERT_TRUE(queue.empty());
}

}  // namespace
}  // namespace ostmig::test
