#include "ciflow/core/lockfree_queue.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "gtest/gtest.h"

using namespace ciflow;

TEST(BoundedMPSCQueueTest, PushPopSingle) {
  BoundedMPSCQueue<int> queue(64);

  EXPECT_TRUE(queue.push(42));
  auto value = queue.try_pop();
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, 42);
  EXPECT_TRUE(queue.empty());
}

TEST(BoundedMPSCQueueTest, EmptyQueueReturnsNothing) {
  BoundedMPSCQueue<int> queue(8);

  EXPECT_FALSE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.empty());
}

TEST(BoundedMPSCQueueTest, CapacityRoundsUpToPowerOfTwo) {
  BoundedMPSCQueue<int> queue(100);
  EXPECT_EQ(queue.capacity(), 128u);

  BoundedMPSCQueue<int> tiny(0);
  EXPECT_EQ(tiny.capacity(), 2u);
}

TEST(BoundedMPSCQueueTest, PreservesFifoOrder) {
  BoundedMPSCQueue<int> queue(128);

  for (int i = 0; i < 100; ++i) {
    EXPECT_TRUE(queue.push(i));
  }
  for (int i = 0; i < 100; ++i) {
    auto value = queue.try_pop();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, i);
  }
}

TEST(BoundedMPSCQueueTest, FullQueueRejectsAndKeepsValue) {
  BoundedMPSCQueue<std::string> queue(4);

  for (int i = 0; i < 4; ++i) {
    EXPECT_TRUE(queue.push(std::to_string(i)));
  }
  std::string extra = "overflow";
  EXPECT_FALSE(queue.try_push(extra));
  EXPECT_EQ(extra, "overflow");

  ASSERT_TRUE(queue.try_pop().has_value());
  EXPECT_TRUE(queue.try_push(extra));
}

TEST(BoundedMPSCQueueTest, HoldsMoveOnlyCallables) {
  BoundedMPSCQueue<std::move_only_function<int()>> queue(8);
  auto payload = std::make_unique<int>(7);

  EXPECT_TRUE(queue.push([p = std::move(payload)] { return *p * 6; }));
  auto fn = queue.try_pop();
  ASSERT_TRUE(fn.has_value());
  EXPECT_EQ((*fn)(), 42);
}

TEST(BoundedMPSCQueueTest, ConcurrentProducersDeliverEverything) {
  constexpr int kProducers = 4;
  constexpr int kItemsPerProducer = 10000;
  BoundedMPSCQueue<int> queue(1024);

  std::atomic<int> started{0};
  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([&] {
      started.fetch_add(1);
      for (int i = 1; i <= kItemsPerProducer; ++i) {
        while (!queue.push(i)) {
          std::this_thread::yield();
        }
      }
    });
  }

  long long sum = 0;
  int received = 0;
  while (received < kProducers * kItemsPerProducer) {
    if (auto v = queue.try_pop()) {
      sum += *v;
      ++received;
    } else {
      std::this_thread::yield();
    }
  }

  for (auto& t : producers) {
    t.join();
  }

  long long per_producer =
      static_cast<long long>(kItemsPerProducer) * (kItemsPerProducer + 1) / 2;
  EXPECT_EQ(sum, per_producer * kProducers);
  EXPECT_TRUE(queue.empty());
}

TEST(BoundedMPSCQueueTest, DrainRespectsLimitAndOrder) {
  BoundedMPSCQueue<int> queue(16);
  for (int i = 0; i < 10; ++i) {
    ASSERT_TRUE(queue.push(i));
  }

  std::vector<int> seen;
  EXPECT_EQ(queue.drain([&](int v) { seen.push_back(v); }, 4), 4u);
  EXPECT_EQ(seen, (std::vector<int>{0, 1, 2, 3}));

  EXPECT_EQ(queue.drain([&](int v) { seen.push_back(v); }), 6u);
  EXPECT_EQ(seen.size(), 10u);
  EXPECT_EQ(seen.back(), 9);
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.drain([&](int) { FAIL(); }), 0u);
}
