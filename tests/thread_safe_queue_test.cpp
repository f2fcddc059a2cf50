// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for tradecore::ThreadSafeQueue<T>.
//
// Validates:
//   - FIFO ordering, including for move-only payloads
//   - try_pop() on empty and non-empty queues
//   - pop_for() times out on an empty queue and wakes early on a push
//   - Blocking pop() waits for a producer
//   - Every item is delivered exactly once under concurrent producers and
//     consumers
//
// Threads spawned by a test are always joined before its assertions.
// =============================================================================

#include "tradecore/concurrent/thread_safe_queue.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  tradecore::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. A new queue is empty and try_pop() returns nothing.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, EmptyOnConstruction) {
  EXPECT_TRUE(queue.empty());
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 2. Items come back in the order they were pushed.
// Why: a strategy's intents and an order's exchange events must be handled
//      in arrival order.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FIFOOrder) {
  constexpr int kCount = 64;
  for (int i = 0; i < kCount; ++i) {
    queue.push(i);
  }
  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. try_pop() returns the front item without blocking.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopNonEmpty) {
  queue.push(99);
  queue.push(100);

  std::optional<int> first = queue.try_pop();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(*first, 99);
  EXPECT_FALSE(queue.empty());
}

// -----------------------------------------------------------------------------
// 4. Move-only payloads are supported.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueMoveOnlyTest, MoveOnlyPayload) {
  tradecore::ThreadSafeQueue<std::unique_ptr<std::string>> queue;
  queue.push(std::make_unique<std::string>("tc-1"));

  std::unique_ptr<std::string> value = queue.pop();
  ASSERT_NE(value, nullptr);
  EXPECT_EQ(*value, "tc-1");
}

// -----------------------------------------------------------------------------
// 5. pop_for() on an empty queue gives up after the timeout.
// Why: event loop workers rely on it to notice stop requests.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForTimesOutWhenEmpty) {
  auto started = std::chrono::steady_clock::now();
  std::optional<int> result = queue.pop_for(std::chrono::milliseconds(30));
  auto waited = std::chrono::steady_clock::now() - started;

  EXPECT_FALSE(result.has_value());
  EXPECT_GE(waited, std::chrono::milliseconds(25));
}

// -----------------------------------------------------------------------------
// 6. pop_for() returns as soon as a producer pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, PopForWakesOnPush) {
  std::thread producer([this] {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.push(7);
  });

  std::optional<int> result = queue.pop_for(std::chrono::seconds(2));
  producer.join();

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, 7);
}

// -----------------------------------------------------------------------------
// 7. Blocking pop() waits until another thread pushes.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, BlockingPopWaitsForPush) {
  std::atomic<int> received{-1};

  std::thread consumer([this, &received] { received.store(queue.pop()); });

  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_EQ(received.load(), -1);

  queue.push(77);
  consumer.join();

  EXPECT_EQ(received.load(), 77);
}

// -----------------------------------------------------------------------------
// 8. Concurrent producers and consumers: nothing lost, nothing duplicated.
// How: 4 producers push disjoint ranges; 4 consumers drain with pop_for()
//      until the shared count reaches the total.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentPushPop) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 4;
  constexpr int kItemsPerProducer = 1000;
  constexpr int kTotalItems = kProducers * kItemsPerProducer;

  std::vector<std::thread> producers;
  for (int p = 0; p < kProducers; ++p) {
    producers.emplace_back([this, p] {
      const int start = p * kItemsPerProducer;
      for (int i = start; i < start + kItemsPerProducer; ++i) {
        queue.push(i);
      }
    });
  }

  std::atomic<int> consumed{0};
  std::vector<std::vector<int>> per_consumer(kConsumers);
  std::vector<std::thread> consumers;
  for (int c = 0; c < kConsumers; ++c) {
    consumers.emplace_back([this, c, &consumed, &per_consumer] {
      while (consumed.load() < kTotalItems) {
        std::optional<int> item = queue.pop_for(std::chrono::milliseconds(5));
        if (item) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        }
      }
    });
  }

  for (auto& t : producers) t.join();
  for (auto& t : consumers) t.join();

  std::vector<int> all;
  for (const auto& v : per_consumer) {
    all.insert(all.end(), v.begin(), v.end());
  }
  std::sort(all.begin(), all.end());

  ASSERT_EQ(static_cast<int>(all.size()), kTotalItems);
  for (int i = 0; i < kTotalItems; ++i) {
    EXPECT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
