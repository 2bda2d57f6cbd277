// =============================================================================
// thread_safe_queue_test.cpp
// =============================================================================
// Unit tests for cover::ThreadSafeQueue<T>, the hand-off between ledger
// threads and the IpcServer worker.
//
// Validates:
//   - FIFO order, including for Event variants carrying strings
//   - try_pop() never blocks
//   - pop() wakes on push from another thread
//   - Every item pushed by many producers is popped exactly once
// =============================================================================

#include "cover/concurrent/thread_safe_queue.hpp"
#include "cover/events/event.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

class ThreadSafeQueueTest : public ::testing::Test {
 protected:
  cover::ThreadSafeQueue<int> queue;
};

// -----------------------------------------------------------------------------
// 1. Fresh queue is empty; size tracks pushes and pops.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, SizeTracksPushAndPop) {
  EXPECT_TRUE(queue.empty());
  EXPECT_EQ(queue.size(), 0u);

  queue.push(1);
  queue.push(2);
  EXPECT_EQ(queue.size(), 2u);

  EXPECT_EQ(queue.pop(), 1);
  EXPECT_EQ(queue.size(), 1u);
  EXPECT_FALSE(queue.empty());
}

// -----------------------------------------------------------------------------
// 2. Items come out in the order they went in.
// Why: the IPC broadcast must not reorder ledger events.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, FifoOrder) {
  constexpr int kCount = 100;
  for (int i = 0; i < kCount; ++i) {
    queue.push(i);
  }
  for (int i = 0; i < kCount; ++i) {
    EXPECT_EQ(queue.pop(), i) << "FIFO violated at index " << i;
  }
  EXPECT_TRUE(queue.empty());
}

// -----------------------------------------------------------------------------
// 3. Event variants keep their alternative and payload through the queue.
// -----------------------------------------------------------------------------
TEST(ThreadSafeQueueEventTest, EventVariantsSurviveQueue) {
  cover::ThreadSafeQueue<cover::Event> events;

  cover::PolicyCreatedEvent created;
  created.policy_id = 7;
  created.holder = "alice";
  created.flight_number = "BA117";
  created.sequence_id = 1;

  cover::PayoutTriggeredEvent paid;
  paid.policy_id = 7;
  paid.amount = 400;
  paid.reason = "Flight Delayed";
  paid.sequence_id = 2;

  events.push(created);
  events.push(paid);

  auto first = events.try_pop();
  ASSERT_TRUE(first.has_value());
  const auto* c = std::get_if<cover::PolicyCreatedEvent>(&*first);
  ASSERT_NE(c, nullptr);
  EXPECT_EQ(c->holder, "alice");
  EXPECT_EQ(c->flight_number, "BA117");

  auto second = events.try_pop();
  ASSERT_TRUE(second.has_value());
  const auto* p = std::get_if<cover::PayoutTriggeredEvent>(&*second);
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->amount, 400u);
  EXPECT_EQ(p->reason, "Flight Delayed");

  EXPECT_FALSE(events.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 4. try_pop() on an empty queue returns nullopt at once.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, TryPopEmptyReturnsNullopt) {
  EXPECT_FALSE(queue.try_pop().has_value());
}

// -----------------------------------------------------------------------------
// 5. Blocking pop() waits for a producer on another thread.
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
// 6. Many producers, many consumers: nothing lost, nothing duplicated.
// -----------------------------------------------------------------------------
TEST_F(ThreadSafeQueueTest, ConcurrentProducersAndConsumers) {
  constexpr int kProducers = 4;
  constexpr int kConsumers = 3;
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
        if (auto item = queue.try_pop()) {
          per_consumer[c].push_back(*item);
          consumed.fetch_add(1);
        } else {
          std::this_thread::yield();
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
    ASSERT_EQ(all[i], i) << "Missing or duplicate item at index " << i;
  }
}
