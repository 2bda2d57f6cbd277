// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for cover::EventBus.
//
// Validates:
//   - Generic subscribers see every event kind
//   - Typed subscribers see only their kind
//   - Delivery order follows subscription order
//   - unsubscribe() stops delivery and tolerates unknown ids
//   - A callback may publish (re-entrancy) without deadlock
//   - Delivery from several publishing threads at once
// =============================================================================

#include "cover/eventbus/event_bus.hpp"
#include "cover/events/event.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  cover::EventBus bus;

  static cover::PolicyCreatedEvent makeCreated(cover::domain::PolicyId id,
                                               const std::string& holder) {
    cover::PolicyCreatedEvent e;
    e.policy_id = id;
    e.holder = holder;
    e.flight_number = "LH400";
    return e;
  }

  static cover::PayoutTriggeredEvent makePayout(cover::domain::PolicyId id,
                                                cover::domain::Amount amount) {
    cover::PayoutTriggeredEvent e;
    e.policy_id = id;
    e.amount = amount;
    e.reason = "Flight Delayed";
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber is invoked for every event kind.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const cover::Event&) { ++call_count; });

  bus.publish(makeCreated(1, "alice"));
  bus.publish(makePayout(1, 200));
  bus.publish(cover::PolicyExpiredEvent{2, {}, 3});
  bus.publish(cover::PolicyCancelledEvent{3, 90, {}, 4});

  EXPECT_EQ(call_count, 4);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber fires only for its registered kind.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersByKind) {
  int payouts = 0;
  bus.subscribe<cover::PayoutTriggeredEvent>(
      [&payouts](const cover::PayoutTriggeredEvent&) { ++payouts; });

  bus.publish(makeCreated(1, "alice"));
  bus.publish(makePayout(1, 200));
  bus.publish(cover::PolicyExpiredEvent{});

  EXPECT_EQ(payouts, 1);
}

// -----------------------------------------------------------------------------
// 3. Subscribers run in the order they subscribed.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, DeliveryFollowsSubscriptionOrder) {
  std::vector<int> order;
  bus.subscribe([&order](const cover::Event&) { order.push_back(1); });
  bus.subscribe([&order](const cover::Event&) { order.push_back(2); });
  bus.subscribe([&order](const cover::Event&) { order.push_back(3); });

  bus.publish(makeCreated(1, "alice"));

  EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

// -----------------------------------------------------------------------------
// 4. After unsubscribe(id) the callback no longer fires.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<cover::PolicyCreatedEvent>(
      [&call_count](const cover::PolicyCreatedEvent&) { ++call_count; });
  EXPECT_EQ(bus.subscriberCount(), 1u);

  bus.publish(makeCreated(1, "alice"));
  EXPECT_EQ(call_count, 1);

  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeCreated(2, "bob"));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 5. Unknown ids and empty buses are harmless.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeUnknownIdAndEmptyPublishAreNoOps) {
  EXPECT_NO_THROW(bus.unsubscribe(9999));
  EXPECT_NO_THROW(bus.publish(makeCreated(1, "alice")));
}

// -----------------------------------------------------------------------------
// 6. A callback that publishes does not deadlock.
// Scenario: an indexer reacts to PayoutTriggered by publishing PolicyExpired
//           for a sibling policy; a second subscriber sees it.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  int expired_seen = 0;
  bus.subscribe<cover::PolicyExpiredEvent>(
      [&expired_seen](const cover::PolicyExpiredEvent&) { ++expired_seen; });

  bus.subscribe<cover::PayoutTriggeredEvent>(
      [this](const cover::PayoutTriggeredEvent& e) {
        cover::PolicyExpiredEvent follow_up;
        follow_up.policy_id = e.policy_id + 1;
        bus.publish(follow_up);
      });

  bus.publish(makePayout(1, 200));

  EXPECT_EQ(expired_seen, 1);
}

// -----------------------------------------------------------------------------
// 7. Payload fields arrive intact through the variant dispatch.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesPayload) {
  cover::PolicyCreatedEvent received;
  bus.subscribe<cover::PolicyCreatedEvent>(
      [&received](const cover::PolicyCreatedEvent& e) { received = e; });

  bus.publish(makeCreated(42, "carol"));

  EXPECT_EQ(received.policy_id, 42u);
  EXPECT_EQ(received.holder, "carol");
  EXPECT_EQ(received.flight_number, "LH400");
}

// -----------------------------------------------------------------------------
// 8. Concurrent publishers: every event reaches the subscriber once.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, ConcurrentPublishersDeliverEverything) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 500;

  std::atomic<int> delivered{0};
  bus.subscribe([&delivered](const cover::Event&) { delivered.fetch_add(1); });

  std::vector<std::thread> publishers;
  for (int t = 0; t < kThreads; ++t) {
    publishers.emplace_back([this, t] {
      for (int i = 0; i < kPerThread; ++i) {
        bus.publish(makePayout(static_cast<cover::domain::PolicyId>(t), 1));
      }
    });
  }
  for (auto& t : publishers) t.join();

  EXPECT_EQ(delivered.load(), kThreads * kPerThread);
}
