// =============================================================================
// policy_store_test.cpp
// =============================================================================
// Unit tests for cover::PolicyStore: id assignment, indexes, per-record
// mutation and snapshots.
// =============================================================================

#include "cover/ledger/errors.hpp"
#include "cover/ledger/policy_store.hpp"

#include <gtest/gtest.h>

#include <set>
#include <thread>
#include <vector>

using cover::PolicyStore;
using cover::domain::Policy;
using cover::domain::PolicyId;

namespace {

Policy draft(const std::string& holder, const std::string& flight) {
  Policy p;
  p.holder = holder;
  p.flight_number = flight;
  p.scheduled_departure = 10'000;
  p.premium = 100;
  p.max_payout = 500;
  return p;
}

}  // namespace

class PolicyStoreTest : public ::testing::Test {
 protected:
  PolicyStore store;
};

// -----------------------------------------------------------------------------
// 1. Ids start at 1 and increase; the stored record carries its id.
// -----------------------------------------------------------------------------
TEST_F(PolicyStoreTest, AssignsSequentialIdsFromOne) {
  const PolicyId a = store.insert(draft("alice", "BA117"));
  const PolicyId b = store.insert(draft("bob", "BA117"));

  EXPECT_EQ(a, 1u);
  EXPECT_EQ(b, 2u);
  EXPECT_EQ(store.size(), 2u);

  const auto stored = store.policy(b);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->id, b);
  EXPECT_EQ(stored->holder, "bob");
}

TEST_F(PolicyStoreTest, UnknownIdYieldsNullopt) {
  EXPECT_FALSE(store.policy(1).has_value());
  EXPECT_FALSE(store.policy(0).has_value());
}

// -----------------------------------------------------------------------------
// 2. Holder and flight indexes list ids in creation order.
// -----------------------------------------------------------------------------
TEST_F(PolicyStoreTest, IndexesByHolderAndFlight) {
  const PolicyId a = store.insert(draft("alice", "BA117"));
  const PolicyId b = store.insert(draft("bob", "BA117"));
  const PolicyId c = store.insert(draft("alice", "LH400"));

  EXPECT_EQ(store.policiesByHolder("alice"), (std::vector<PolicyId>{a, c}));
  EXPECT_EQ(store.policiesByHolder("bob"), (std::vector<PolicyId>{b}));
  EXPECT_EQ(store.policiesByFlight("BA117"), (std::vector<PolicyId>{a, b}));
  EXPECT_TRUE(store.policiesByFlight("AF001").empty());
  EXPECT_TRUE(store.policiesByHolder("nobody").empty());
}

// -----------------------------------------------------------------------------
// 3. withPolicy() mutates in place and forwards the callable's result.
// -----------------------------------------------------------------------------
TEST_F(PolicyStoreTest, WithPolicyMutatesRecord) {
  const PolicyId id = store.insert(draft("alice", "BA117"));

  const auto delay = store.withPolicy(id, [](Policy& p) {
    p.delay_minutes = 150;
    return p.delay_minutes;
  });

  EXPECT_EQ(delay, 150u);
  EXPECT_EQ(store.policy(id)->delay_minutes, 150u);
}

TEST_F(PolicyStoreTest, WithPolicyUnknownIdThrowsPolicyNotFound) {
  try {
    store.withPolicy(42, [](Policy&) {});
    FAIL() << "expected StateError";
  } catch (const cover::StateError& e) {
    EXPECT_EQ(e.code(), cover::ErrorCode::PolicyNotFound);
  }
}

// -----------------------------------------------------------------------------
// 4. Snapshots are copies sorted by id.
// -----------------------------------------------------------------------------
TEST_F(PolicyStoreTest, SnapshotIsSortedCopy) {
  for (int i = 0; i < 5; ++i) {
    store.insert(draft("alice", "BA117"));
  }

  auto all = store.snapshot();
  ASSERT_EQ(all.size(), 5u);
  for (std::size_t i = 0; i < all.size(); ++i) {
    EXPECT_EQ(all[i].id, i + 1);
  }

  all[0].premium = 1;
  EXPECT_EQ(store.policy(1)->premium, 100u);
}

// -----------------------------------------------------------------------------
// 5. Concurrent inserts produce unique ids and complete indexes.
// -----------------------------------------------------------------------------
TEST_F(PolicyStoreTest, ConcurrentInsertsAreUnique) {
  constexpr int kThreads = 4;
  constexpr int kPerThread = 250;

  std::vector<std::vector<PolicyId>> ids(kThreads);
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this, t, &ids] {
      for (int i = 0; i < kPerThread; ++i) {
        ids[t].push_back(store.insert(draft("h" + std::to_string(t), "XX1")));
      }
    });
  }
  for (auto& t : threads) t.join();

  std::set<PolicyId> unique;
  for (const auto& v : ids) unique.insert(v.begin(), v.end());
  EXPECT_EQ(unique.size(), static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_EQ(store.policiesByFlight("XX1").size(), unique.size());

  // Each thread saw its own ids in increasing order.
  for (int t = 0; t < kThreads; ++t) {
    EXPECT_EQ(store.policiesByHolder("h" + std::to_string(t)), ids[t]);
  }
}
