#pragma once

#include "cover/domain/policy_status.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace cover {
namespace domain {

// -----------------------------------------------------------------------------
// PolicyId / AccountId / Amount
// -----------------------------------------------------------------------------
// Responsibility: Value aliases used across the ledger.
//   PolicyId  - assigned at creation by PolicyIdGenerator, starts at 1 and is
//               never reused (0 is the "unset" sentinel).
//   AccountId - opaque identity of a paying party or of the authority. The
//               ledger compares identities; it never authenticates them.
//   Amount    - money in the smallest currency unit. Unsigned: balances and
//               totals can never go negative.
// -----------------------------------------------------------------------------
using PolicyId = std::uint64_t;
using AccountId = std::string;
using Amount = std::uint64_t;

// Epoch seconds. 0 means "unset" for actual_departure.
using EpochSeconds = std::int64_t;

// Sentinel delay for a cancelled flight without a usable departure time. It
// lies beyond every bounded tier so the lookup falls through to the last
// (worst-case) tier.
inline constexpr std::uint32_t kMaxDelayMinutes =
    std::numeric_limits<std::uint32_t>::max();

// -----------------------------------------------------------------------------
// Policy
// -----------------------------------------------------------------------------
//
// @brief  A single flight-delay coverage contract: who paid, for which flight,
//         how much, and where it currently stands in its lifecycle.
//
// @details
// The first block of fields is the contract itself and is immutable after
// creation (holder, flight_number, scheduled_departure, premium, max_payout).
// max_payout >= 2 * premium holds for every stored policy.
//
// The second block is lifecycle state mutated by PolicyLifecycle through
// PolicyStore::withPolicy() only:
//   - status moves Active -> {Claimed, Cancelled, Expired} and never back.
//   - delay_minutes never decreases while the policy is Active.
//   - payout_processed goes false -> true at most once, and when true the
//     status is Claimed.
//
// Copies handed out by PolicyStore::policy() and carried by events are
// snapshots. Mutating a snapshot has no effect on the ledger.
// -----------------------------------------------------------------------------
struct Policy {
  PolicyId id{};
  AccountId holder;
  std::string flight_number;
  EpochSeconds scheduled_departure{0};
  Amount premium{0};
  Amount max_payout{0};
  EpochSeconds created_at{0};

  PolicyStatus status{PolicyStatus::Active};
  FlightStatus flight_status{FlightStatus::OnTime};
  EpochSeconds actual_departure{0};
  std::uint32_t delay_minutes{0};
  bool payout_processed{false};
};

}  // namespace domain
}  // namespace cover
