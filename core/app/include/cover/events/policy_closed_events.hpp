#pragma once

#include "cover/domain/policy.hpp"
#include "cover/events/event_types.hpp"

namespace cover {

// -----------------------------------------------------------------------------
// PolicyCancelledEvent
// -----------------------------------------------------------------------------
// Published after cancelPolicy() refunded the holder. refund is the amount
// actually transferred; premium - refund stayed in the pool as the fee.
// -----------------------------------------------------------------------------
struct PolicyCancelledEvent {
  domain::PolicyId policy_id{};
  domain::Amount refund{0};

  Timestamp timestamp{};
  SequenceId sequence_id{0};
};

// -----------------------------------------------------------------------------
// PolicyExpiredEvent
// -----------------------------------------------------------------------------
// Published after expirePolicy() closed a policy whose flight departed
// without a qualifying delay. No funds move.
// -----------------------------------------------------------------------------
struct PolicyExpiredEvent {
  domain::PolicyId policy_id{};

  Timestamp timestamp{};
  SequenceId sequence_id{0};
};

}  // namespace cover
