#pragma once

#include "cover/domain/policy.hpp"
#include "cover/events/event_types.hpp"

#include <string>

namespace cover {

// -----------------------------------------------------------------------------
// PayoutTriggeredEvent
// -----------------------------------------------------------------------------
//
// @brief  Published exactly once per settled policy, after the funds transfer
//         to the holder succeeded.
//
// @details
// reason is "Flight Cancelled" when the policy's flight status is Cancelled
// at settlement time and "Flight Delayed" otherwise. amount is already capped
// at the policy's max_payout.
//
// A settlement that was rolled back (pool too small, transfer failure) never
// produces this event.
// -----------------------------------------------------------------------------
struct PayoutTriggeredEvent {
  domain::PolicyId policy_id{};
  domain::Amount amount{0};
  std::string reason;

  Timestamp timestamp{};
  SequenceId sequence_id{0};
};

}  // namespace cover
