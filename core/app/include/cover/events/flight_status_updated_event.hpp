#pragma once

#include "cover/domain/policy.hpp"
#include "cover/domain/policy_status.hpp"
#include "cover/events/event_types.hpp"

#include <cstdint>

namespace cover {

// -----------------------------------------------------------------------------
// FlightStatusUpdatedEvent
// -----------------------------------------------------------------------------
//
// @brief  Published after the authority's flight status report has been
//         applied to a policy.
//
// @details
// delay_minutes is the policy's delay after the update (monotonic, so it may
// exceed the delay implied by this particular report). When the update
// crosses the payout threshold, a PayoutTriggeredEvent for the same policy
// follows this event with a higher sequence_id.
// -----------------------------------------------------------------------------
struct FlightStatusUpdatedEvent {
  domain::PolicyId policy_id{};
  domain::FlightStatus flight_status{domain::FlightStatus::OnTime};
  std::uint32_t delay_minutes{0};

  Timestamp timestamp{};
  SequenceId sequence_id{0};
};

}  // namespace cover
