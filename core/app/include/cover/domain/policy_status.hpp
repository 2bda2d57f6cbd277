#pragma once

namespace cover {
namespace domain {

// -----------------------------------------------------------------------------
// PolicyStatus - policy lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state a policy can occupy between creation and
//         settlement.
//
// @details
// The lifecycle is one-directional. PolicyLifecycle enforces the graph:
//
//   Active ──────> Claimed     (payout settled)
//     │
//     ├──────────> Cancelled   (holder/authority cancel before departure)
//     │
//     └──────────> Expired     (departed without a qualifying delay)
//
// Terminal states: Claimed, Cancelled, Expired. No transition leaves a
// terminal state and no operation may affect a policy once it is there.
//
// Thread model:
//   PolicyStatus is a plain enum, thread-safe to copy and compare.
// -----------------------------------------------------------------------------
enum class PolicyStatus {
  Active,     // Coverage in force, accepts flight status updates
  Claimed,    // Payout settled - terminal state
  Expired,    // Flight departed without a qualifying delay - terminal state
  Cancelled,  // Cancelled with partial refund - terminal state
};

// -----------------------------------------------------------------------------
// FlightStatus
// -----------------------------------------------------------------------------
// Responsibility: Last flight state reported by the authority (oracle).
// Delayed and Cancelled are the only states for which delay_minutes carries
// meaning.
// -----------------------------------------------------------------------------
enum class FlightStatus {
  OnTime,
  Delayed,
  Cancelled,
  Departed,
};

inline bool isTerminal(PolicyStatus status) {
  return status != PolicyStatus::Active;
}

inline const char* policyStatusToString(PolicyStatus s) {
  switch (s) {
    case PolicyStatus::Active:    return "Active";
    case PolicyStatus::Claimed:   return "Claimed";
    case PolicyStatus::Expired:   return "Expired";
    case PolicyStatus::Cancelled: return "Cancelled";
  }
  return "Unknown";
}

inline const char* flightStatusToString(FlightStatus s) {
  switch (s) {
    case FlightStatus::OnTime:    return "OnTime";
    case FlightStatus::Delayed:   return "Delayed";
    case FlightStatus::Cancelled: return "Cancelled";
    case FlightStatus::Departed:  return "Departed";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace cover
