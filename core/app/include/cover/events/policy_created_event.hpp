#pragma once

#include "cover/domain/policy.hpp"
#include "cover/events/event_types.hpp"

#include <string>

namespace cover {

// -----------------------------------------------------------------------------
// PolicyCreatedEvent
// -----------------------------------------------------------------------------
//
// @brief  Published once per policy after createPolicy() has committed the
//         record, the indexes and the premium.
//
// @details
// Carries only the identifying fields. Indexers that need the full record
// query PolicyLifecycle::policy(policy_id).
// -----------------------------------------------------------------------------
struct PolicyCreatedEvent {
  domain::PolicyId policy_id{};
  domain::AccountId holder;
  std::string flight_number;

  Timestamp timestamp{};
  SequenceId sequence_id{0};
};

}  // namespace cover
