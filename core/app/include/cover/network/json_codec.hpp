#pragma once

#include "cover/domain/ledger_totals.hpp"
#include "cover/domain/payout_tier.hpp"
#include "cover/domain/policy.hpp"
#include "cover/events/event.hpp"

#include <nlohmann/json.hpp>

#include <vector>

namespace cover {

// -----------------------------------------------------------------------------
// JSON codec for the IPC surface
// -----------------------------------------------------------------------------
//
// @brief  Turns ledger events and query results into the JSON documents that
//         IpcServer broadcasts and InsuranceEngine::executeCommand() returns.
//
// @details
// Every event document carries "type" (snake_case event name),
// "sequence_id" and "timestamp_ms", followed by the event's own fields.
// Enum values are rendered by name ("Delayed", "Claimed"). Amounts and ids
// are JSON unsigned integers.
//
// Pure functions, safe from any thread.
// -----------------------------------------------------------------------------
nlohmann::json eventToJson(const Event& event);

nlohmann::json policyToJson(const domain::Policy& policy);

nlohmann::json tiersToJson(const std::vector<domain::PayoutTier>& tiers);

nlohmann::json totalsToJson(const domain::LedgerTotals& totals);

}  // namespace cover
