#include "cover/network/json_codec.hpp"
#include "cover/time/time_utils.hpp"

#include <type_traits>

namespace cover {

namespace {

template <typename EventType>
nlohmann::json envelope(const char* type, const EventType& e) {
  nlohmann::json j;
  j["type"] = type;
  j["sequence_id"] = e.sequence_id;
  j["timestamp_ms"] = timestamp_to_ms(e.timestamp);
  j["policy_id"] = e.policy_id;
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// eventToJson(): one document per Event alternative
// -----------------------------------------------------------------------------
nlohmann::json eventToJson(const Event& event) {
  return std::visit(
      [](const auto& e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, PolicyCreatedEvent>) {
          auto j = envelope("policy_created", e);
          j["holder"] = e.holder;
          j["flight_number"] = e.flight_number;
          return j;
        } else if constexpr (std::is_same_v<T, FlightStatusUpdatedEvent>) {
          auto j = envelope("flight_status_updated", e);
          j["flight_status"] = domain::flightStatusToString(e.flight_status);
          j["delay_minutes"] = e.delay_minutes;
          return j;
        } else if constexpr (std::is_same_v<T, PayoutTriggeredEvent>) {
          auto j = envelope("payout_triggered", e);
          j["amount"] = e.amount;
          j["reason"] = e.reason;
          return j;
        } else if constexpr (std::is_same_v<T, PolicyCancelledEvent>) {
          auto j = envelope("policy_cancelled", e);
          j["refund"] = e.refund;
          return j;
        } else {
          static_assert(std::is_same_v<T, PolicyExpiredEvent>,
                        "unhandled Event alternative");
          return envelope("policy_expired", e);
        }
      },
      event);
}

// -----------------------------------------------------------------------------
// policyToJson()
// -----------------------------------------------------------------------------
nlohmann::json policyToJson(const domain::Policy& p) {
  nlohmann::json j;
  j["policy_id"] = p.id;
  j["holder"] = p.holder;
  j["flight_number"] = p.flight_number;
  j["scheduled_departure"] = p.scheduled_departure;
  j["premium"] = p.premium;
  j["max_payout"] = p.max_payout;
  j["created_at"] = p.created_at;
  j["status"] = domain::policyStatusToString(p.status);
  j["flight_status"] = domain::flightStatusToString(p.flight_status);
  j["actual_departure"] = p.actual_departure;
  j["delay_minutes"] = p.delay_minutes;
  j["payout_processed"] = p.payout_processed;
  return j;
}

nlohmann::json tiersToJson(const std::vector<domain::PayoutTier>& tiers) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& t : tiers) {
    arr.push_back({{"min_delay", t.min_delay},
                   {"max_delay", t.max_delay},
                   {"multiplier", t.multiplier}});
  }
  return arr;
}

nlohmann::json totalsToJson(const domain::LedgerTotals& totals) {
  return {{"premiums_collected", totals.premiums_collected},
          {"payouts_processed", totals.payouts_processed}};
}

}  // namespace cover
