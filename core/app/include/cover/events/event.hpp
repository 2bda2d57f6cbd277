#pragma once

#include "cover/events/event_types.hpp"
#include "cover/events/flight_status_updated_event.hpp"
#include "cover/events/payout_triggered_event.hpp"
#include "cover/events/policy_closed_events.hpp"
#include "cover/events/policy_created_event.hpp"

#include <variant>

namespace cover {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for every domain event the ledger emits.
// One EventBus carries all kinds; subscribers pick the alternatives they care
// about with subscribe<T>() or std::visit. Adding a kind means adding it here
// and to every exhaustive visitor (IpcServer's formatter, the main logger).
// -----------------------------------------------------------------------------
using Event = std::variant<
    PolicyCreatedEvent,
    FlightStatusUpdatedEvent,
    PayoutTriggeredEvent,
    PolicyCancelledEvent,
    PolicyExpiredEvent>;

}  // namespace cover
