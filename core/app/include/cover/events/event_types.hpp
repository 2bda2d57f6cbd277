#pragma once

#include <chrono>
#include <cstdint>

namespace cover {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock (or simulated) time at which an event was produced. Filled from
// the injected ITimeProvider, never read from the system clock directly.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// SequenceId
// -----------------------------------------------------------------------------
// Ledger-wide event sequence number, assigned by PolicyLifecycle at commit
// time. Strictly increasing across all events of one ledger instance, so an
// indexer can detect gaps and order events without relying on timestamps.
// -----------------------------------------------------------------------------
using SequenceId = std::uint64_t;

}  // namespace cover
