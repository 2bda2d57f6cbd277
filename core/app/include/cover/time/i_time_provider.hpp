#pragma once

#include <cstdint>

namespace cover {

// -----------------------------------------------------------------------------
// ITimeProvider - abstract time source interface
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" away from std::chrono::system_clock.
//
// @details
// Two ledger rules are decided against the current time: createPolicy()
// requires a scheduled departure strictly in the future, and cancelPolicy()
// / expirePolicy() compare now against the scheduled departure. Tests must be
// able to pin and move that clock, so components receive a
// `const ITimeProvider&` instead of reading the system clock.
//
//   - LiveTimeProvider        delegates to std::chrono::system_clock.
//   - SimulationTimeProvider  returns a value set by the test or replay.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from multiple threads.
//
// Ownership:
//   Components hold a const reference; the provider must outlive them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time as milliseconds since the Unix epoch.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // Side-effects:  None.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace cover
