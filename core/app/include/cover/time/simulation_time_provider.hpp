#pragma once

#include "cover/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace cover {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the owner last set.
//
// @details
// Tests pin the clock before creating policies and move it past the
// scheduled departure to exercise DepartureAlreadyPassed and expiry. Scenario
// replays advance it from recorded timestamps.
//
// std::atomic keeps reads lock-free while one thread advances the clock and
// several ledger callers read it. Monotonicity is not enforced: tests are
// free to move the clock backwards.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to new_time_ms.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward (or backward, for negative values) by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace cover
