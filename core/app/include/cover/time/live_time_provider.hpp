#pragma once

#include "cover/time/i_time_provider.hpp"

namespace cover {

// -----------------------------------------------------------------------------
// LiveTimeProvider - wall-clock implementation of ITimeProvider
// -----------------------------------------------------------------------------
// Used by the flightcover executable. std::chrono::system_clock::now() is
// safe to call from any thread, so no internal synchronization is needed.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace cover
