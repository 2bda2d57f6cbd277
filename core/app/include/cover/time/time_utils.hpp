#pragma once

#include "cover/domain/policy.hpp"
#include "cover/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace cover {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// ITimeProvider speaks epoch milliseconds, events carry a chrono Timestamp,
// and policy records use epoch seconds (departure times come from flight
// schedules with minute resolution at best). These helpers bridge the three.
// All are stateless and safe from any thread.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

// Truncates toward negative infinity so that a clock at 999 ms reads as
// second 0, never as second 1.
inline domain::EpochSeconds ms_to_seconds(std::int64_t ms) {
  return ms >= 0 ? ms / 1000 : -((-ms + 999) / 1000);
}

inline std::int64_t seconds_to_ms(domain::EpochSeconds s) {
  return s * 1000;
}

}  // namespace cover
