#pragma once

#include <cstdint>

namespace cover {
namespace domain {

// -----------------------------------------------------------------------------
// PayoutTier - one delay-range to multiplier rule
// -----------------------------------------------------------------------------
//
// @brief  Covers delays in [min_delay, max_delay) minutes and pays
//         premium * multiplier / 100.
//
// @details
// multiplier is expressed in hundredths: 100 = 1.0x, 250 = 2.5x.
// Tiers are not validated for overlap, gaps or ordering when appended; the
// first-match scan in PayoutEngine decides which rule wins.
// -----------------------------------------------------------------------------
struct PayoutTier {
  std::uint32_t min_delay{0};
  std::uint32_t max_delay{0};
  std::uint32_t multiplier{0};
};

}  // namespace domain
}  // namespace cover
