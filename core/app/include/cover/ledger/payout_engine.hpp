#pragma once

#include "cover/domain/payout_tier.hpp"
#include "cover/domain/policy.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace cover {

// -----------------------------------------------------------------------------
// PayoutEngine - deterministic payout sizing
// -----------------------------------------------------------------------------
//
// @brief  Pure functions that turn (premium, delay, tiers) into an amount.
//
// @details
// Rules, in order:
//   1. delay_minutes < threshold (120 by default)  ->  0.
//   2. Scan tiers in stored order; the first tier with
//      min_delay <= delay_minutes < max_delay supplies the multiplier.
//   3. No tier matched (the delay lies beyond every bounded range, or in a
//      gap)  ->  the LAST tier's multiplier applies unconditionally. This
//      keeps the top tier open-ended, so a cancelled flight carrying the
//      kMaxDelayMinutes sentinel always lands on the worst-case multiplier.
//   4. No tiers at all  ->  0.
//
// The amount is premium * multiplier / 100 (multiplier in hundredths,
// integer division), evaluated without an intermediate overflow. Only a
// result that itself exceeds Amount saturates at the maximum Amount;
// capPayout() then brings it down to max_payout.
//
// Thread model: Stateless. Safe from any thread.
// -----------------------------------------------------------------------------
class PayoutEngine {
 public:
  static constexpr std::uint32_t kDefaultThreshold = 120;

  PayoutEngine() = delete;

  // Multiplier of the tier that applies to delay_minutes, std::nullopt when
  // the table is empty.
  static std::optional<std::uint32_t> lookupMultiplier(
      std::uint32_t delay_minutes,
      const std::vector<domain::PayoutTier>& tiers);

  static domain::Amount computePayout(
      domain::Amount premium, std::uint32_t delay_minutes,
      const std::vector<domain::PayoutTier>& tiers,
      std::uint32_t threshold = kDefaultThreshold);

  static domain::Amount capPayout(domain::Amount amount,
                                  domain::Amount max_payout);
};

}  // namespace cover
