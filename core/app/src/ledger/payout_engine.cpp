#include "cover/ledger/payout_engine.hpp"

#include <algorithm>
#include <limits>

namespace cover {

// -----------------------------------------------------------------------------
// lookupMultiplier(): first match in stored order, else the last tier
// -----------------------------------------------------------------------------
std::optional<std::uint32_t> PayoutEngine::lookupMultiplier(
    std::uint32_t delay_minutes,
    const std::vector<domain::PayoutTier>& tiers) {
  if (tiers.empty()) {
    return std::nullopt;
  }

  for (const auto& tier : tiers) {
    if (tier.min_delay <= delay_minutes && delay_minutes < tier.max_delay) {
      return tier.multiplier;
    }
  }

  return tiers.back().multiplier;
}

// -----------------------------------------------------------------------------
// computePayout()
// -----------------------------------------------------------------------------
domain::Amount PayoutEngine::computePayout(
    domain::Amount premium, std::uint32_t delay_minutes,
    const std::vector<domain::PayoutTier>& tiers, std::uint32_t threshold) {
  if (delay_minutes < threshold) {
    return 0;
  }

  auto multiplier = lookupMultiplier(delay_minutes, tiers);
  if (!multiplier || *multiplier == 0) {
    return 0;
  }

  // premium * m / 100 split as (premium / 100) * m + (premium % 100) * m / 100
  // so the product never overflows before the division. The second term is
  // below 100 * 2^32 and always fits.
  constexpr auto kMax = std::numeric_limits<domain::Amount>::max();
  const domain::Amount m = *multiplier;
  const domain::Amount whole = premium / 100;
  const domain::Amount rest = premium % 100 * m / 100;
  if (whole > (kMax - rest) / m) {
    return kMax;
  }
  return whole * m + rest;
}

domain::Amount PayoutEngine::capPayout(domain::Amount amount,
                                       domain::Amount max_payout) {
  return std::min(amount, max_payout);
}

}  // namespace cover
