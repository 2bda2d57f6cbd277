#pragma once

#include "cover/domain/payout_tier.hpp"

#include <cstddef>
#include <cstdint>
#include <shared_mutex>
#include <vector>

namespace cover {

// -----------------------------------------------------------------------------
// PayoutTierTable - ordered, append-only delay tiers
// -----------------------------------------------------------------------------
//
// @brief  Holds the delay-range -> multiplier rules in the order they were
//         appended.
//
// @details
// The table is deliberately permissive: addTier() does not check overlap,
// gaps or ordering. When ranges overlap, the earlier tier wins because
// PayoutEngine scans first-match in stored order; a later tier only takes
// effect for delays no earlier tier covers. Tiers are never removed or
// reordered.
//
// Authorization is not checked here. PolicyLifecycle::addPayoutTier() is the
// only path callers reach, and it requires the authority.
//
// Thread model:
//   Readers take a shared lock and copy; settlement computes on the
//   snapshot returned by tiers(), so a concurrent append never changes a
//   payout mid-computation.
// -----------------------------------------------------------------------------
class PayoutTierTable {
 public:
  PayoutTierTable() = default;
  explicit PayoutTierTable(std::vector<domain::PayoutTier> initial);

  PayoutTierTable(const PayoutTierTable&) = delete;
  PayoutTierTable& operator=(const PayoutTierTable&) = delete;

  void addTier(std::uint32_t min_delay, std::uint32_t max_delay,
               std::uint32_t multiplier);

  // Snapshot of all tiers in stored (scan) order.
  std::vector<domain::PayoutTier> tiers() const;

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::vector<domain::PayoutTier> tiers_;
};

}  // namespace cover
