#include "cover/ledger/payout_tier_table.hpp"

#include <mutex>
#include <utility>

namespace cover {

PayoutTierTable::PayoutTierTable(std::vector<domain::PayoutTier> initial)
    : tiers_(std::move(initial)) {}

void PayoutTierTable::addTier(std::uint32_t min_delay, std::uint32_t max_delay,
                              std::uint32_t multiplier) {
  std::unique_lock lock(mutex_);
  tiers_.push_back(domain::PayoutTier{min_delay, max_delay, multiplier});
}

std::vector<domain::PayoutTier> PayoutTierTable::tiers() const {
  std::shared_lock lock(mutex_);
  return tiers_;
}

std::size_t PayoutTierTable::size() const {
  std::shared_lock lock(mutex_);
  return tiers_.size();
}

}  // namespace cover
