#pragma once

#include "cover/domain/policy.hpp"

namespace cover {
namespace domain {

// -----------------------------------------------------------------------------
// LedgerTotals - aggregate money flow snapshot
// -----------------------------------------------------------------------------
//
// @brief  Sum of every committed premium and every committed payout.
//
// @details
// Both counters only grow. Refunds from cancellation are not payouts and are
// not counted here; the retained cancellation fee stays in the pool and is
// not tracked separately either.
//
// Thread model:
//   Value type returned by LedgerAccounting::totals().
// -----------------------------------------------------------------------------
struct LedgerTotals {
  Amount premiums_collected{0};
  Amount payouts_processed{0};
};

}  // namespace domain
}  // namespace cover
