#pragma once

#include "cover/domain/ledger_totals.hpp"

#include <mutex>

namespace cover {

// -----------------------------------------------------------------------------
// LedgerAccounting - append-only aggregate totals
// -----------------------------------------------------------------------------
//
// @brief  Tallies premiums collected and payouts processed.
//
// @details
// Only PolicyLifecycle writes here, and only after the corresponding
// transition has committed (a rolled-back settlement is never recorded).
// Both counters are monotonic; there is no way to decrement them.
//
// The two counters are guarded by one mutex so totals() always returns a
// pair that was true at a single instant.
//
// Thread model: Safe from any thread.
// -----------------------------------------------------------------------------
class LedgerAccounting {
 public:
  LedgerAccounting() = default;

  LedgerAccounting(const LedgerAccounting&) = delete;
  LedgerAccounting& operator=(const LedgerAccounting&) = delete;

  void recordPremium(domain::Amount amount);
  void recordPayout(domain::Amount amount);

  domain::LedgerTotals totals() const;

 private:
  mutable std::mutex mutex_;
  domain::LedgerTotals totals_;
};

}  // namespace cover
