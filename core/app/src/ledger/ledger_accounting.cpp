#include "cover/ledger/ledger_accounting.hpp"

namespace cover {

void LedgerAccounting::recordPremium(domain::Amount amount) {
  std::lock_guard lock(mutex_);
  totals_.premiums_collected += amount;
}

void LedgerAccounting::recordPayout(domain::Amount amount) {
  std::lock_guard lock(mutex_);
  totals_.payouts_processed += amount;
}

domain::LedgerTotals LedgerAccounting::totals() const {
  std::lock_guard lock(mutex_);
  return totals_;
}

}  // namespace cover
