#pragma once

#include "cover/domain/policy.hpp"

#include <mutex>

namespace cover {

// -----------------------------------------------------------------------------
// PoolAccount - the pooled balance every payout and refund draws from
// -----------------------------------------------------------------------------
//
// @brief  Single global counter fed by premiums and authority deposits and
//         debited by payouts, refunds and excess withdrawals.
//
// @details
// tryDebit() performs check-then-debit under one lock, so two settlements
// racing for the last funds can never both succeed. A failed debit leaves
// the balance untouched.
//
// credit() is also the compensation path: when a transfer fails after its
// debit, PolicyLifecycle credits the same amount back.
//
// Thread model: All methods are mutex-guarded and safe from any thread.
// -----------------------------------------------------------------------------
class PoolAccount {
 public:
  PoolAccount() = default;

  PoolAccount(const PoolAccount&) = delete;
  PoolAccount& operator=(const PoolAccount&) = delete;

  // Adds amount to the balance. Throws ValidationError(InvalidAmount) if the
  // balance would overflow.
  void credit(domain::Amount amount);

  // Debits amount if the balance covers it. Returns false and changes
  // nothing otherwise.
  [[nodiscard]] bool tryDebit(domain::Amount amount);

  domain::Amount balance() const;

 private:
  mutable std::mutex mutex_;
  domain::Amount balance_{0};
};

}  // namespace cover
