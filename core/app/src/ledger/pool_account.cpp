#include "cover/ledger/pool_account.hpp"
#include "cover/ledger/errors.hpp"

#include <limits>
#include <string>

namespace cover {

void PoolAccount::credit(domain::Amount amount) {
  std::lock_guard lock(mutex_);
  if (amount > std::numeric_limits<domain::Amount>::max() - balance_) {
    throw ValidationError(ErrorCode::InvalidAmount,
                          "pool credit of " + std::to_string(amount) +
                              " would overflow the pooled balance");
  }
  balance_ += amount;
}

bool PoolAccount::tryDebit(domain::Amount amount) {
  std::lock_guard lock(mutex_);
  if (amount > balance_) {
    return false;
  }
  balance_ -= amount;
  return true;
}

domain::Amount PoolAccount::balance() const {
  std::lock_guard lock(mutex_);
  return balance_;
}

}  // namespace cover
