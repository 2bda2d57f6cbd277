#include "cover/funds/mock_funds_transfer.hpp"

#include <stdexcept>

namespace cover {

// -----------------------------------------------------------------------------
// transfer(): deliver or fail as instructed
// -----------------------------------------------------------------------------
bool MockFundsTransfer::transfer(const domain::AccountId& to,
                                 domain::Amount amount) {
  std::lock_guard lock(mutex_);

  if (throw_remaining_ > 0) {
    --throw_remaining_;
    ++failed_attempts_;
    throw std::runtime_error("mock transfer rail unavailable");
  }

  if (fail_remaining_ > 0) {
    --fail_remaining_;
    ++failed_attempts_;
    return false;
  }

  records_.push_back(Record{to, amount});
  balances_[to] += amount;
  return true;
}

void MockFundsTransfer::failNext(std::size_t count) {
  std::lock_guard lock(mutex_);
  fail_remaining_ = count;
}

void MockFundsTransfer::throwNext(std::size_t count) {
  std::lock_guard lock(mutex_);
  throw_remaining_ = count;
}

domain::Amount MockFundsTransfer::balanceOf(
    const domain::AccountId& account) const {
  std::lock_guard lock(mutex_);
  auto it = balances_.find(account);
  return it == balances_.end() ? 0 : it->second;
}

std::vector<MockFundsTransfer::Record> MockFundsTransfer::records() const {
  std::lock_guard lock(mutex_);
  return records_;
}

std::size_t MockFundsTransfer::transferCount() const {
  std::lock_guard lock(mutex_);
  return records_.size();
}

std::size_t MockFundsTransfer::failedAttempts() const {
  std::lock_guard lock(mutex_);
  return failed_attempts_;
}

}  // namespace cover
