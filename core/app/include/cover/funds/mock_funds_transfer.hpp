#pragma once

#include "cover/funds/i_funds_transfer.hpp"

#include <cstddef>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace cover {

// -----------------------------------------------------------------------------
// MockFundsTransfer - in-memory transfer rail
// -----------------------------------------------------------------------------
//
// @brief  Records every delivered transfer and credits a per-account
//         balance. Can be told to fail, which is how the compensation path
//         of PolicyLifecycle is exercised.
//
// @details
// Used by tests and by the flightcover executable in simulation mode. A real
// deployment plugs in an implementation backed by its payment rail.
//
// Failure injection:
//   failNext(n)      the next n transfers return false
//   throwNext(n)     the next n transfers throw std::runtime_error
//   Failed transfers are not recorded and move nothing.
//
// Thread model: All methods are mutex-guarded and safe from any thread.
// -----------------------------------------------------------------------------
class MockFundsTransfer final : public IFundsTransfer {
 public:
  struct Record {
    domain::AccountId to;
    domain::Amount amount{0};
  };

  bool transfer(const domain::AccountId& to, domain::Amount amount) override;

  void failNext(std::size_t count);
  void throwNext(std::size_t count);

  // Total delivered to `account` so far.
  domain::Amount balanceOf(const domain::AccountId& account) const;

  std::vector<Record> records() const;
  std::size_t transferCount() const;
  std::size_t failedAttempts() const;

 private:
  mutable std::mutex mutex_;
  std::size_t fail_remaining_{0};
  std::size_t throw_remaining_{0};
  std::size_t failed_attempts_{0};
  std::vector<Record> records_;
  std::unordered_map<domain::AccountId, domain::Amount> balances_;
};

}  // namespace cover
