#pragma once

#include "cover/domain/policy.hpp"

namespace cover {

// -----------------------------------------------------------------------------
// IFundsTransfer - outbound money movement interface
// -----------------------------------------------------------------------------
//
// @brief  The external rail that actually delivers funds to an account:
//         payouts and refunds to holders, excess withdrawals to the
//         authority.
//
// @details
// PolicyLifecycle commits ledger state first and calls transfer() second.
// An implementation reports failure either by returning false or by
// throwing; both are treated the same way: the ledger reverts the commit,
// re-credits the pool and raises TransferFailure to its caller. An
// implementation must therefore NOT deliver funds and then report failure,
// since the ledger would consider the money undelivered.
//
// Calling convention:
//   Called synchronously while the affected policy's lock is held. Must
//   return in bounded time and must not call back into the ledger for the
//   same policy.
//
// Ownership:
//   PolicyLifecycle holds a non-owning reference. The caller (InsuranceEngine
//   or a test) owns the implementation.
//
// Thread model:
//   May be called concurrently for different policies. Implementations must
//   be thread-safe.
// -----------------------------------------------------------------------------
class IFundsTransfer {
 public:
  virtual ~IFundsTransfer() = default;

  // -------------------------------------------------------------------------
  // transfer(to, amount)
  // -------------------------------------------------------------------------
  // @brief  Delivers amount to account `to`.
  //
  // @return true once the funds are delivered, false if nothing moved.
  // -------------------------------------------------------------------------
  virtual bool transfer(const domain::AccountId& to, domain::Amount amount) = 0;
};

}  // namespace cover
