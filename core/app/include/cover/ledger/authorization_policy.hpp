#pragma once

#include "cover/domain/policy.hpp"

#include <string>
#include <utility>

namespace cover {

// -----------------------------------------------------------------------------
// AuthorizationPolicy - who may do what
// -----------------------------------------------------------------------------
//
// @brief  Holds the single trusted authority identity, injected at
//         construction from LedgerConfig.
//
// @details
// The ledger does not authenticate anyone. Whatever sits upstream (the
// oracle client, the admin console) authenticates the caller and passes its
// identity in; this class only compares identities.
//
//   requireAuthority      updateFlightStatus, expirePolicy, addPayoutTier,
//                         fundPool, withdrawExcess
//   requireHolderOrAuthority  processPayout, cancelPolicy
//
// Both throw AuthorizationError on mismatch. An empty caller identity never
// matches anything.
//
// Thread model: Immutable after construction; safe from any thread.
// -----------------------------------------------------------------------------
class AuthorizationPolicy {
 public:
  explicit AuthorizationPolicy(domain::AccountId authority)
      : authority_(std::move(authority)) {}

  bool isAuthority(const domain::AccountId& caller) const {
    return !caller.empty() && caller == authority_;
  }

  void requireAuthority(const domain::AccountId& caller,
                        const std::string& operation) const;

  void requireHolderOrAuthority(const domain::AccountId& caller,
                                const domain::AccountId& holder,
                                const std::string& operation) const;

  const domain::AccountId& authority() const { return authority_; }

 private:
  const domain::AccountId authority_;
};

}  // namespace cover
