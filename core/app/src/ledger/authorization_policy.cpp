#include "cover/ledger/authorization_policy.hpp"
#include "cover/ledger/errors.hpp"

namespace cover {

void AuthorizationPolicy::requireAuthority(const domain::AccountId& caller,
                                           const std::string& operation) const {
  if (!isAuthority(caller)) {
    throw AuthorizationError(operation + ": caller '" + caller +
                             "' is not the authority");
  }
}

void AuthorizationPolicy::requireHolderOrAuthority(
    const domain::AccountId& caller, const domain::AccountId& holder,
    const std::string& operation) const {
  if (isAuthority(caller)) {
    return;
  }
  if (caller.empty() || caller != holder) {
    throw AuthorizationError(operation + ": caller '" + caller +
                             "' is neither the holder nor the authority");
  }
}

}  // namespace cover
