#pragma once

#include "cover/domain/payout_tier.hpp"
#include "cover/domain/policy.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace cover {

// -----------------------------------------------------------------------------
// LedgerConfig - engine-wide ledger parameters
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the values that govern authorization,
//         settlement and cancellation across the engine.
//
// @details
// Loaded once at startup by ConfigLoader (JSON) or built in code by tests,
// then copied by value into the components that need it. Nothing reads it
// through a global.
//
//   authority           The single trusted caller allowed to report flight
//                       status and perform administrative actions.
//   payout_threshold    Minimum delay (minutes) that makes a policy
//                       claimable. Auto-settlement fires at this value.
//   refund_percent      Share of the premium returned on cancellation. The
//                       remainder is the processing fee and stays pooled.
//   initial_tiers       Payout tiers installed when the engine starts.
//   ipc_*_endpoint      ZeroMQ endpoints for queries and event broadcast.
//                       Empty disables the IPC server.
//
// Thread model:
//   Plain value type with no shared mutable state.
// -----------------------------------------------------------------------------
struct LedgerConfig {
  domain::AccountId authority{"authority"};
  std::uint32_t payout_threshold{120};
  std::uint32_t refund_percent{90};

  std::vector<domain::PayoutTier> initial_tiers{
      {120, 240, 200},
      {240, 480, 300},
      {480, domain::kMaxDelayMinutes, 500},
  };

  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

}  // namespace cover
