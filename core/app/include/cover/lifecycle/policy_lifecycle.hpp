#pragma once

#include "cover/config/ledger_config.hpp"
#include "cover/domain/ledger_totals.hpp"
#include "cover/domain/payout_tier.hpp"
#include "cover/domain/policy.hpp"
#include "cover/eventbus/event_bus.hpp"
#include "cover/funds/i_funds_transfer.hpp"
#include "cover/ledger/authorization_policy.hpp"
#include "cover/ledger/ledger_accounting.hpp"
#include "cover/ledger/payout_tier_table.hpp"
#include "cover/ledger/policy_store.hpp"
#include "cover/ledger/pool_account.hpp"
#include "cover/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cover {

// -----------------------------------------------------------------------------
// PolicyLifecycle - policy state machine and settlement orchestrator
// -----------------------------------------------------------------------------
//
// @brief  The only entry point that changes ledger state. Validates input,
//         enforces authorization and state-machine legality, sizes payouts
//         through PayoutEngine, moves money through PoolAccount and
//         IFundsTransfer, tallies LedgerAccounting and publishes events.
//
// @details
// Call flow for every state-changing operation:
//
//   caller ──> authorize / validate ──> PolicyStore::withPolicy (record lock)
//                                          │
//                                          ├── state checks
//                                          ├── PayoutEngine (settlement only)
//                                          ├── PoolAccount::tryDebit
//                                          ├── commit (status, flags)
//                                          ├── IFundsTransfer::transfer
//                                          │     └─ failure: revert commit,
//                                          │        re-credit pool, throw
//                                          └── LedgerAccounting
//                                       (record lock released)
//                                          └── EventBus::publish
//
// Settlement (shared by the auto-trigger in updateFlightStatus() and by
// processPayout()):
//   1. payout = min(PayoutEngine::computePayout(...), max_payout)
//   2. PoolAccount::tryDebit(payout) or ResourceError(InsufficientPool). The
//      policy is untouched and the claim can be retried after fundPool().
//   3. payout_processed = true, status = Claimed (committed BEFORE transfer).
//   4. IFundsTransfer::transfer(holder, payout). If it fails, the policy is
//      restored to its pre-settlement state, the payout is credited back to
//      the pool and TransferFailure is thrown. payout_processed is never
//      left true with the funds undelivered.
//   5. LedgerAccounting::recordPayout(payout), PayoutTriggeredEvent.
//
// Exactly-once:
//   Steps 1–5 run under the policy's record lock and begin by checking
//   payout_processed, so a concurrent auto-trigger and manual claim on the
//   same policy settle once; the loser sees AlreadyPaid (manual) or skips
//   (auto-trigger).
//
// Events are collected while the record lock is held and published after it
// is released, in commit order, so subscribers may call back into the
// ledger. Every event gets a ledger-wide sequence_id at commit.
//
// Thread model:
//   Every public method is safe to call from any thread. Operations on
//   different policies run in parallel; operations on the same policy
//   serialize on its record lock.
//
// Ownership:
//   Owns PolicyStore, PayoutTierTable, PoolAccount, LedgerAccounting and the
//   AuthorizationPolicy. Holds non-owning references to the EventBus, the
//   time provider and the funds rail; all three must outlive it.
// -----------------------------------------------------------------------------
class PolicyLifecycle {
 public:
  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  bus     Where committed transitions are published.
  // @param  clock   Source of "now" for schedule and departure checks.
  // @param  funds   Outbound transfer rail for payouts, refunds and
  //                 withdrawals.
  // @param  config  Authority identity, threshold, refund share and the
  //                 initial tier table (copied).
  // -------------------------------------------------------------------------
  PolicyLifecycle(EventBus& bus, const ITimeProvider& clock,
                  IFundsTransfer& funds, const LedgerConfig& config);

  PolicyLifecycle(const PolicyLifecycle&) = delete;
  PolicyLifecycle& operator=(const PolicyLifecycle&) = delete;
  PolicyLifecycle(PolicyLifecycle&&) = delete;
  PolicyLifecycle& operator=(PolicyLifecycle&&) = delete;

  // -------------------------------------------------------------------------
  // createPolicy(...)
  // -------------------------------------------------------------------------
  // @brief  Opens a new Active policy and escrows the premium into the pool.
  //
  // @throws ValidationError  InvalidHolder (empty holder),
  //                          InvalidFlightNumber (empty flight number),
  //                          InvalidPremium (premium_paid == 0),
  //                          InvalidSchedule (departure not after now),
  //                          InsufficientCoverageRatio
  //                          (max_payout < 2 * premium_paid).
  //
  // Side-effects: pool += premium, premiums_collected += premium,
  //               PolicyCreatedEvent.
  // -------------------------------------------------------------------------
  domain::PolicyId createPolicy(const domain::AccountId& holder,
                                const std::string& flight_number,
                                domain::EpochSeconds scheduled_departure,
                                domain::Amount max_payout,
                                domain::Amount premium_paid);

  // -------------------------------------------------------------------------
  // updateFlightStatus(...)
  // -------------------------------------------------------------------------
  // @brief  Applies an authority flight status report and, when the delay
  //         reaches the payout threshold, settles the policy.
  //
  // @details
  // Delay rules:
  //   - Delayed/Cancelled with actual_departure > scheduled_departure:
  //       delay = floor((actual - scheduled) / 60)
  //   - Cancelled with actual_departure unset or not after scheduled:
  //       delay = kMaxDelayMinutes (worst tier, unconditional)
  //   - any other report leaves the delay as it was
  //   The stored delay is the maximum of the previous and the new value.
  //
  // A non-zero actual_departure is recorded; zero keeps the previous value.
  //
  // Auto-settlement outcome:
  //   - settled: PayoutTriggeredEvent follows FlightStatusUpdatedEvent.
  //   - pool too small / no applicable tier: the status update stands, the
  //     policy stays Active and claimable, a warning is logged.
  //   - transfer failed: the status update stands, the settlement is
  //     compensated, TransferFailure is thrown after the status event has
  //     been published.
  //   - already settled: nothing (idempotent).
  //
  // @throws AuthorizationError, StateError (PolicyNotFound, PolicyNotActive),
  //         TransferFailure.
  // -------------------------------------------------------------------------
  void updateFlightStatus(domain::PolicyId policy_id,
                          domain::FlightStatus new_flight_status,
                          domain::EpochSeconds actual_departure,
                          const domain::AccountId& caller);

  // -------------------------------------------------------------------------
  // processPayout(policy_id, caller)
  // -------------------------------------------------------------------------
  // @brief  Manual claim by the holder or the authority.
  //
  // @throws AuthorizationError, StateError (PolicyNotFound, AlreadyPaid,
  //         PolicyNotActive, DelayBelowThreshold, NoApplicableTier),
  //         ResourceError, TransferFailure.
  // @return The amount paid out.
  // -------------------------------------------------------------------------
  domain::Amount processPayout(domain::PolicyId policy_id,
                               const domain::AccountId& caller);

  // -------------------------------------------------------------------------
  // cancelPolicy(policy_id, caller)
  // -------------------------------------------------------------------------
  // @brief  Cancels an Active policy before departure and refunds
  //         refund_percent (90%) of the premium to the holder. The rest
  //         stays in the pool. Irreversible.
  //
  // @throws AuthorizationError, StateError (PolicyNotFound, PolicyNotActive,
  //         DepartureAlreadyPassed), ResourceError, TransferFailure.
  // @return The refunded amount.
  // -------------------------------------------------------------------------
  domain::Amount cancelPolicy(domain::PolicyId policy_id,
                              const domain::AccountId& caller);

  // -------------------------------------------------------------------------
  // expirePolicy(policy_id, caller)
  // -------------------------------------------------------------------------
  // @brief  Authority closes an Active policy whose departure time has
  //         passed without a qualifying delay. The premium stays pooled.
  //
  // @throws AuthorizationError, StateError (PolicyNotFound, PolicyNotActive,
  //         DepartureNotPassed, PayoutPending).
  // -------------------------------------------------------------------------
  void expirePolicy(domain::PolicyId policy_id,
                    const domain::AccountId& caller);

  // --- Administration (authority only) --------------------------------------

  void addPayoutTier(std::uint32_t min_delay, std::uint32_t max_delay,
                     std::uint32_t multiplier,
                     const domain::AccountId& caller);

  // Deposits amount into the pool. ValidationError(InvalidAmount) for 0.
  void fundPool(domain::Amount amount, const domain::AccountId& caller);

  // Transfers amount out of the pool to the authority.
  // ValidationError(InvalidAmount) for 0, ResourceError if amount exceeds
  // the balance, TransferFailure (balance restored) if the rail fails.
  void withdrawExcess(domain::Amount amount, const domain::AccountId& caller);

  // --- Queries (read-only, thread-safe snapshots) ---------------------------

  std::optional<domain::Policy> policy(domain::PolicyId policy_id) const;
  std::vector<domain::PolicyId> policiesByHolder(
      const domain::AccountId& holder) const;
  std::vector<domain::PolicyId> policiesByFlight(
      const std::string& flight_number) const;
  std::vector<domain::Policy> allPolicies() const;
  std::size_t policyCount() const;
  domain::Amount poolBalance() const;
  domain::LedgerTotals totals() const;
  std::vector<domain::PayoutTier> payoutTiers() const;
  const LedgerConfig& config() const { return config_; }

 private:
  // -------------------------------------------------------------------------
  // settleLocked(policy, pending)
  // -------------------------------------------------------------------------
  // @brief  Settlement steps 1–5. Caller holds the policy's record lock and
  //         has checked that the policy is Active and unpaid with a delay at
  //         or above the threshold.
  //
  // @throws StateError(NoApplicableTier), ResourceError, TransferFailure.
  //         On every throw the policy and the pool are as they were.
  // -------------------------------------------------------------------------
  domain::Amount settleLocked(domain::Policy& policy,
                              std::vector<Event>& pending);

  // Calls the funds rail and folds "returned false" and "threw" into one
  // bool. The rail's exception text is logged before it is discarded.
  bool deliver(const domain::AccountId& to, domain::Amount amount,
               const char* purpose);

  static void requireActive(const domain::Policy& policy);

  domain::EpochSeconds nowSeconds() const;
  Timestamp nowTimestamp() const;
  SequenceId nextSequence();
  void publishAll(const std::vector<Event>& pending);

  EventBus& bus_;
  const ITimeProvider& clock_;
  IFundsTransfer& funds_;
  const LedgerConfig config_;

  AuthorizationPolicy auth_;
  PolicyStore store_;
  PayoutTierTable tiers_;
  PoolAccount pool_;
  LedgerAccounting accounting_;

  std::atomic<SequenceId> next_sequence_{1};
};

}  // namespace cover
