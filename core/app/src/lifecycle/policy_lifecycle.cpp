#include "cover/lifecycle/policy_lifecycle.hpp"
#include "cover/ledger/errors.hpp"
#include "cover/ledger/payout_engine.hpp"
#include "cover/time/time_utils.hpp"

#include <algorithm>
#include <exception>
#include <iostream>
#include <utility>

namespace cover {

namespace {

constexpr domain::EpochSeconds kSecondsPerMinute = 60;

std::string policyLabel(domain::PolicyId id) {
  return "policy " + std::to_string(id);
}

// Minutes between scheduled and actual departure, clamped to the sentinel.
std::uint32_t minutesLate(domain::EpochSeconds scheduled,
                          domain::EpochSeconds actual) {
  const domain::EpochSeconds minutes = (actual - scheduled) / kSecondsPerMinute;
  if (minutes >= static_cast<domain::EpochSeconds>(domain::kMaxDelayMinutes)) {
    return domain::kMaxDelayMinutes;
  }
  return static_cast<std::uint32_t>(minutes);
}

const char* payoutReason(domain::FlightStatus status) {
  return status == domain::FlightStatus::Cancelled ? "Flight Cancelled"
                                                   : "Flight Delayed";
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PolicyLifecycle::PolicyLifecycle(EventBus& bus, const ITimeProvider& clock,
                                 IFundsTransfer& funds,
                                 const LedgerConfig& config)
    : bus_(bus),
      clock_(clock),
      funds_(funds),
      config_(config),
      auth_(config.authority),
      tiers_(config.initial_tiers) {}

// -----------------------------------------------------------------------------
// createPolicy(): validate, escrow premium, insert, tally, publish
// -----------------------------------------------------------------------------
domain::PolicyId PolicyLifecycle::createPolicy(
    const domain::AccountId& holder, const std::string& flight_number,
    domain::EpochSeconds scheduled_departure, domain::Amount max_payout,
    domain::Amount premium_paid) {
  if (holder.empty()) {
    throw ValidationError(ErrorCode::InvalidHolder, "holder must not be empty");
  }
  if (flight_number.empty()) {
    throw ValidationError(ErrorCode::InvalidFlightNumber,
                          "flight number must not be empty");
  }
  if (premium_paid == 0) {
    throw ValidationError(ErrorCode::InvalidPremium,
                          "premium must be greater than zero");
  }

  const domain::EpochSeconds now = nowSeconds();
  if (scheduled_departure <= now) {
    throw ValidationError(ErrorCode::InvalidSchedule,
                          "scheduled departure " +
                              std::to_string(scheduled_departure) +
                              " is not after now (" + std::to_string(now) +
                              ")");
  }

  // max_payout < 2 * premium, written so the product cannot overflow.
  if (max_payout / 2 < premium_paid) {
    throw ValidationError(ErrorCode::InsufficientCoverageRatio,
                          "max payout " + std::to_string(max_payout) +
                              " is below twice the premium " +
                              std::to_string(premium_paid));
  }

  // Escrow first: if the pool cannot take the premium nothing else happens.
  pool_.credit(premium_paid);

  domain::Policy draft;
  draft.holder = holder;
  draft.flight_number = flight_number;
  draft.scheduled_departure = scheduled_departure;
  draft.premium = premium_paid;
  draft.max_payout = max_payout;
  draft.created_at = now;

  const domain::PolicyId id = store_.insert(std::move(draft));
  accounting_.recordPremium(premium_paid);

  PolicyCreatedEvent created;
  created.policy_id = id;
  created.holder = holder;
  created.flight_number = flight_number;
  created.timestamp = nowTimestamp();
  created.sequence_id = nextSequence();
  bus_.publish(created);

  return id;
}

// -----------------------------------------------------------------------------
// updateFlightStatus(): apply report, recompute delay, maybe auto-settle
// -----------------------------------------------------------------------------
void PolicyLifecycle::updateFlightStatus(domain::PolicyId policy_id,
                                         domain::FlightStatus new_flight_status,
                                         domain::EpochSeconds actual_departure,
                                         const domain::AccountId& caller) {
  auth_.requireAuthority(caller, "updateFlightStatus");

  std::vector<Event> pending;
  std::optional<TransferFailure> transfer_failure;

  store_.withPolicy(policy_id, [&](domain::Policy& p) {
    requireActive(p);

    using FS = domain::FlightStatus;
    std::uint32_t reported_delay = 0;
    if (new_flight_status == FS::Delayed || new_flight_status == FS::Cancelled) {
      if (actual_departure > p.scheduled_departure) {
        reported_delay = minutesLate(p.scheduled_departure, actual_departure);
      } else if (new_flight_status == FS::Cancelled) {
        reported_delay = domain::kMaxDelayMinutes;
      }
    }

    p.flight_status = new_flight_status;
    if (actual_departure != 0) {
      p.actual_departure = actual_departure;
    }
    p.delay_minutes = std::max(p.delay_minutes, reported_delay);

    FlightStatusUpdatedEvent updated;
    updated.policy_id = p.id;
    updated.flight_status = p.flight_status;
    updated.delay_minutes = p.delay_minutes;
    updated.timestamp = nowTimestamp();
    updated.sequence_id = nextSequence();
    pending.emplace_back(std::move(updated));

    if (p.payout_processed || p.delay_minutes < config_.payout_threshold) {
      return;
    }

    try {
      settleLocked(p, pending);
    } catch (const ResourceError& e) {
      std::cerr << "[PolicyLifecycle] WARNING: auto-settlement deferred for "
                << policyLabel(p.id) << ": " << e.what() << "\n";
    } catch (const StateError& e) {
      std::cerr << "[PolicyLifecycle] WARNING: auto-settlement skipped for "
                << policyLabel(p.id) << ": " << e.what() << "\n";
    } catch (const TransferFailure& e) {
      transfer_failure = e;
    }
  });

  publishAll(pending);

  if (transfer_failure) {
    throw *transfer_failure;
  }
}

// -----------------------------------------------------------------------------
// processPayout(): manual claim
// -----------------------------------------------------------------------------
domain::Amount PolicyLifecycle::processPayout(domain::PolicyId policy_id,
                                              const domain::AccountId& caller) {
  std::vector<Event> pending;

  const domain::Amount paid =
      store_.withPolicy(policy_id, [&](domain::Policy& p) {
        auth_.requireHolderOrAuthority(caller, p.holder, "processPayout");

        if (p.payout_processed) {
          throw StateError(ErrorCode::AlreadyPaid,
                           policyLabel(p.id) + " has already been paid out");
        }
        requireActive(p);
        if (p.delay_minutes < config_.payout_threshold) {
          throw StateError(ErrorCode::DelayBelowThreshold,
                           policyLabel(p.id) + " delay of " +
                               std::to_string(p.delay_minutes) +
                               " minutes is below the payout threshold");
        }
        return settleLocked(p, pending);
      });

  publishAll(pending);
  return paid;
}

// -----------------------------------------------------------------------------
// cancelPolicy(): refund refund_percent of the premium before departure
// -----------------------------------------------------------------------------
domain::Amount PolicyLifecycle::cancelPolicy(domain::PolicyId policy_id,
                                             const domain::AccountId& caller) {
  std::vector<Event> pending;

  const domain::Amount refund =
      store_.withPolicy(policy_id, [&](domain::Policy& p) {
        auth_.requireHolderOrAuthority(caller, p.holder, "cancelPolicy");
        requireActive(p);

        if (nowSeconds() >= p.scheduled_departure) {
          throw StateError(ErrorCode::DepartureAlreadyPassed,
                           policyLabel(p.id) +
                               " cannot be cancelled at or after departure");
        }

        const domain::Amount amount =
            p.premium / 100 * config_.refund_percent +
            p.premium % 100 * config_.refund_percent / 100;

        if (!pool_.tryDebit(amount)) {
          throw ResourceError("pool cannot cover refund of " +
                              std::to_string(amount) + " for " +
                              policyLabel(p.id));
        }

        const domain::PolicyStatus previous = p.status;
        p.status = domain::PolicyStatus::Cancelled;

        if (!deliver(p.holder, amount, "refund")) {
          p.status = previous;
          pool_.credit(amount);
          std::cerr << "[PolicyLifecycle] CRITICAL: refund transfer failed for "
                    << policyLabel(p.id) << ". Cancellation rolled back.\n";
          throw TransferFailure("refund transfer of " + std::to_string(amount) +
                                " to '" + p.holder + "' failed for " +
                                policyLabel(p.id));
        }

        PolicyCancelledEvent cancelled;
        cancelled.policy_id = p.id;
        cancelled.refund = amount;
        cancelled.timestamp = nowTimestamp();
        cancelled.sequence_id = nextSequence();
        pending.emplace_back(std::move(cancelled));
        return amount;
      });

  publishAll(pending);
  return refund;
}

// -----------------------------------------------------------------------------
// expirePolicy(): close a departed policy that never qualified
// -----------------------------------------------------------------------------
void PolicyLifecycle::expirePolicy(domain::PolicyId policy_id,
                                   const domain::AccountId& caller) {
  auth_.requireAuthority(caller, "expirePolicy");

  std::vector<Event> pending;

  store_.withPolicy(policy_id, [&](domain::Policy& p) {
    requireActive(p);

    if (nowSeconds() < p.scheduled_departure) {
      throw StateError(ErrorCode::DepartureNotPassed,
                       policyLabel(p.id) + " has not reached departure yet");
    }
    if (!p.payout_processed && p.delay_minutes >= config_.payout_threshold) {
      throw StateError(ErrorCode::PayoutPending,
                       policyLabel(p.id) +
                           " qualifies for a payout and must be settled");
    }

    p.status = domain::PolicyStatus::Expired;

    PolicyExpiredEvent expired;
    expired.policy_id = p.id;
    expired.timestamp = nowTimestamp();
    expired.sequence_id = nextSequence();
    pending.emplace_back(std::move(expired));
  });

  publishAll(pending);
}

// -----------------------------------------------------------------------------
// Administration
// -----------------------------------------------------------------------------
void PolicyLifecycle::addPayoutTier(std::uint32_t min_delay,
                                    std::uint32_t max_delay,
                                    std::uint32_t multiplier,
                                    const domain::AccountId& caller) {
  auth_.requireAuthority(caller, "addPayoutTier");
  tiers_.addTier(min_delay, max_delay, multiplier);
  std::cout << "[PolicyLifecycle] Payout tier added: [" << min_delay << ", "
            << max_delay << ") x" << multiplier << "/100\n";
}

void PolicyLifecycle::fundPool(domain::Amount amount,
                               const domain::AccountId& caller) {
  auth_.requireAuthority(caller, "fundPool");
  if (amount == 0) {
    throw ValidationError(ErrorCode::InvalidAmount,
                          "deposit must be greater than zero");
  }
  pool_.credit(amount);
}

void PolicyLifecycle::withdrawExcess(domain::Amount amount,
                                     const domain::AccountId& caller) {
  auth_.requireAuthority(caller, "withdrawExcess");
  if (amount == 0) {
    throw ValidationError(ErrorCode::InvalidAmount,
                          "withdrawal must be greater than zero");
  }
  if (!pool_.tryDebit(amount)) {
    throw ResourceError("withdrawal of " + std::to_string(amount) +
                        " exceeds pooled balance of " +
                        std::to_string(pool_.balance()));
  }
  if (!deliver(caller, amount, "withdrawal")) {
    pool_.credit(amount);
    throw TransferFailure("withdrawal transfer of " + std::to_string(amount) +
                          " to '" + caller + "' failed");
  }
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<domain::Policy> PolicyLifecycle::policy(
    domain::PolicyId policy_id) const {
  return store_.policy(policy_id);
}

std::vector<domain::PolicyId> PolicyLifecycle::policiesByHolder(
    const domain::AccountId& holder) const {
  return store_.policiesByHolder(holder);
}

std::vector<domain::PolicyId> PolicyLifecycle::policiesByFlight(
    const std::string& flight_number) const {
  return store_.policiesByFlight(flight_number);
}

std::vector<domain::Policy> PolicyLifecycle::allPolicies() const {
  return store_.snapshot();
}

std::size_t PolicyLifecycle::policyCount() const { return store_.size(); }

domain::Amount PolicyLifecycle::poolBalance() const { return pool_.balance(); }

domain::LedgerTotals PolicyLifecycle::totals() const {
  return accounting_.totals();
}

std::vector<domain::PayoutTier> PolicyLifecycle::payoutTiers() const {
  return tiers_.tiers();
}

// -----------------------------------------------------------------------------
// settleLocked(): compute, debit, commit, transfer, tally
// -----------------------------------------------------------------------------
domain::Amount PolicyLifecycle::settleLocked(domain::Policy& policy,
                                             std::vector<Event>& pending) {
  const domain::Amount payout = PayoutEngine::capPayout(
      PayoutEngine::computePayout(policy.premium, policy.delay_minutes,
                                  tiers_.tiers(), config_.payout_threshold),
      policy.max_payout);

  if (payout == 0) {
    throw StateError(ErrorCode::NoApplicableTier,
                     "no payout tier yields a positive amount for " +
                         policyLabel(policy.id));
  }

  if (!pool_.tryDebit(payout)) {
    throw ResourceError("pool balance " + std::to_string(pool_.balance()) +
                        " cannot cover payout of " + std::to_string(payout) +
                        " for " + policyLabel(policy.id));
  }

  // Commit before the transfer: a transfer that is retried can never see
  // this policy as unpaid.
  const domain::PolicyStatus previous_status = policy.status;
  policy.payout_processed = true;
  policy.status = domain::PolicyStatus::Claimed;

  if (!deliver(policy.holder, payout, "payout")) {
    policy.payout_processed = false;
    policy.status = previous_status;
    pool_.credit(payout);
    std::cerr << "[PolicyLifecycle] CRITICAL: payout transfer failed for "
              << policyLabel(policy.id) << ". Settlement rolled back; "
              << "operator action required.\n";
    throw TransferFailure("payout transfer of " + std::to_string(payout) +
                          " to '" + policy.holder + "' failed for " +
                          policyLabel(policy.id));
  }

  accounting_.recordPayout(payout);

  PayoutTriggeredEvent triggered;
  triggered.policy_id = policy.id;
  triggered.amount = payout;
  triggered.reason = payoutReason(policy.flight_status);
  triggered.timestamp = nowTimestamp();
  triggered.sequence_id = nextSequence();
  pending.emplace_back(std::move(triggered));

  return payout;
}

// -----------------------------------------------------------------------------
// deliver(): one bool for both failure styles of the rail
// -----------------------------------------------------------------------------
bool PolicyLifecycle::deliver(const domain::AccountId& to,
                              domain::Amount amount, const char* purpose) {
  try {
    return funds_.transfer(to, amount);
  } catch (const std::exception& e) {
    std::cerr << "[PolicyLifecycle] " << purpose << " transfer to '" << to
              << "' threw: " << e.what() << "\n";
    return false;
  }
}

void PolicyLifecycle::requireActive(const domain::Policy& policy) {
  if (policy.status != domain::PolicyStatus::Active) {
    throw StateError(ErrorCode::PolicyNotActive,
                     policyLabel(policy.id) + " is " +
                         domain::policyStatusToString(policy.status));
  }
}

domain::EpochSeconds PolicyLifecycle::nowSeconds() const {
  return ms_to_seconds(clock_.now_ms());
}

Timestamp PolicyLifecycle::nowTimestamp() const {
  return ms_to_timestamp(clock_.now_ms());
}

SequenceId PolicyLifecycle::nextSequence() {
  return next_sequence_.fetch_add(1, std::memory_order_relaxed);
}

void PolicyLifecycle::publishAll(const std::vector<Event>& pending) {
  for (const auto& event : pending) {
    bus_.publish(event);
  }
}

}  // namespace cover
