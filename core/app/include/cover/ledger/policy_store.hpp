#pragma once

#include "cover/concurrent/policy_id_generator.hpp"
#include "cover/domain/policy.hpp"
#include "cover/ledger/errors.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cover {

// -----------------------------------------------------------------------------
// PolicyStore - authoritative policy records and their indexes
// -----------------------------------------------------------------------------
//
// @brief  Owns every Policy record plus two secondary indexes: policy IDs by
//         flight number and policy IDs by holder.
//
// @details
// Records are never removed. Cancelled, expired and claimed policies stay in
// the store and stay listed in both indexes, which are append-only sequences
// in ascending PolicyId order.
//
// Locking is two-level:
//
//   1. map_mutex_ (shared_mutex) guards the record map and the indexes.
//      insert() takes it exclusively; lookups take it shared.
//
//   2. Each record has its own std::mutex. withPolicy() locks only the
//      record, so operations on different policies run in parallel while
//      operations on the same policy serialize. This is the per-record lock
//      that keeps concurrent updateFlightStatus / processPayout /
//      cancelPolicy calls on one policy from interleaving.
//
// Records live behind unique_ptr and are never erased, so a record pointer
// found under the shared map lock stays valid after that lock is released.
//
// PolicyIds are allocated inside insert() under the exclusive map lock. That
// makes ID order, insertion order and index order identical even when
// several callers create policies at once.
//
// Ownership:
//   Owned by PolicyLifecycle. PayoutEngine and LedgerAccounting never see a
//   record; callers only get copies.
// -----------------------------------------------------------------------------
class PolicyStore {
 public:
  PolicyStore() = default;

  PolicyStore(const PolicyStore&) = delete;
  PolicyStore& operator=(const PolicyStore&) = delete;
  PolicyStore(PolicyStore&&) = delete;
  PolicyStore& operator=(PolicyStore&&) = delete;

  // -------------------------------------------------------------------------
  // insert(draft)
  // -------------------------------------------------------------------------
  // @brief  Assigns the next PolicyId to draft, stores it and appends the ID
  //         to the flight and holder indexes.
  //
  // @return The assigned PolicyId (>= 1).
  //
  // Thread-safety: Safe from any thread. Takes the map lock exclusively.
  // -------------------------------------------------------------------------
  domain::PolicyId insert(domain::Policy draft);

  // -------------------------------------------------------------------------
  // withPolicy(id, fn)
  // -------------------------------------------------------------------------
  // @brief  Runs fn(Policy&) while holding the record's lock and returns
  //         whatever fn returns.
  //
  // @details
  // This is the only way to mutate a record. fn must not call back into the
  // store for the same id (the record mutex is not recursive). If fn throws,
  // the lock is released and the exception propagates; fn is responsible
  // for leaving the record consistent.
  //
  // Throws StateError(PolicyNotFound) for an unknown id.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto withPolicy(domain::PolicyId id, Fn&& fn)
      -> decltype(fn(std::declval<domain::Policy&>()));

  // Snapshot copy of one record, std::nullopt for an unknown id.
  std::optional<domain::Policy> policy(domain::PolicyId id) const;

  std::vector<domain::PolicyId> policiesByHolder(
      const domain::AccountId& holder) const;

  std::vector<domain::PolicyId> policiesByFlight(
      const std::string& flight_number) const;

  // Snapshot copies of every record in PolicyId order.
  std::vector<domain::Policy> snapshot() const;

  std::size_t size() const;

 private:
  struct Record {
    std::mutex mutex;
    domain::Policy policy;
  };

  Record* findRecord(domain::PolicyId id) const;

  PolicyIdGenerator id_gen_;

  mutable std::shared_mutex map_mutex_;
  std::unordered_map<domain::PolicyId, std::unique_ptr<Record>> records_;
  std::unordered_map<std::string, std::vector<domain::PolicyId>> by_flight_;
  std::unordered_map<domain::AccountId, std::vector<domain::PolicyId>>
      by_holder_;
};

template <typename Fn>
auto PolicyStore::withPolicy(domain::PolicyId id, Fn&& fn)
    -> decltype(fn(std::declval<domain::Policy&>())) {
  Record* record = findRecord(id);
  if (record == nullptr) {
    throw StateError(ErrorCode::PolicyNotFound,
                     "policy " + std::to_string(id) + " does not exist");
  }
  std::lock_guard lock(record->mutex);
  return fn(record->policy);
}

}  // namespace cover
