#include "cover/ledger/policy_store.hpp"

#include <algorithm>
#include <utility>

namespace cover {

// -----------------------------------------------------------------------------
// insert(): allocate id, store record, append to both indexes
// -----------------------------------------------------------------------------
domain::PolicyId PolicyStore::insert(domain::Policy draft) {
  std::unique_lock lock(map_mutex_);

  const domain::PolicyId id = id_gen_.next_id();
  draft.id = id;

  by_flight_[draft.flight_number].push_back(id);
  by_holder_[draft.holder].push_back(id);

  auto record = std::make_unique<Record>();
  record->policy = std::move(draft);
  records_.emplace(id, std::move(record));

  return id;
}

// -----------------------------------------------------------------------------
// findRecord(): shared map lock only; the record itself is not locked
// -----------------------------------------------------------------------------
PolicyStore::Record* PolicyStore::findRecord(domain::PolicyId id) const {
  std::shared_lock lock(map_mutex_);
  auto it = records_.find(id);
  return it == records_.end() ? nullptr : it->second.get();
}

std::optional<domain::Policy> PolicyStore::policy(domain::PolicyId id) const {
  Record* record = findRecord(id);
  if (record == nullptr) {
    return std::nullopt;
  }
  std::lock_guard lock(record->mutex);
  return record->policy;
}

std::vector<domain::PolicyId> PolicyStore::policiesByHolder(
    const domain::AccountId& holder) const {
  std::shared_lock lock(map_mutex_);
  auto it = by_holder_.find(holder);
  if (it == by_holder_.end()) {
    return {};
  }
  return it->second;
}

std::vector<domain::PolicyId> PolicyStore::policiesByFlight(
    const std::string& flight_number) const {
  std::shared_lock lock(map_mutex_);
  auto it = by_flight_.find(flight_number);
  if (it == by_flight_.end()) {
    return {};
  }
  return it->second;
}

// -----------------------------------------------------------------------------
// snapshot(): copy every record, each under its own lock
// -----------------------------------------------------------------------------
std::vector<domain::Policy> PolicyStore::snapshot() const {
  std::vector<Record*> records;
  {
    std::shared_lock lock(map_mutex_);
    records.reserve(records_.size());
    for (const auto& entry : records_) {
      records.push_back(entry.second.get());
    }
  }

  std::vector<domain::Policy> out;
  out.reserve(records.size());
  for (Record* record : records) {
    std::lock_guard lock(record->mutex);
    out.push_back(record->policy);
  }

  std::sort(out.begin(), out.end(),
            [](const domain::Policy& a, const domain::Policy& b) {
              return a.id < b.id;
            });
  return out;
}

std::size_t PolicyStore::size() const {
  std::shared_lock lock(map_mutex_);
  return records_.size();
}

}  // namespace cover
