#pragma once

#include "cover/domain/policy.hpp"

#include <atomic>

namespace cover {

// -----------------------------------------------------------------------------
// PolicyIdGenerator - monotonically increasing policy ID source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique policy IDs starting at 1. ID 0 is reserved as the
//         "unset" sentinel and is never returned.
//
// @details
// Policy IDs are never reused, even for cancelled or expired policies. The
// counter is atomic because createPolicy() may run concurrently from several
// caller threads; relaxed ordering is enough since the only requirement is
// uniqueness and monotonicity of the fetch_add sequence.
//
// Ownership:
//   Owned by PolicyLifecycle as a value member. Not copyable or movable:
//   two copies would hand out duplicate IDs.
// -----------------------------------------------------------------------------
class PolicyIdGenerator {
 public:
  PolicyIdGenerator() = default;

  PolicyIdGenerator(const PolicyIdGenerator&) = delete;
  PolicyIdGenerator& operator=(const PolicyIdGenerator&) = delete;
  PolicyIdGenerator(PolicyIdGenerator&&) = delete;
  PolicyIdGenerator& operator=(PolicyIdGenerator&&) = delete;

  // Thread-safety: Safe to call concurrently from any thread.
  domain::PolicyId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Peek at the ID the next call will return. Snapshot only.
  domain::PolicyId peek() const {
    return next_id_.load(std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::PolicyId> next_id_{1};
};

}  // namespace cover
