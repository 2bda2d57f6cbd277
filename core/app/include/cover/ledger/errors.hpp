#pragma once

#include <stdexcept>
#include <string>

namespace cover {

// -----------------------------------------------------------------------------
// ErrorCode - every reason a ledger operation can be rejected
// -----------------------------------------------------------------------------
// Grouped by the exception class that carries it (see below). The grouping is
// what callers should branch on; the code is what they log.
// -----------------------------------------------------------------------------
enum class ErrorCode {
  // ValidationError
  InvalidPremium,
  InvalidSchedule,
  InsufficientCoverageRatio,
  InvalidHolder,
  InvalidFlightNumber,
  InvalidAmount,

  // AuthorizationError
  Unauthorized,

  // StateError
  PolicyNotFound,
  PolicyNotActive,
  AlreadyPaid,
  DelayBelowThreshold,
  DepartureAlreadyPassed,
  DepartureNotPassed,
  PayoutPending,
  NoApplicableTier,

  // ResourceError
  InsufficientPool,

  // TransferFailure
  TransferFailed,
};

const char* errorCodeName(ErrorCode code);

// -----------------------------------------------------------------------------
// LedgerError - base of the ledger error taxonomy
// -----------------------------------------------------------------------------
//
// @brief  Every rejection raised by PolicyLifecycle derives from this class.
//
// @details
// Rejections are synchronous exceptions to the immediate caller. The ledger
// never retries on its own.
//
//   ValidationError     bad input, rejected before any state change
//   AuthorizationError  wrong caller, no state change
//   StateError          policy missing or in the wrong state, no state change
//   ResourceError       pool cannot cover the settlement, no state change,
//                       retryable once the pool is funded
//   TransferFailure     the funds transfer failed after commit; the commit
//                       has been compensated before this is thrown
// -----------------------------------------------------------------------------
class LedgerError : public std::runtime_error {
 public:
  LedgerError(ErrorCode code, const std::string& msg)
      : std::runtime_error(msg), code_(code) {}

  ErrorCode code() const noexcept { return code_; }

 private:
  ErrorCode code_;
};

class ValidationError : public LedgerError {
 public:
  using LedgerError::LedgerError;
};

class AuthorizationError : public LedgerError {
 public:
  explicit AuthorizationError(const std::string& msg)
      : LedgerError(ErrorCode::Unauthorized, msg) {}
};

class StateError : public LedgerError {
 public:
  using LedgerError::LedgerError;
};

class ResourceError : public LedgerError {
 public:
  explicit ResourceError(const std::string& msg)
      : LedgerError(ErrorCode::InsufficientPool, msg) {}
};

class TransferFailure : public LedgerError {
 public:
  explicit TransferFailure(const std::string& msg)
      : LedgerError(ErrorCode::TransferFailed, msg) {}
};

}  // namespace cover
