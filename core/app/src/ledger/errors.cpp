#include "cover/ledger/errors.hpp"

namespace cover {

// -----------------------------------------------------------------------------
// errorCodeName(): stable names used in logs and IPC responses
// -----------------------------------------------------------------------------
const char* errorCodeName(ErrorCode code) {
  using E = ErrorCode;
  switch (code) {
    case E::InvalidPremium:            return "InvalidPremium";
    case E::InvalidSchedule:           return "InvalidSchedule";
    case E::InsufficientCoverageRatio: return "InsufficientCoverageRatio";
    case E::InvalidHolder:             return "InvalidHolder";
    case E::InvalidFlightNumber:       return "InvalidFlightNumber";
    case E::InvalidAmount:             return "InvalidAmount";
    case E::Unauthorized:              return "Unauthorized";
    case E::PolicyNotFound:            return "PolicyNotFound";
    case E::PolicyNotActive:           return "PolicyNotActive";
    case E::AlreadyPaid:               return "AlreadyPaid";
    case E::DelayBelowThreshold:       return "DelayBelowThreshold";
    case E::DepartureAlreadyPassed:    return "DepartureAlreadyPassed";
    case E::DepartureNotPassed:        return "DepartureNotPassed";
    case E::PayoutPending:             return "PayoutPending";
    case E::NoApplicableTier:          return "NoApplicableTier";
    case E::InsufficientPool:          return "InsufficientPool";
    case E::TransferFailed:            return "TransferFailed";
  }
  return "Unknown";
}

}  // namespace cover
