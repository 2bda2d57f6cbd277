#pragma once

#include "cover/config/ledger_config.hpp"

#include <stdexcept>
#include <string>

namespace cover {

// Raised for unreadable files, malformed JSON and values of the wrong type or
// out of range. The message names the offending key.
class ConfigError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// -----------------------------------------------------------------------------
// ConfigLoader
// -----------------------------------------------------------------------------
//
// @brief  Builds a LedgerConfig from a JSON document.
//
// @details
// Recognized keys (all optional, a missing key keeps the LedgerConfig
// default):
//
//   {
//     "authority": "oracle-1",
//     "payout_threshold_minutes": 120,
//     "refund_percent": 90,
//     "payout_tiers": [
//       {"min_delay": 120, "max_delay": 240, "multiplier": 200},
//       {"min_delay": 480, "multiplier": 500}          <- open-ended
//     ],
//     "ipc": {"cmd_endpoint": "tcp://...", "pub_endpoint": "tcp://..."}
//   }
//
// A tier without "max_delay" (or with null) is unbounded. An empty IPC
// endpoint string disables the IPC server. Unknown keys are ignored.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  static LedgerConfig loadFromJsonFile(const std::string& path);
  static LedgerConfig loadFromJsonString(const std::string& json_text);
};

}  // namespace cover
