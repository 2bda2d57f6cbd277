#include "cover/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <limits>
#include <sstream>

namespace cover {

namespace {

using nlohmann::json;

std::uint32_t readUint32(const json& node, const std::string& key) {
  if (!node.is_number_unsigned()) {
    throw ConfigError("'" + key + "' must be a non-negative integer");
  }
  const auto value = node.get<std::uint64_t>();
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    throw ConfigError("'" + key + "' is out of range");
  }
  return static_cast<std::uint32_t>(value);
}

std::string readString(const json& node, const std::string& key) {
  if (!node.is_string()) {
    throw ConfigError("'" + key + "' must be a string");
  }
  return node.get<std::string>();
}

domain::PayoutTier readTier(const json& node, std::size_t index) {
  const std::string where = "payout_tiers[" + std::to_string(index) + "]";
  if (!node.is_object()) {
    throw ConfigError("'" + where + "' must be an object");
  }
  if (!node.contains("min_delay") || !node.contains("multiplier")) {
    throw ConfigError("'" + where + "' needs min_delay and multiplier");
  }

  domain::PayoutTier tier;
  tier.min_delay = readUint32(node.at("min_delay"), where + ".min_delay");
  tier.multiplier = readUint32(node.at("multiplier"), where + ".multiplier");
  tier.max_delay = domain::kMaxDelayMinutes;
  if (node.contains("max_delay") && !node.at("max_delay").is_null()) {
    tier.max_delay = readUint32(node.at("max_delay"), where + ".max_delay");
  }
  return tier;
}

LedgerConfig fromJson(const json& root) {
  if (!root.is_object()) {
    throw ConfigError("configuration root must be a JSON object");
  }

  LedgerConfig config;

  if (root.contains("authority")) {
    config.authority = readString(root.at("authority"), "authority");
    if (config.authority.empty()) {
      throw ConfigError("'authority' must not be empty");
    }
  }
  if (root.contains("payout_threshold_minutes")) {
    config.payout_threshold = readUint32(root.at("payout_threshold_minutes"),
                                          "payout_threshold_minutes");
  }
  if (root.contains("refund_percent")) {
    config.refund_percent =
        readUint32(root.at("refund_percent"), "refund_percent");
    if (config.refund_percent > 100) {
      throw ConfigError("'refund_percent' must be between 0 and 100");
    }
  }
  if (root.contains("payout_tiers")) {
    const json& tiers = root.at("payout_tiers");
    if (!tiers.is_array()) {
      throw ConfigError("'payout_tiers' must be an array");
    }
    config.initial_tiers.clear();
    for (std::size_t i = 0; i < tiers.size(); ++i) {
      config.initial_tiers.push_back(readTier(tiers.at(i), i));
    }
  }
  if (root.contains("ipc")) {
    const json& ipc = root.at("ipc");
    if (!ipc.is_object()) {
      throw ConfigError("'ipc' must be an object");
    }
    if (ipc.contains("cmd_endpoint")) {
      config.ipc_cmd_endpoint =
          readString(ipc.at("cmd_endpoint"), "ipc.cmd_endpoint");
    }
    if (ipc.contains("pub_endpoint")) {
      config.ipc_pub_endpoint =
          readString(ipc.at("pub_endpoint"), "ipc.pub_endpoint");
    }
  }

  return config;
}

}  // namespace

// -----------------------------------------------------------------------------
// loadFromJsonFile()
// -----------------------------------------------------------------------------
LedgerConfig ConfigLoader::loadFromJsonFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file '" + path + "'");
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return loadFromJsonString(buffer.str());
}

// -----------------------------------------------------------------------------
// loadFromJsonString()
// -----------------------------------------------------------------------------
LedgerConfig ConfigLoader::loadFromJsonString(const std::string& json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("malformed config JSON: ") + e.what());
  }
  return fromJson(root);
}

}  // namespace cover
