#include "cover/engine/insurance_engine.hpp"
#include "cover/ledger/errors.hpp"
#include "cover/network/json_codec.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <iostream>
#include <utility>

namespace cover {

namespace {

nlohmann::json errorReply(const std::string& message) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = message;
  return j;
}

nlohmann::json idList(const std::vector<domain::PolicyId>& ids) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto id : ids) {
    arr.push_back(id);
  }
  return arr;
}

// Splits "VERB argument" at the first space. The argument keeps any further
// spaces.
std::pair<std::string, std::string> splitCommand(const std::string& cmd) {
  const auto space = cmd.find(' ');
  if (space == std::string::npos) {
    return {cmd, std::string{}};
  }
  return {cmd.substr(0, space), cmd.substr(space + 1)};
}

std::optional<domain::PolicyId> parsePolicyId(const std::string& text) {
  domain::PolicyId id = 0;
  const char* first = text.data();
  const char* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, id);
  if (ec != std::errc{} || ptr != last || text.empty()) {
    return std::nullopt;
  }
  return id;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
InsuranceEngine::InsuranceEngine(const ITimeProvider& clock,
                                 IFundsTransfer& funds, LedgerConfig config)
    : config_(std::move(config)), lifecycle_(bus_, clock, funds, config_) {}

InsuranceEngine::~InsuranceEngine() { stop(); }

// -----------------------------------------------------------------------------
// start(): bring up the IPC surface
// -----------------------------------------------------------------------------
void InsuranceEngine::start() {
  if (running_) {
    return;
  }

  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    auto server = std::make_shared<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
    server->start();
    ipc_server_ = server;

    // The bridge shares ownership: a publish that copied the subscriber list
    // before stop() unsubscribed may still reach it afterwards.
    ipc_bridge_ = bus_.subscribe(
        [sink = std::move(server)](const Event& event) {
          sink->pushEvent(event);
        });
  }

  running_ = true;

  std::cout << "[InsuranceEngine] started. authority=" << config_.authority
            << " threshold=" << config_.payout_threshold << "min"
            << " tiers=" << lifecycle_.payoutTiers().size()
            << (ipc_server_ ? " ipc=on" : " ipc=off") << "\n";
}

// -----------------------------------------------------------------------------
// stop(): detach the bridge, then shut the server down
// -----------------------------------------------------------------------------
void InsuranceEngine::stop() {
  if (!running_) {
    return;
  }

  if (ipc_bridge_) {
    bus_.unsubscribe(*ipc_bridge_);
    ipc_bridge_.reset();
  }
  if (ipc_server_) {
    // Joins the worker here. A late bridge call only enqueues onto the
    // stopped server, which is freed with the last reference.
    ipc_server_->stop();
    ipc_server_.reset();
  }

  running_ = false;

  std::cout << "[InsuranceEngine] stopped. pool_balance="
            << lifecycle_.poolBalance()
            << " policies=" << lifecycle_.policyCount() << "\n";
}

// -----------------------------------------------------------------------------
// executeCommand(): read-only queries
// -----------------------------------------------------------------------------
std::string InsuranceEngine::executeCommand(const std::string& cmd) {
  const auto [verb, arg] = splitCommand(cmd);
  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    const auto totals = lifecycle_.totals();
    response["status"] = "ok";
    response["authority"] = config_.authority;
    response["payout_threshold"] = config_.payout_threshold;
    response["policy_count"] = lifecycle_.policyCount();
    response["pool_balance"] = lifecycle_.poolBalance();
    response["premiums_collected"] = totals.premiums_collected;
    response["payouts_processed"] = totals.payouts_processed;
  } else if (verb == "POLICY") {
    const auto id = parsePolicyId(arg);
    if (!id) {
      return errorReply("POLICY expects a numeric policy id, got '" + arg +
                        "'")
          .dump();
    }
    const auto policy = lifecycle_.policy(*id);
    if (!policy) {
      response = errorReply("policy " + arg + " not found");
      response["code"] = errorCodeName(ErrorCode::PolicyNotFound);
    } else {
      response["status"] = "ok";
      response["policy"] = policyToJson(*policy);
    }
  } else if (verb == "HOLDER") {
    if (arg.empty()) {
      return errorReply("HOLDER expects an account id").dump();
    }
    response["status"] = "ok";
    response["policy_ids"] = idList(lifecycle_.policiesByHolder(arg));
  } else if (verb == "FLIGHT") {
    if (arg.empty()) {
      return errorReply("FLIGHT expects a flight number").dump();
    }
    response["status"] = "ok";
    response["policy_ids"] = idList(lifecycle_.policiesByFlight(arg));
  } else if (verb == "TIERS") {
    response["status"] = "ok";
    response["tiers"] = tiersToJson(lifecycle_.payoutTiers());
  } else {
    response = errorReply("Unknown command: " + cmd);
  }

  return response.dump();
}

}  // namespace cover
