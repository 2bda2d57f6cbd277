#pragma once

#include "cover/config/ledger_config.hpp"
#include "cover/eventbus/event_bus.hpp"
#include "cover/funds/i_funds_transfer.hpp"
#include "cover/lifecycle/policy_lifecycle.hpp"
#include "cover/network/ipc_server.hpp"
#include "cover/time/i_time_provider.hpp"

#include <memory>
#include <optional>
#include <string>

namespace cover {

// -----------------------------------------------------------------------------
// InsuranceEngine
// -----------------------------------------------------------------------------
//
// @brief  Root object of a running ledger. Owns the EventBus, the
//         PolicyLifecycle and the optional IpcServer, and wires them
//         together.
//
// @details
// The ledger itself is live as soon as the engine is constructed:
// lifecycle() may be used before start(). start() only brings up the
// external surface:
//
//   1. Create the IpcServer with executeCommand() as its query handler.
//   2. Bind its sockets and spawn its thread.
//   3. Subscribe a bridge on the EventBus that forwards every Event into
//      the IpcServer's queue.
//
// The IPC surface is read-only. Transactions are submitted in-process through
// lifecycle(), never over the socket.
//
// Thread model:
//   Construct, start() and stop() on one thread (main). lifecycle(),
//   eventBus() and executeCommand() are safe from any thread.
//
// Ownership:
//   InsuranceEngine
//    ├── config_       (LedgerConfig, value)
//    ├── bus_          (EventBus, value)
//    ├── lifecycle_    (PolicyLifecycle, value; references bus_)
//    ├── ipc_server_   (shared_ptr<IpcServer>, created in start(); shared
//    │                 with the EventBus bridge subscriber)
//    ├── clock         (ITimeProvider&, non-owning)
//    └── funds         (IFundsTransfer&, non-owning)
//
//   Declaration order makes bus_ outlive lifecycle_. stop() joins the
//   IpcServer worker before anything it queries goes away.
// -----------------------------------------------------------------------------
class InsuranceEngine {
 public:
  // clock and funds must outlive the engine. An empty IPC endpoint in config
  // disables the IpcServer.
  InsuranceEngine(const ITimeProvider& clock, IFundsTransfer& funds,
                  LedgerConfig config = LedgerConfig{});

  ~InsuranceEngine();

  InsuranceEngine(const InsuranceEngine&) = delete;
  InsuranceEngine& operator=(const InsuranceEngine&) = delete;
  InsuranceEngine(InsuranceEngine&&) = delete;
  InsuranceEngine& operator=(InsuranceEngine&&) = delete;

  // Idempotent. Propagates zmq::error_t when an endpoint cannot be bound.
  void start();

  // Idempotent. After stop() the ledger keeps its state; start() may be
  // called again.
  void stop();

  bool isRunning() const { return running_; }

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  //
  // @brief  Answers one read-only query and returns a JSON document.
  //
  // @details
  // Supported queries:
  //   "PING"            → {"status":"ok","response":"PONG"}
  //   "STATUS"          → {"status":"ok","authority":..,"policy_count":..,
  //                        "pool_balance":..,"premiums_collected":..,
  //                        "payouts_processed":..,"payout_threshold":..}
  //   "POLICY <id>"     → {"status":"ok","policy":{...}}
  //   "HOLDER <acct>"   → {"status":"ok","policy_ids":[...]}
  //   "FLIGHT <number>" → {"status":"ok","policy_ids":[...]}
  //   "TIERS"           → {"status":"ok","tiers":[...]}
  //   other / bad args  → {"status":"error","response":"..."}
  //
  // An unknown policy id answers {"status":"error","code":"PolicyNotFound"}.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  PolicyLifecycle& lifecycle() { return lifecycle_; }
  const PolicyLifecycle& lifecycle() const { return lifecycle_; }

  EventBus& eventBus() { return bus_; }

 private:
  const LedgerConfig config_;
  EventBus bus_;
  PolicyLifecycle lifecycle_;

  std::shared_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> ipc_bridge_;

  bool running_{false};
};

}  // namespace cover
