// -----------------------------------------------------------------------------
// flightcover - single executable entry point.
//
//   1) Load LedgerConfig (JSON file from argv[1], defaults otherwise).
//   2) Create the wall clock and the funds rail.
//   3) Create the InsuranceEngine, subscribe an event logger, start it. The
//      IpcServer then broadcasts every ledger event and answers queries.
//   4) Idle until SIGINT/SIGTERM, then shut down cleanly.
//
// The funds rail here is the in-process MockFundsTransfer; a deployment
// replaces it with an IFundsTransfer bound to its payment system.
// -----------------------------------------------------------------------------

#include "cover/config/config_loader.hpp"
#include "cover/engine/insurance_engine.hpp"
#include "cover/funds/mock_funds_transfer.hpp"
#include "cover/network/json_codec.hpp"
#include "cover/time/live_time_provider.hpp"

#include <zmq.hpp>

#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

namespace {

// Set from the signal handler, polled by main().
volatile std::sig_atomic_t g_shutdown_requested = 0;

void shutdown_handler(int /*signum*/) { g_shutdown_requested = 1; }

}  // namespace

int main(int argc, char* argv[]) {
  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  cover::LedgerConfig config;
  if (argc > 1) {
    try {
      config = cover::ConfigLoader::loadFromJsonFile(argv[1]);
    } catch (const cover::ConfigError& e) {
      std::cerr << "[main] " << e.what() << "\n";
      return 1;
    }
    std::cout << "[main] Loaded config from " << argv[1] << "\n";
  }

  // -------------------------------------------------------------------------
  // 2) Clock and funds rail
  // -------------------------------------------------------------------------
  cover::LiveTimeProvider clock;
  cover::MockFundsTransfer funds;

  // -------------------------------------------------------------------------
  // 3) Engine
  // -------------------------------------------------------------------------
  cover::InsuranceEngine engine(clock, funds, config);

  // Runs on whichever thread committed the transition.
  engine.eventBus().subscribe([](const cover::Event& e) {
    std::cout << "[Ledger] " << cover::eventToJson(e).dump() << "\n";
  });

  try {
    engine.start();
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] Failed to bind IPC endpoints: " << e.what() << "\n";
    return 1;
  }

  // -------------------------------------------------------------------------
  // 4) Wait for shutdown
  // -------------------------------------------------------------------------
  std::signal(SIGINT, shutdown_handler);
  std::signal(SIGTERM, shutdown_handler);

  std::cout << "[main] Ledger running. Press Ctrl-C to shut down.\n";
  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "[main] Shutdown requested. Stopping engine...\n";
  engine.stop();

  return 0;
}
