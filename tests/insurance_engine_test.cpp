// =============================================================================
// insurance_engine_test.cpp
// =============================================================================
// Unit tests for cover::InsuranceEngine.
//
// Validates:
//   - Lifecycle: start() / stop() / destructor, idempotent
//   - executeCommand() answers every read-only query with JSON
//   - Ledger operations through lifecycle() reach eventBus() subscribers
//   - With IPC enabled: REQ/REP queries and PUB event broadcast over
//     loopback TCP
//   - stop() is safe while other threads publish ledger events
// =============================================================================

#include "cover/engine/insurance_engine.hpp"
#include "cover/funds/mock_funds_transfer.hpp"
#include "cover/time/simulation_time_provider.hpp"
#include "cover/time/time_utils.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using nlohmann::json;

namespace {

constexpr cover::domain::EpochSeconds kNow = 1'700'000'000;
constexpr cover::domain::EpochSeconds kDeparture = kNow + 7200;

cover::LedgerConfig offlineConfig() {
  cover::LedgerConfig config;
  config.ipc_cmd_endpoint.clear();
  config.ipc_pub_endpoint.clear();
  return config;
}

}  // namespace

class InsuranceEngineTest : public ::testing::Test {
 protected:
  json query(const std::string& cmd) {
    return json::parse(engine.executeCommand(cmd));
  }

  cover::SimulationTimeProvider clock{cover::seconds_to_ms(kNow)};
  cover::MockFundsTransfer funds;
  cover::InsuranceEngine engine{clock, funds, offlineConfig()};
};

// -----------------------------------------------------------------------------
// 1. start()/stop() are idempotent and the destructor cleans up.
// -----------------------------------------------------------------------------
TEST_F(InsuranceEngineTest, StartStopIdempotent) {
  EXPECT_NO_THROW(engine.stop());
  EXPECT_FALSE(engine.isRunning());

  engine.start();
  engine.start();
  EXPECT_TRUE(engine.isRunning());

  engine.stop();
  engine.stop();
  EXPECT_FALSE(engine.isRunning());
}

TEST_F(InsuranceEngineTest, PingAndUnknownCommand) {
  EXPECT_EQ(query("PING").at("response"), "PONG");

  const json unknown = query("PAY 1");
  EXPECT_EQ(unknown.at("status"), "error");
  EXPECT_NE(unknown.at("response").get<std::string>().find("PAY 1"),
            std::string::npos);
}

// -----------------------------------------------------------------------------
// 2. STATUS reflects pool and totals after ledger activity.
// -----------------------------------------------------------------------------
TEST_F(InsuranceEngineTest, StatusReportsPoolAndTotals) {
  auto& ledger = engine.lifecycle();
  ledger.fundPool(1'000, "authority");
  const auto id = ledger.createPolicy("alice", "BA117", kDeparture, 500, 100);
  ledger.updateFlightStatus(id, cover::domain::FlightStatus::Delayed,
                            kDeparture + 130 * 60, "authority");

  const json status = query("STATUS");
  EXPECT_EQ(status.at("status"), "ok");
  EXPECT_EQ(status.at("authority"), "authority");
  EXPECT_EQ(status.at("policy_count"), 1u);
  EXPECT_EQ(status.at("pool_balance"), 900u);
  EXPECT_EQ(status.at("premiums_collected"), 100u);
  EXPECT_EQ(status.at("payouts_processed"), 200u);
  EXPECT_EQ(status.at("payout_threshold"), 120u);
}

// -----------------------------------------------------------------------------
// 3. POLICY / HOLDER / FLIGHT / TIERS queries.
// -----------------------------------------------------------------------------
TEST_F(InsuranceEngineTest, PolicyQueries) {
  auto& ledger = engine.lifecycle();
  const auto a = ledger.createPolicy("alice", "BA117", kDeparture, 500, 100);
  const auto b = ledger.createPolicy("bob", "BA117", kDeparture, 500, 100);

  const json policy = query("POLICY " + std::to_string(a));
  ASSERT_EQ(policy.at("status"), "ok");
  EXPECT_EQ(policy.at("policy").at("holder"), "alice");
  EXPECT_EQ(policy.at("policy").at("status"), "Active");

  const json holder = query("HOLDER bob");
  EXPECT_EQ(holder.at("policy_ids"), json::array({b}));

  const json flight = query("FLIGHT BA117");
  EXPECT_EQ(flight.at("policy_ids"), json::array({a, b}));

  EXPECT_TRUE(query("FLIGHT ZZ999").at("policy_ids").empty());

  const json tiers = query("TIERS");
  ASSERT_EQ(tiers.at("tiers").size(), 3u);
  EXPECT_EQ(tiers.at("tiers")[2].at("multiplier"), 500u);
}

TEST_F(InsuranceEngineTest, BadQueryArguments) {
  const json missing = query("POLICY 42");
  EXPECT_EQ(missing.at("status"), "error");
  EXPECT_EQ(missing.at("code"), "PolicyNotFound");

  EXPECT_EQ(query("POLICY abc").at("status"), "error");
  EXPECT_EQ(query("POLICY").at("status"), "error");
  EXPECT_EQ(query("POLICY 1x").at("status"), "error");
  EXPECT_EQ(query("HOLDER").at("status"), "error");
  EXPECT_EQ(query("FLIGHT").at("status"), "error");
}

// -----------------------------------------------------------------------------
// 4. Ledger events reach subscribers on the engine's bus.
// -----------------------------------------------------------------------------
TEST_F(InsuranceEngineTest, EventBusCarriesLedgerEvents) {
  int created = 0;
  engine.eventBus().subscribe<cover::PolicyCreatedEvent>(
      [&created](const cover::PolicyCreatedEvent&) { ++created; });

  engine.lifecycle().createPolicy("alice", "BA117", kDeparture, 500, 100);
  EXPECT_EQ(created, 1);
}

// -----------------------------------------------------------------------------
// 5. End to end over loopback TCP: queries on REP, events on PUB.
// -----------------------------------------------------------------------------
TEST(InsuranceEngineIpcTest, QueriesAndBroadcastOverZmq) {
  cover::SimulationTimeProvider clock{cover::seconds_to_ms(kNow)};
  cover::MockFundsTransfer funds;

  cover::LedgerConfig config;
  config.ipc_cmd_endpoint = "tcp://127.0.0.1:25556";
  config.ipc_pub_endpoint = "tcp://127.0.0.1:25557";

  cover::InsuranceEngine engine(clock, funds, config);
  engine.start();

  zmq::context_t ctx(1);
  zmq::socket_t req(ctx, zmq::socket_type::req);
  zmq::socket_t sub(ctx, zmq::socket_type::sub);
  req.set(zmq::sockopt::rcvtimeo, 2000);
  req.set(zmq::sockopt::linger, 0);
  sub.set(zmq::sockopt::rcvtimeo, 2000);
  sub.set(zmq::sockopt::linger, 0);
  sub.set(zmq::sockopt::subscribe, "");
  req.connect(config.ipc_cmd_endpoint);
  sub.connect(config.ipc_pub_endpoint);

  // PUB drops messages until the subscription has propagated.
  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  const std::string ping = "PING";
  req.send(zmq::buffer(ping), zmq::send_flags::none);
  zmq::message_t reply;
  ASSERT_TRUE(req.recv(reply, zmq::recv_flags::none).has_value())
      << "no reply to PING";
  EXPECT_EQ(json::parse(reply.to_string()).at("response"), "PONG");

  const auto id =
      engine.lifecycle().createPolicy("alice", "BA117", kDeparture, 500, 100);

  zmq::message_t broadcast;
  ASSERT_TRUE(sub.recv(broadcast, zmq::recv_flags::none).has_value())
      << "no event broadcast";
  const json event = json::parse(broadcast.to_string());
  EXPECT_EQ(event.at("type"), "policy_created");
  EXPECT_EQ(event.at("policy_id"), id);

  engine.stop();
}

// -----------------------------------------------------------------------------
// 6. stop() while another thread keeps publishing ledger events.
// -----------------------------------------------------------------------------
TEST(InsuranceEngineIpcTest, StopWhileLedgerPublishes) {
  cover::SimulationTimeProvider clock{cover::seconds_to_ms(kNow)};
  cover::MockFundsTransfer funds;

  cover::LedgerConfig config;
  config.ipc_cmd_endpoint = "tcp://127.0.0.1:25558";
  config.ipc_pub_endpoint = "tcp://127.0.0.1:25559";

  cover::InsuranceEngine engine(clock, funds, config);
  const auto baseline = engine.eventBus().subscriberCount();

  for (int cycle = 0; cycle < 5; ++cycle) {
    engine.start();
    ASSERT_EQ(engine.eventBus().subscriberCount(), baseline + 1);

    std::atomic<bool> done{false};
    std::thread writer([&engine, &done, cycle] {
      const std::string holder = "holder-" + std::to_string(cycle);
      while (!done.load()) {
        engine.lifecycle().createPolicy(holder, "BA117", kDeparture, 500, 100);
      }
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    engine.stop();
    EXPECT_EQ(engine.eventBus().subscriberCount(), baseline);

    // Keeps publishing with the bridge gone.
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    done.store(true);
    writer.join();
  }

  EXPECT_GT(engine.lifecycle().policyCount(), 0u);
}
