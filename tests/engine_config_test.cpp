// =============================================================================
// engine_config_test.cpp
// =============================================================================
// Unit tests for flatguard::EngineConfig.
//
// Validates:
//   - An empty document yields a working simulated configuration
//   - Every section of the file overrides its defaults
//   - JSON type errors and semantic errors both surface as ConfigError
//   - fromFile() reports unreadable files as ConfigError
// =============================================================================

#include "flatguard/config/engine_config.hpp"
#include "flatguard/domain/errors.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <filesystem>
#include <fstream>

using flatguard::ConfigError;
using flatguard::EngineConfig;
using nlohmann::json;

// -----------------------------------------------------------------------------
// 1. Defaults: valid, with the CME index contracts pre-loaded.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, EmptyDocumentUsesDefaults) {
  const EngineConfig config = EngineConfig::fromJson(json::object());

  EXPECT_EQ(config.shards, 2u);
  EXPECT_EQ(config.worker_threads, 4u);
  EXPECT_TRUE(config.state_dir.empty());
  EXPECT_TRUE(config.endpoints.ipc_command.empty());
  EXPECT_EQ(config.exit.rejected_exit_policy,
            flatguard::RejectedExitPolicy::RequireManualClear);

  const auto es = config.instruments.lookup("ES");
  EXPECT_DOUBLE_EQ(es.tick_size, 0.25);
  EXPECT_DOUBLE_EQ(es.multiplier, 50.0);

  // Unknown symbols trade like plain equities.
  const auto equity = config.instruments.lookup("AAPL");
  EXPECT_DOUBLE_EQ(equity.tick_size, 0.01);
  EXPECT_DOUBLE_EQ(equity.multiplier, 1.0);
}

// -----------------------------------------------------------------------------
// 2. A full document: each section lands where TradingEngine reads it.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, FullDocumentOverridesEverySection) {
  const json doc = json::parse(R"({
    "instruments": { "MES": { "multiplier": 5.5 }, "CL": { "tick_size": 0.01, "multiplier": 1000 } },
    "accounts": [
      { "account_id": "A1", "auth_token": "t1" },
      { "account_id": "A2", "auth_token": "t1", "environment": "live" }
    ],
    "rate_limits": { "default": { "capacity": 4, "refill_per_second": 2 },
                     "t1": { "capacity": 20 } },
    "retry": { "max_attempts": 5, "initial_backoff_ms": 20, "max_backoff_ms": 80 },
    "timing": { "confirm_poll_interval_ms": 25, "confirm_timeout_ms": 1000,
                "kill_switch_deadline_ms": 600, "reconcile_interval_ms": 3000,
                "pending_order_grace_ms": 1500 },
    "rejected_exit_policy": "retry_once",
    "dca": { "MES": { "mode": "ATR", "rungs": [ { "distance": 1.0, "quantity": 1 },
                                                 { "distance": 2.0, "quantity": 2 } ],
                      "max_quantity": 5, "take_profit_ticks": 8, "stop_loss_ticks": 40 } },
    "shards": 4, "worker_threads": 2, "state_dir": "/var/lib/flatguard",
    "endpoints": { "market_data": "tcp://127.0.0.1:5555",
                   "ipc_command": "tcp://127.0.0.1:5556",
                   "ipc_telemetry": "tcp://127.0.0.1:5557" }
  })");

  const EngineConfig config = EngineConfig::fromJson(doc);

  EXPECT_DOUBLE_EQ(config.instruments.lookup("MES").tick_size, 0.25);
  EXPECT_DOUBLE_EQ(config.instruments.lookup("MES").multiplier, 5.5);
  EXPECT_DOUBLE_EQ(config.instruments.lookup("CL").multiplier, 1000.0);

  ASSERT_EQ(config.accounts.size(), 2u);
  EXPECT_EQ(config.accounts[1].environment, flatguard::BrokerEnvironment::Live);
  EXPECT_DOUBLE_EQ(config.default_rate_limit.capacity, 4.0);
  EXPECT_DOUBLE_EQ(config.rate_limits.at("t1").capacity, 20.0);
  EXPECT_DOUBLE_EQ(config.rate_limits.at("t1").refill_per_second, 2.0);

  EXPECT_EQ(config.retry.max_attempts, 5);
  EXPECT_EQ(config.exit.confirm_poll_interval_ms, 25);
  EXPECT_EQ(config.exit.confirm_timeout_ms, 1000);
  EXPECT_EQ(config.kill_switch.deadline_ms, 600);
  EXPECT_EQ(config.reconcile_interval_ms, 3000);
  EXPECT_EQ(config.reconcile.pending_order_grace_ms, 1500);
  EXPECT_EQ(config.exit.rejected_exit_policy,
            flatguard::RejectedExitPolicy::RetryOnce);

  const auto& dca = config.dca_defaults.at("MES");
  EXPECT_EQ(dca.mode, flatguard::domain::DcaTriggerMode::Atr);
  ASSERT_EQ(dca.rungs.size(), 2u);
  EXPECT_EQ(dca.stop_loss_ticks, 40);

  EXPECT_EQ(config.shards, 4u);
  EXPECT_EQ(config.state_dir, "/var/lib/flatguard");
  EXPECT_EQ(config.endpoints.ipc_telemetry, "tcp://127.0.0.1:5557");
}

// -----------------------------------------------------------------------------
// 3. Every kind of bad input is a ConfigError, never a raw json exception.
// Why: main() reports ConfigError and exits cleanly; anything else would
//      escape as an unhandled exception.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, InvalidDocumentsAreConfigErrors) {
  const char* bad[] = {
      R"([1, 2, 3])",
      R"({"shards": "two"})",
      R"({"shards": 0})",
      R"({"accounts": [{"account_id": "A1", "environment": "paper"}]})",
      R"({"accounts": [{"account_id": "A1"}, {"account_id": "A1"}]})",
      R"({"rejected_exit_policy": "pray"})",
      R"({"instruments": {"ES": {"tick_size": 0}}})",
      R"({"retry": {"max_attempts": 0}})",
      R"({"timing": {"confirm_poll_interval_ms": 100, "confirm_timeout_ms": 50}})",
      R"({"rate_limits": {"t1": {"refill_per_second": 0}}})",
      R"({"dca": {"MES": {"rungs": [{"distance": 2, "quantity": 1},
                                    {"distance": 1, "quantity": 1}]}}})",
      R"({"dca": {"MES": {"mode": "FIBONACCI"}}})",
  };
  for (const char* text : bad) {
    EXPECT_THROW(EngineConfig::fromJson(json::parse(text)), ConfigError) << text;
  }
}

// -----------------------------------------------------------------------------
// 4. fromFile(): missing and unparsable files are ConfigError too.
// -----------------------------------------------------------------------------
TEST(EngineConfigTest, FromFileReportsUnreadableFiles) {
  const auto path =
      std::filesystem::temp_directory_path() / "flatguard_config_test.json";

  EXPECT_THROW(EngineConfig::fromFile((path.string() + ".missing")), ConfigError);

  {
    std::ofstream out(path, std::ios::trunc);
    out << "{ \"shards\": 3, ";
  }
  EXPECT_THROW(EngineConfig::fromFile(path.string()), ConfigError);

  {
    std::ofstream out(path, std::ios::trunc);
    out << R"({ "shards": 3 })";
  }
  EXPECT_EQ(EngineConfig::fromFile(path.string()).shards, 3u);
  std::remove(path.string().c_str());
}
