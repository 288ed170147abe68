#pragma once

#include "flatguard/broker/account_registry.hpp"
#include "flatguard/broker/retry_policy.hpp"
#include "flatguard/domain/dca_config.hpp"
#include "flatguard/domain/instrument.hpp"
#include "flatguard/exit/exit_state_machine.hpp"
#include "flatguard/exit/kill_switch.hpp"
#include "flatguard/reconcile/drift_reconciler.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace flatguard {

struct Endpoints {
  std::string market_data;    // SUB, JSON ticks; empty disables
  std::string ipc_command;    // REP, JSON commands; empty disables IPC
  std::string ipc_telemetry;  // PUB, JSON telemetry
};

// -----------------------------------------------------------------------------
// EngineConfig — everything TradingEngine needs, loaded from one JSON file
// -----------------------------------------------------------------------------
//
// @brief  Plain settings aggregate. Defaults produce a working single-account
//         simulated engine, so every section of the file is optional.
//
// @details
// File layout (all keys optional):
//   {
//     "instruments":  { "MES": { "tick_size": 0.25, "multiplier": 5 } },
//     "accounts":     [ { "account_id": "SIM1", "auth_token": "t1",
//                         "environment": "simulated" } ],
//     "rate_limits":  { "t1": { "capacity": 10, "refill_per_second": 5 } },
//     "retry":        { "max_attempts": 3, "initial_backoff_ms": 50,
//                       "max_backoff_ms": 500 },
//     "timing":       { "confirm_poll_interval_ms": 50,
//                       "confirm_timeout_ms": 2000,
//                       "kill_switch_deadline_ms": 750,
//                       "reconcile_interval_ms": 5000,
//                       "pending_order_grace_ms": 2000 },
//     "rejected_exit_policy": "manual",
//     "dca":          { "MES": { "mode": "TICKS", "rungs": [...], ... } },
//     "shards": 2, "worker_threads": 4,
//     "state_dir": "state",
//     "endpoints":    { "market_data": "tcp://127.0.0.1:5555",
//                       "ipc_command": "tcp://127.0.0.1:5556",
//                       "ipc_telemetry": "tcp://127.0.0.1:5557" }
//   }
//
// Every loader error, JSON or semantic, surfaces as ConfigError.
// -----------------------------------------------------------------------------
struct EngineConfig {
  domain::InstrumentTable instruments;

  std::vector<AccountSession> accounts;
  std::map<std::string, RateLimit> rate_limits;
  RateLimit default_rate_limit;

  RetrySettings retry;
  ExitSettings exit;
  KillSwitchSettings kill_switch;
  ReconcileSettings reconcile;
  std::int64_t reconcile_interval_ms{5000};

  std::map<domain::Symbol, domain::DcaConfig> dca_defaults;

  std::size_t shards{2};
  std::size_t worker_threads{4};

  // Empty keeps state in memory only.
  std::string state_dir;

  Endpoints endpoints;

  static EngineConfig fromJson(const nlohmann::json& j);
  static EngineConfig fromFile(const std::string& path);

  // Throws ConfigError on the first problem found.
  void validate() const;
};

}  // namespace flatguard
