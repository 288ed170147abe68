#include "flatguard/config/engine_config.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/persistence/json_codec.hpp"

#include <fstream>
#include <iostream>

namespace flatguard {

namespace {

BrokerEnvironment parseEnvironment(const std::string& text) {
  if (text == "simulated") return BrokerEnvironment::Simulated;
  if (text == "live") return BrokerEnvironment::Live;
  throw ConfigError("invalid account environment: '" + text + "'");
}

RateLimit parseRateLimit(const nlohmann::json& j, RateLimit fallback) {
  RateLimit limit = fallback;
  limit.capacity = j.value("capacity", limit.capacity);
  limit.refill_per_second = j.value("refill_per_second", limit.refill_per_second);
  return limit;
}

void readTiming(const nlohmann::json& j, EngineConfig& config) {
  config.exit.confirm_poll_interval_ms =
      j.value("confirm_poll_interval_ms", config.exit.confirm_poll_interval_ms);
  config.exit.confirm_timeout_ms =
      j.value("confirm_timeout_ms", config.exit.confirm_timeout_ms);
  config.kill_switch.deadline_ms =
      j.value("kill_switch_deadline_ms", config.kill_switch.deadline_ms);
  config.kill_switch.poll_interval_ms =
      j.value("kill_switch_poll_interval_ms", config.kill_switch.poll_interval_ms);
  config.reconcile_interval_ms =
      j.value("reconcile_interval_ms", config.reconcile_interval_ms);
  config.reconcile.pending_order_grace_ms =
      j.value("pending_order_grace_ms", config.reconcile.pending_order_grace_ms);
}

}  // namespace

// -----------------------------------------------------------------------------
// fromJson: read every section over the defaults, then validate
// -----------------------------------------------------------------------------
EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
  EngineConfig config;
  try {
    if (!j.is_object()) {
      throw ConfigError("config root must be a JSON object");
    }

    if (j.contains("instruments")) {
      const nlohmann::json& instruments = j.at("instruments");
      for (const auto& item : instruments.items()) {
        domain::InstrumentSpec spec = config.instruments.lookup(item.key());
        spec.tick_size = item.value().value("tick_size", spec.tick_size);
        spec.multiplier = item.value().value("multiplier", spec.multiplier);
        config.instruments.upsert(spec);
      }
    }

    if (j.contains("accounts")) {
      for (const nlohmann::json& entry : j.at("accounts")) {
        AccountSession session;
        session.account_id = entry.at("account_id").get<std::string>();
        session.auth_token =
            entry.value("auth_token", session.account_id);
        session.environment =
            parseEnvironment(entry.value("environment", std::string("simulated")));
        config.accounts.push_back(session);
      }
    }

    if (j.contains("rate_limits")) {
      const nlohmann::json& limits = j.at("rate_limits");
      for (const auto& item : limits.items()) {
        if (item.key() == "default") {
          config.default_rate_limit =
              parseRateLimit(item.value(), config.default_rate_limit);
        } else {
          config.rate_limits[item.key()] =
              parseRateLimit(item.value(), config.default_rate_limit);
        }
      }
    }

    if (j.contains("retry")) {
      const nlohmann::json& retry = j.at("retry");
      config.retry.max_attempts =
          retry.value("max_attempts", config.retry.max_attempts);
      config.retry.initial_backoff_ms =
          retry.value("initial_backoff_ms", config.retry.initial_backoff_ms);
      config.retry.max_backoff_ms =
          retry.value("max_backoff_ms", config.retry.max_backoff_ms);
    }

    if (j.contains("timing")) {
      readTiming(j.at("timing"), config);
    }

    if (j.contains("rejected_exit_policy")) {
      const std::string text = j.at("rejected_exit_policy").get<std::string>();
      std::optional<RejectedExitPolicy> policy = parseRejectedExitPolicy(text);
      if (!policy) {
        throw ConfigError("invalid rejected_exit_policy: '" + text + "'");
      }
      config.exit.rejected_exit_policy = *policy;
    }

    if (j.contains("dca")) {
      const nlohmann::json& dca = j.at("dca");
      for (const auto& item : dca.items()) {
        config.dca_defaults[item.key()] = item.value().get<domain::DcaConfig>();
      }
    }

    config.shards = j.value("shards", config.shards);
    config.worker_threads = j.value("worker_threads", config.worker_threads);
    config.state_dir = j.value("state_dir", config.state_dir);

    if (j.contains("endpoints")) {
      const nlohmann::json& endpoints = j.at("endpoints");
      config.endpoints.market_data =
          endpoints.value("market_data", config.endpoints.market_data);
      config.endpoints.ipc_command =
          endpoints.value("ipc_command", config.endpoints.ipc_command);
      config.endpoints.ipc_telemetry =
          endpoints.value("ipc_telemetry", config.endpoints.ipc_telemetry);
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("malformed config: ") + e.what());
  }

  config.validate();
  return config;
}

EngineConfig EngineConfig::fromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("cannot open config file " + path);
  }
  nlohmann::json j;
  try {
    in >> j;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError("cannot parse " + path + ": " + e.what());
  }
  std::cout << "[EngineConfig] loaded " << path << "\n";
  return fromJson(j);
}

// -----------------------------------------------------------------------------
// validate
// -----------------------------------------------------------------------------
void EngineConfig::validate() const {
  for (const domain::InstrumentSpec& spec : instruments.all()) {
    if (spec.tick_size <= 0.0 || spec.multiplier <= 0.0) {
      throw ConfigError("instrument " + spec.symbol +
                        ": tick_size and multiplier must be positive");
    }
  }

  std::map<domain::AccountId, int> seen;
  for (const AccountSession& session : accounts) {
    if (session.account_id.empty()) {
      throw ConfigError("account_id must not be empty");
    }
    if (++seen[session.account_id] > 1) {
      throw ConfigError("duplicate account " + session.account_id);
    }
  }

  auto checkLimit = [](const std::string& name, const RateLimit& limit) {
    if (limit.capacity < 1.0 || limit.refill_per_second <= 0.0) {
      throw ConfigError("rate limit " + name +
                        ": capacity >= 1 and refill_per_second > 0 required");
    }
  };
  checkLimit("default", default_rate_limit);
  for (const auto& [token, limit] : rate_limits) {
    checkLimit(token, limit);
  }

  if (retry.max_attempts < 1 || retry.initial_backoff_ms < 0 ||
      retry.max_backoff_ms < retry.initial_backoff_ms) {
    throw ConfigError("retry: max_attempts >= 1 and 0 <= initial <= max backoff");
  }

  if (exit.confirm_poll_interval_ms <= 0 ||
      exit.confirm_timeout_ms < exit.confirm_poll_interval_ms) {
    throw ConfigError(
        "timing: confirm_poll_interval_ms > 0 and confirm_timeout_ms >= it");
  }
  if (kill_switch.deadline_ms <= 0 || kill_switch.poll_interval_ms <= 0) {
    throw ConfigError("timing: kill switch deadline and poll interval must be positive");
  }
  if (reconcile_interval_ms <= 0 || reconcile.pending_order_grace_ms < 0) {
    throw ConfigError("timing: reconcile_interval_ms must be positive");
  }

  for (const auto& [symbol, dca] : dca_defaults) {
    try {
      domain::validateDcaConfig(dca);
    } catch (const ConfigError& e) {
      throw ConfigError("dca " + symbol + ": " + e.what());
    }
  }

  if (shards == 0) {
    throw ConfigError("shards must be at least 1");
  }
  if (worker_threads == 0) {
    throw ConfigError("worker_threads must be at least 1");
  }
}

}  // namespace flatguard
