// -----------------------------------------------------------------------------
// flatguard_engine — single executable entry point.
//
//   1) Load EngineConfig (--config <path>, default flatguard.json; without
//      the flag a missing default file means built-in defaults).
//   2) Open the state store: JSON files under state_dir, or memory only.
//   3) Create the broker. This build ships the simulated paper broker; an
//      account configured as "live" is a configuration error.
//   4) Start the TradingEngine (recovery, shards, IPC, market data).
//   5) Wait for SIGINT/SIGTERM, then shut down cleanly.
//
// Thread layout:
//   main thread         → waits for the stop signal
//   shard-N threads     → one PositionDesk each
//   worker threads      → kill-switch broker calls
//   timer thread        → confirmation polls, reconcile ticks
//   market data thread  → ZMQ SUB recv loop
//   ipc thread          → ZMQ REP commands + PUB telemetry
// -----------------------------------------------------------------------------

#include "flatguard/broker/simulated_broker.hpp"
#include "flatguard/config/engine_config.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/engine/trading_engine.hpp"
#include "flatguard/persistence/in_memory_state_store.hpp"
#include "flatguard/persistence/json_file_state_store.hpp"
#include "flatguard/time/live_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

namespace {

std::atomic<bool> g_stop_requested{false};

void stop_handler(int /*signum*/) { g_stop_requested.store(true); }

struct Options {
  std::string config_path{"flatguard.json"};
  bool config_given{false};
};

Options parseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      options.config_path = argv[++i];
      options.config_given = true;
    } else {
      throw flatguard::ConfigError("unknown argument: " + arg +
                                   " (usage: flatguard_engine [--config <path>])");
    }
  }
  return options;
}

flatguard::EngineConfig loadConfig(const Options& options) {
  if (!options.config_given && !std::ifstream(options.config_path)) {
    std::cout << "[main] " << options.config_path
              << " not found, using built-in defaults\n";
    flatguard::EngineConfig config;
    config.accounts.push_back({"SIM1", "sim-token",
                               flatguard::BrokerEnvironment::Simulated});
    config.endpoints.market_data = "tcp://127.0.0.1:5555";
    config.endpoints.ipc_command = "tcp://127.0.0.1:5556";
    config.endpoints.ipc_telemetry = "tcp://127.0.0.1:5557";
    return config;
  }
  return flatguard::EngineConfig::fromFile(options.config_path);
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const Options options = parseArgs(argc, argv);
    flatguard::EngineConfig config = loadConfig(options);

    for (const flatguard::AccountSession& session : config.accounts) {
      if (session.environment == flatguard::BrokerEnvironment::Live) {
        throw flatguard::ConfigError("account " + session.account_id +
                                     " is live; this build only ships the "
                                     "simulated broker");
      }
    }

    std::unique_ptr<flatguard::IStateStore> store;
    if (config.state_dir.empty()) {
      std::cout << "[main] no state_dir, state is not persisted\n";
      store = std::make_unique<flatguard::InMemoryStateStore>();
    } else {
      store = std::make_unique<flatguard::JsonFileStateStore>(config.state_dir);
    }

    flatguard::LiveTimeProvider clock;
    flatguard::PriceFeed broker_quotes;
    const flatguard::domain::InstrumentTable instruments = config.instruments;
    flatguard::SimulatedBroker broker(broker_quotes, clock, instruments);

    flatguard::TradingEngine engine(std::move(config), broker, *store, clock);
    broker.setEventSink(engine.brokerEventSink());
    engine.addTickObserver(
        [&broker_quotes, &broker, &clock](const flatguard::PriceTickEvent& tick) {
          broker_quotes.update(tick.symbol, tick.price, tick.atr, clock.now_ms());
          broker.onTick(tick.symbol, tick.price);
        });

    std::signal(SIGINT, stop_handler);
    std::signal(SIGTERM, stop_handler);

    engine.start();
    std::cout << "[main] running. Press Ctrl-C to shut down.\n";

    while (!g_stop_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] stop requested. Stopping engine...\n";
    engine.stop();
  } catch (const flatguard::FlatguardError& e) {
    std::cerr << "[main] FATAL: " << e.what() << "\n";
    return 1;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] FATAL: socket setup failed: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
