#include "flatguard/engine/trading_engine.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/network/telemetry_format.hpp"
#include "flatguard/persistence/json_codec.hpp"
#include "flatguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <exception>
#include <iostream>
#include <utility>

namespace flatguard {

namespace {

constexpr auto kCommandTimeout = std::chrono::seconds(5);

nlohmann::json awaitResult(std::future<domain::CommandResult> future) {
  if (future.wait_for(kCommandTimeout) != std::future_status::ready) {
    return {{"status", "error"}, {"response", "command timed out"}};
  }
  nlohmann::json response = commandResultToJson(future.get());
  response["status"] = "ok";
  return response;
}

domain::PositionKey keyFrom(const nlohmann::json& request) {
  return domain::PositionKey{request.at("account").get<std::string>(),
                             request.at("symbol").get<std::string>()};
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: shared resources, then one desk per shard
// -----------------------------------------------------------------------------
TradingEngine::TradingEngine(EngineConfig config, IBrokerApi& broker,
                             IStateStore& store, ITimeProvider& time_provider)
    : config_(std::move(config)),
      store_(store),
      time_provider_(time_provider),
      accounts_(config_.accounts, config_.rate_limits,
                config_.default_rate_limit),
      gateway_(broker, accounts_, RetryPolicy(config_.retry)),
      drift_ids_(store.lastDriftId() + 1),
      workers_(config_.worker_threads),
      loops_(config_.shards) {
  config_.validate();

  DeskResources resources{store_,    config_.instruments, feed_,
                          gateway_,  workers_,            timers_,
                          time_provider_, drift_ids_};
  desks_.reserve(loops_.size());
  for (std::size_t i = 0; i < loops_.size(); ++i) {
    desks_.push_back(
        std::make_unique<PositionDesk>(loops_.loop(i), resources, config_));
  }
}

TradingEngine::~TradingEngine() { stop(); }

PositionDesk& TradingEngine::deskFor(const domain::PositionKey& key) {
  return *desks_.at(loops_.indexFor(key));
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void TradingEngine::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Recovery, before any thread touches a desk -----------------------
  std::size_t restored = 0;
  std::size_t corrupt = 0;
  for (const domain::Position& row : store_.loadPositions()) {
    if (deskFor(row.key()).restorePosition(row)) {
      ++restored;
    } else {
      ++corrupt;
    }
  }
  for (const auto& [key, dca] : store_.loadDcaConfigs()) {
    deskFor(key).restoreDcaConfig(key, dca);
  }
  std::cout << "[TradingEngine] recovery: " << restored
            << " position(s) restored, " << corrupt << " halted as corrupt.\n";

  // ---  2) Shared threads and telemetry bridges -----------------------------
  workers_.start();
  timers_.start();

  if (!config_.endpoints.ipc_command.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.endpoints.ipc_command, config_.endpoints.ipc_telemetry);

    IpcServer* ipc = ipc_server_.get();
    for (std::size_t i = 0; i < loops_.size(); ++i) {
      EventBus& bus = loops_.loop(i).eventBus();
      bus.subscribe<PositionChangedEvent>(
          [ipc](const PositionChangedEvent& e) { ipc->pushTelemetry(e); });
      bus.subscribe<ExitStateChangedEvent>(
          [ipc](const ExitStateChangedEvent& e) { ipc->pushTelemetry(e); });
      bus.subscribe<DriftDetectedEvent>(
          [ipc](const DriftDetectedEvent& e) { ipc->pushTelemetry(e); });
      bus.subscribe<AlertEvent>(
          [ipc](const AlertEvent& e) { ipc->pushTelemetry(e); });
    }
  }

  // ---  3) Shard loops, then adapters (ticks flow last) ---------------------
  loops_.start();
  running_.store(true);

  if (ipc_server_) {
    ipc_server_->start();
  }
  if (!config_.endpoints.market_data.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        [this](PriceTickEvent tick) { onTick(std::move(tick)); },
        config_.endpoints.market_data);
    market_data_thread_->start();
  }

  // ---  4) Reconcile now, then periodically ---------------------------------
  loops_.broadcast(ReconcileTimerEvent{reconcile_sequence_.next_id()});
  scheduleReconcile();

  std::cout << "[TradingEngine] started. " << loops_.size() << " shard(s), "
            << workers_.size() << " worker(s)"
            << (ipc_server_ ? ", ipc" : "")
            << (market_data_thread_ ? ", market_data" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void TradingEngine::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  // ---  1) No more inflow ---------------------------------------------------
  market_data_thread_.reset();
  timers_.stop();

  // ---  2) Let in-flight kill-switch work finish, then stop the shards ------
  workers_.stop();
  loops_.stop();

  // ---  3) IPC last: the shard bridges hold a pointer to it -----------------
  ipc_server_.reset();

  std::cout << "[TradingEngine] stopped. All threads joined.\n";
}

void TradingEngine::scheduleReconcile() {
  timers_.scheduleAfter(config_.reconcile_interval_ms, [this] {
    if (!running_.load()) {
      return;
    }
    loops_.broadcast(ReconcileTimerEvent{reconcile_sequence_.next_id()});
    scheduleReconcile();
  });
}

// -----------------------------------------------------------------------------
// Command API
// -----------------------------------------------------------------------------
template <typename Command>
std::future<domain::CommandResult> TradingEngine::submit(
    const domain::PositionKey& key, Command command) {
  auto reply = std::make_shared<std::promise<domain::CommandResult>>();
  std::future<domain::CommandResult> future = reply->get_future();
  if (!running_.load()) {
    reply->set_exception(
        std::make_exception_ptr(FlatguardError("engine not running")));
    return future;
  }
  command.reply = std::move(reply);
  loops_.push(key, std::move(command));
  return future;
}

std::future<domain::CommandResult> TradingEngine::openOrScalePosition(
    const domain::AccountId& account_id, const domain::Symbol& symbol,
    domain::Side side, std::int64_t quantity,
    std::optional<domain::DcaConfig> dca) {
  const domain::PositionKey key{account_id, symbol};
  OpenPositionCommand command;
  command.key = key;
  command.side = side;
  command.quantity = quantity;
  command.dca = std::move(dca);
  return submit(key, std::move(command));
}

std::future<domain::CommandResult> TradingEngine::requestExit(
    const domain::AccountId& account_id, const domain::Symbol& symbol,
    const std::string& reason) {
  const domain::PositionKey key{account_id, symbol};
  return submit(key, ExitCommand{key, reason, nullptr});
}

std::future<domain::CommandResult> TradingEngine::requestForceFlatten(
    const domain::AccountId& account_id, const domain::Symbol& symbol,
    const std::string& reason) {
  const domain::PositionKey key{account_id, symbol};
  return submit(key, ForceFlattenCommand{key, reason, nullptr});
}

std::future<domain::CommandResult> TradingEngine::operatorReset(
    const domain::AccountId& account_id, const domain::Symbol& symbol) {
  const domain::PositionKey key{account_id, symbol};
  return submit(key, OperatorResetCommand{key, nullptr});
}

domain::PositionStatus TradingEngine::getStatus(
    const domain::AccountId& account_id, const domain::Symbol& symbol) const {
  const domain::PositionKey key{account_id, symbol};
  return desks_.at(loops_.indexFor(key))->status(key);
}

std::vector<domain::Position> TradingEngine::allPositions() const {
  std::vector<domain::Position> result;
  for (const auto& desk : desks_) {
    for (const domain::Position& position : desk->ledger().snapshots()) {
      result.push_back(position);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// Inbound streams
// -----------------------------------------------------------------------------
void TradingEngine::onTick(PriceTickEvent tick) {
  const std::int64_t now = time_provider_.now_ms();
  if (!feed_.update(tick.symbol, tick.price, tick.atr, now)) {
    return;
  }
  if (tick.timestamp == Timestamp{}) {
    tick.timestamp = ms_to_timestamp(now);
  }

  std::vector<TickObserver> observers;
  {
    std::lock_guard lock(observers_mutex_);
    observers = tick_observers_;
  }
  for (const TickObserver& observer : observers) {
    observer(tick);
  }

  loops_.broadcast(tick);
}

void TradingEngine::addTickObserver(TickObserver observer) {
  std::lock_guard lock(observers_mutex_);
  tick_observers_.push_back(std::move(observer));
}

EventSink TradingEngine::brokerEventSink() {
  return [this](Event event) { routeBrokerEvent(std::move(event)); };
}

void TradingEngine::routeBrokerEvent(Event event) {
  if (const auto* fill = std::get_if<BrokerFillEvent>(&event)) {
    const domain::PositionKey key = fill->fill.key();
    loops_.push(key, std::move(event));
    return;
  }
  if (const auto* snapshot = std::get_if<PositionSnapshotEvent>(&event)) {
    const domain::PositionKey key{snapshot->account_id, snapshot->symbol};
    loops_.push(key, std::move(event));
    return;
  }
  if (const auto* rejected = std::get_if<OrderRejectedEvent>(&event)) {
    if (rejected->symbol.empty()) {
      loops_.broadcast(event);
      return;
    }
    const domain::PositionKey key{rejected->account_id, rejected->symbol};
    loops_.push(key, std::move(event));
    return;
  }
  std::cerr << "[TradingEngine] WARNING: unexpected broker event (variant "
            << event.index() << ") dropped\n";
}

void TradingEngine::setAtr(const domain::Symbol& symbol, double atr) {
  feed_.setAtr(symbol, atr);
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC command requests
// -----------------------------------------------------------------------------
std::string TradingEngine::executeCommand(const std::string& request) {
  nlohmann::json response;

  try {
    const nlohmann::json j = (!request.empty() && request.front() == '{')
                                 ? nlohmann::json::parse(request)
                                 : nlohmann::json{{"cmd", request}};
    const std::string cmd = j.at("cmd").get<std::string>();

    if (cmd == "PING") {
      response["status"] = "ok";
      response["response"] = "PONG";
    } else if (cmd == "STATUS") {
      response["status"] = "ok";
      if (j.contains("account") && j.contains("symbol")) {
        const domain::PositionKey key = keyFrom(j);
        response["position"] =
            statusToJson(getStatus(key.account_id, key.symbol));
      } else {
        nlohmann::json positions = nlohmann::json::array();
        for (const domain::Position& position : allPositions()) {
          positions.push_back(positionToJson(position));
        }
        response["positions"] = std::move(positions);
      }
    } else if (cmd == "OPEN") {
      const domain::PositionKey key = keyFrom(j);
      const std::string side_text = j.at("side").get<std::string>();
      std::optional<domain::Side> side = domain::parseSide(side_text);
      if (!side) {
        throw ConfigError("invalid side: '" + side_text + "'");
      }
      std::optional<domain::DcaConfig> dca;
      if (j.contains("dca")) {
        dca = j.at("dca").get<domain::DcaConfig>();
      }
      response = awaitResult(openOrScalePosition(
          key.account_id, key.symbol, *side,
          j.at("quantity").get<std::int64_t>(), std::move(dca)));
    } else if (cmd == "EXIT") {
      const domain::PositionKey key = keyFrom(j);
      response = awaitResult(requestExit(key.account_id, key.symbol,
                                         j.value("reason", std::string("manual"))));
    } else if (cmd == "FLATTEN") {
      const domain::PositionKey key = keyFrom(j);
      response = awaitResult(requestForceFlatten(
          key.account_id, key.symbol,
          j.value("reason", std::string("operator flatten"))));
    } else if (cmd == "RESET") {
      const domain::PositionKey key = keyFrom(j);
      response = awaitResult(operatorReset(key.account_id, key.symbol));
    } else if (cmd == "SET_ATR") {
      setAtr(j.at("symbol").get<std::string>(), j.at("atr").get<double>());
      response["status"] = "ok";
      response["response"] = "ATR set";
    } else {
      response["status"] = "error";
      response["response"] = "Unknown command: " + cmd;
    }
  } catch (const FlatguardError& e) {
    response = {{"status", "error"}, {"response", e.what()}};
  } catch (const nlohmann::json::exception& e) {
    response = {{"status", "error"},
                {"response", std::string("bad request: ") + e.what()}};
  } catch (const std::exception& e) {
    std::cerr << "[TradingEngine] ERROR: command '" << request
              << "' failed: " << e.what() << "\n";
    response = {{"status", "error"}, {"response", e.what()}};
  }

  return response.dump();
}

}  // namespace flatguard
