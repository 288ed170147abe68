#pragma once

#include "flatguard/broker/account_registry.hpp"
#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/broker/i_broker_api.hpp"
#include "flatguard/concurrent/keyed_loop_group.hpp"
#include "flatguard/concurrent/order_id_generator.hpp"
#include "flatguard/concurrent/timer_service.hpp"
#include "flatguard/concurrent/worker_pool.hpp"
#include "flatguard/config/engine_config.hpp"
#include "flatguard/domain/command_result.hpp"
#include "flatguard/engine/position_desk.hpp"
#include "flatguard/feed/price_feed.hpp"
#include "flatguard/network/ipc_server.hpp"
#include "flatguard/network/market_data_thread.hpp"
#include "flatguard/persistence/i_state_store.hpp"
#include "flatguard/time/i_time_provider.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// TradingEngine — top-level orchestrator and command API
// -----------------------------------------------------------------------------
//
// @brief  Owns the shard loops, one PositionDesk per shard, the broker
//         gateway, the price feed, the worker pool, the timer service and
//         the optional ZeroMQ adapters. Exposes the command API.
//
// @details
// Routing. Every event concerning one (account, symbol) goes to the shard
// KeyedLoopGroup::indexFor() picks, so events for a position are handled
// in arrival order on one thread and different positions run in parallel.
// Price ticks and the reconcile timer are broadcast to every shard. An
// OrderRejectedEvent without a symbol is broadcast too; only the shard
// that placed the order knows it.
//
// Startup (start()):
//   1. Recovery: every persisted row is restored on its desk (replayed
//      from its fill log) and stored DCA ladders are reinstalled, before
//      any thread runs.
//   2. Worker pool, timer service, telemetry bridges, shard loops.
//   3. IPC server, then market data (ticks begin flowing last).
//   4. An immediate reconcile broadcast, then one every
//      reconcile_interval_ms.
//
// Commands. openOrScalePosition(), requestExit(), requestForceFlatten()
// and operatorReset() return a future settled on the owning shard. Domain
// failures (RejectError, ConflictingIntentError, ConfigError, ...) arrive
// as the future's exception. getStatus() reads thread-safe snapshots
// directly.
//
// Thread model: The public API is safe from any thread. start()/stop()
//               from the owning thread.
// Ownership:    Holds references to the broker, the store and the clock,
//               which must outlive it.
// -----------------------------------------------------------------------------
class TradingEngine {
 public:
  using TickObserver = std::function<void(const PriceTickEvent&)>;

  TradingEngine(EngineConfig config, IBrokerApi& broker, IStateStore& store,
                ITimeProvider& time_provider);

  ~TradingEngine();

  TradingEngine(const TradingEngine&) = delete;
  TradingEngine& operator=(const TradingEngine&) = delete;
  TradingEngine(TradingEngine&&) = delete;
  TradingEngine& operator=(TradingEngine&&) = delete;

  void start();
  void stop();
  bool running() const { return running_.load(); }

  // ---- Command API ----------------------------------------------------------
  std::future<domain::CommandResult> openOrScalePosition(
      const domain::AccountId& account_id, const domain::Symbol& symbol,
      domain::Side side, std::int64_t quantity,
      std::optional<domain::DcaConfig> dca = std::nullopt);

  std::future<domain::CommandResult> requestExit(
      const domain::AccountId& account_id, const domain::Symbol& symbol,
      const std::string& reason);

  std::future<domain::CommandResult> requestForceFlatten(
      const domain::AccountId& account_id, const domain::Symbol& symbol,
      const std::string& reason = "force flatten");

  std::future<domain::CommandResult> operatorReset(
      const domain::AccountId& account_id, const domain::Symbol& symbol);

  domain::PositionStatus getStatus(const domain::AccountId& account_id,
                                   const domain::Symbol& symbol) const;

  std::vector<domain::Position> allPositions() const;

  // ---- Inbound streams ------------------------------------------------------

  // Records the tick in the price feed, notifies tick observers (the
  // simulated broker crosses its resting orders there) and broadcasts it.
  // Unusable prices are logged and dropped.
  void onTick(PriceTickEvent tick);

  void addTickObserver(TickObserver observer);

  // Sink for broker push events; routes each to its position's shard.
  EventSink brokerEventSink();

  void setAtr(const domain::Symbol& symbol, double atr);

  // ---------------------------------------------------------------------------
  // executeCommand(json)
  // ---------------------------------------------------------------------------
  // @brief  IPC entry point. Accepts a JSON object
  //         {"cmd": "OPEN", "account": "...", "symbol": "...", ...} or a bare
  //         command word ("PING", "STATUS"). Always returns a JSON object
  //         with "status": "ok" | "error".
  //
  //   PING                                → "PONG"
  //   STATUS  [account, symbol]           → one status, or every position
  //   OPEN    account symbol side quantity [dca]
  //   EXIT    account symbol [reason]
  //   FLATTEN account symbol [reason]
  //   RESET   account symbol
  //   SET_ATR symbol atr
  // ---------------------------------------------------------------------------
  std::string executeCommand(const std::string& request);

  const PriceFeed& priceFeed() const { return feed_; }
  BrokerGateway& gateway() { return gateway_; }
  PositionDesk& deskFor(const domain::PositionKey& key);
  std::size_t shardCount() const { return loops_.size(); }

 private:
  void routeBrokerEvent(Event event);
  void scheduleReconcile();

  template <typename Command>
  std::future<domain::CommandResult> submit(const domain::PositionKey& key,
                                            Command command);

  EngineConfig config_;
  IStateStore& store_;
  ITimeProvider& time_provider_;

  PriceFeed feed_;
  AccountRegistry accounts_;
  BrokerGateway gateway_;
  OrderIdGenerator drift_ids_;
  OrderIdGenerator reconcile_sequence_;

  WorkerPool workers_;
  TimerService timers_;
  KeyedLoopGroup loops_;
  std::vector<std::unique_ptr<PositionDesk>> desks_;

  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  std::mutex observers_mutex_;
  std::vector<TickObserver> tick_observers_;

  std::atomic<bool> running_{false};
};

}  // namespace flatguard
