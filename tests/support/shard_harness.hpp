#pragma once

#include "flatguard/broker/account_registry.hpp"
#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/concurrent/order_id_generator.hpp"
#include "flatguard/concurrent/thread_safe_queue.hpp"
#include "flatguard/concurrent/worker_pool.hpp"
#include "flatguard/config/engine_config.hpp"
#include "flatguard/dca/dca_engine.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/exit/exit_state_machine.hpp"
#include "flatguard/exit/kill_switch.hpp"
#include "flatguard/feed/price_feed.hpp"
#include "flatguard/ledger/order_tracker.hpp"
#include "flatguard/ledger/position_ledger.hpp"
#include "flatguard/persistence/in_memory_state_store.hpp"
#include "flatguard/pnl/pnl_engine.hpp"
#include "flatguard/reconcile/drift_reconciler.hpp"
#include "flatguard/time/simulation_time_provider.hpp"
#include "flatguard/time/time_utils.hpp"

#include "support/manual_scheduler.hpp"
#include "support/scripted_broker.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace flatguard {
namespace testing_support {

// -----------------------------------------------------------------------------
// ShardHarness — one shard's component chain on a bare EventBus
// -----------------------------------------------------------------------------
// Same construction (and therefore dispatch) order as PositionDesk, but the
// loop is replaced by a queue the test drains on its own thread:
//   - bus.publish() runs handlers synchronously
//   - events the components post() (confirm polls, kill-switch reports)
//     wait in `posted` until drain() publishes them
//   - timers wait in the ManualScheduler until advance()
//
// Every published event is also appended to `seen` for assertions.
// -----------------------------------------------------------------------------
struct ShardHarness {
  static constexpr std::int64_t kStartMs = 1'700'000'000'000;

  static EngineConfig defaultConfig() {
    EngineConfig config;
    config.instruments.upsert(domain::InstrumentSpec{"TEST", 1.0, 1.0});
    config.retry = RetrySettings{3, 0, 0};
    config.exit.confirm_poll_interval_ms = 50;
    config.exit.confirm_timeout_ms = 2000;
    config.kill_switch.deadline_ms = 400;
    config.kill_switch.poll_interval_ms = 5;
    config.kill_switch.report_grace_ms = 100;
    config.reconcile.pending_order_grace_ms = 2000;
    return config;
  }

  explicit ShardHarness(EngineConfig cfg = defaultConfig())
      : config(std::move(cfg)),
        clock(kStartMs),
        scheduler(clock),
        accounts({AccountSession{"ACC1", "tok-1", BrokerEnvironment::Simulated}},
                 {}, RateLimit{1000.0, 1000.0}),
        gateway(broker, accounts,
                RetryPolicy(config.retry, [](std::chrono::milliseconds) {})),
        drift_ids(1),
        workers(2) {
    workers.start();
    recorder = bus.subscribe([this](const Event& e) { seen.push_back(e); });

    const EventSink post = [this](Event e) { posted.push(std::move(e)); };
    tracker = std::make_unique<OrderTracker>(bus);
    ledger = std::make_unique<PositionLedger>(bus, store, config.instruments,
                                              *tracker, clock);
    pnl = std::make_unique<PnlEngine>(bus, *ledger, feed, config.instruments);
    dca = std::make_unique<DcaEngine>(bus, *ledger, *tracker, gateway, store,
                                      feed, config.instruments, clock,
                                      config.dca_defaults);
    reconciler = std::make_unique<DriftReconciler>(
        bus, *ledger, *tracker, gateway, store, feed, clock, drift_ids,
        config.reconcile);
    kill_switch = std::make_unique<KillSwitch>(
        bus, *ledger, *tracker, gateway, *reconciler, workers, scheduler, post,
        clock, config.kill_switch);
    exits = std::make_unique<ExitStateMachine>(
        bus, *ledger, *tracker, gateway, *dca, *reconciler, *kill_switch,
        scheduler, post, clock, config.exit);
  }

  ~ShardHarness() {
    workers.stop();
    exits.reset();
    kill_switch.reset();
    reconciler.reset();
    dca.reset();
    pnl.reset();
    ledger.reset();
    tracker.reset();
    bus.unsubscribe(recorder);
  }

  ShardHarness(const ShardHarness&) = delete;
  ShardHarness& operator=(const ShardHarness&) = delete;

  // Publishes posted events until the queue is empty.
  std::size_t drain() {
    std::size_t count = 0;
    while (std::optional<Event> event = posted.try_pop()) {
      bus.publish(*event);
      ++count;
    }
    return count;
  }

  // Moves simulated time, fires due timers, publishes what they posted.
  void advance(std::int64_t delta_ms) {
    scheduler.advance(delta_ms);
    drain();
  }

  // Drains repeatedly until pred holds or the wall-clock timeout passes.
  bool pumpUntil(const std::function<bool()>& pred,
                 std::chrono::milliseconds timeout =
                     std::chrono::milliseconds(2000)) {
    const auto until = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < until) {
      drain();
      if (pred()) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    drain();
    return pred();
  }

  void tick(const domain::Symbol& symbol, double price,
            std::optional<double> atr = std::nullopt) {
    feed.update(symbol, price, atr, clock.now_ms());
    PriceTickEvent event;
    event.symbol = symbol;
    event.price = price;
    event.atr = atr;
    event.timestamp = ms_to_timestamp(clock.now_ms());
    bus.publish(event);
  }

  // Executes a working order at the broker and pushes its fill.
  domain::Fill fillOrder(const domain::BrokerOrderId& order_id, double price) {
    domain::Fill fill = broker.execute(order_id, price);
    fill.timestamp_ms = clock.now_ms();
    bus.publish(BrokerFillEvent{fill, ms_to_timestamp(fill.timestamp_ms)});
    return fill;
  }

  // Pushes the fill the broker booked most recently for the key, as the
  // broker's event stream would.
  domain::Fill pushLastBrokerFill(const domain::PositionKey& key) {
    domain::Fill fill = broker.queryFills(key.account_id, key.symbol).back();
    fill.timestamp_ms = clock.now_ms();
    bus.publish(BrokerFillEvent{fill, ms_to_timestamp(fill.timestamp_ms)});
    return fill;
  }

  // Drains until the kill switch's flatten lane has reported its outcome.
  bool awaitKillSwitchReport(const domain::PositionKey& key,
                             std::chrono::milliseconds timeout =
                                 std::chrono::milliseconds(2000)) {
    return pumpUntil(
        [this, &key] {
          for (const auto& report : seenOf<KillSwitchReportEvent>()) {
            if (report.key == key && report.finished) {
              return true;
            }
          }
          return false;
        },
        timeout);
  }

  // Places a tracked market entry and fills it in full.
  domain::Position open(const domain::PositionKey& key, domain::Side side,
                        std::int64_t quantity, double price) {
    const domain::OrderIntent intent = domain::OrderIntent::market(
        key, side, quantity, domain::OrderPurpose::Entry);
    const domain::BrokerOrderId id = gateway.placeOrder(intent);
    tracker->track(id, intent, clock.now_ms());
    fillOrder(id, price);
    return ledger->currentPosition(key);
  }

  template <typename T>
  std::vector<T> seenOf() const {
    std::vector<T> out;
    for (const Event& event : seen) {
      if (const auto* ptr = std::get_if<T>(&event)) {
        out.push_back(*ptr);
      }
    }
    return out;
  }

  std::vector<domain::BrokerOrderId> placedWith(domain::OrderPurpose purpose) const {
    std::vector<domain::BrokerOrderId> ids;
    for (const ScriptedBroker::PlacedOrder& order : broker.placed()) {
      if (order.intent.purpose == purpose) {
        ids.push_back(order.id);
      }
    }
    return ids;
  }

  EngineConfig config;
  SimulationTimeProvider clock;
  ManualScheduler scheduler;
  InMemoryStateStore store;
  PriceFeed feed;
  ScriptedBroker broker;
  AccountRegistry accounts;
  BrokerGateway gateway;
  OrderIdGenerator drift_ids;
  WorkerPool workers;
  EventBus bus;
  ThreadSafeQueue<Event> posted;
  std::vector<Event> seen;
  EventBus::SubscriptionId recorder{0};

  std::unique_ptr<OrderTracker> tracker;
  std::unique_ptr<PositionLedger> ledger;
  std::unique_ptr<PnlEngine> pnl;
  std::unique_ptr<DcaEngine> dca;
  std::unique_ptr<DriftReconciler> reconciler;
  std::unique_ptr<KillSwitch> kill_switch;
  std::unique_ptr<ExitStateMachine> exits;
};

}  // namespace testing_support
}  // namespace flatguard
