#pragma once

#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/concurrent/i_scheduler.hpp"
#include "flatguard/concurrent/worker_pool.hpp"
#include "flatguard/domain/command_result.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/events/event.hpp"
#include "flatguard/ledger/order_tracker.hpp"
#include "flatguard/ledger/position_ledger.hpp"
#include "flatguard/reconcile/drift_reconciler.hpp"
#include "flatguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace flatguard {

struct KillSwitchSettings {
  std::int64_t deadline_ms{750};       // activation → confirmed flat
  std::int64_t poll_interval_ms{25};   // broker position polls inside it
  std::int64_t report_grace_ms{100};   // slack before the safety net fires
};

// -----------------------------------------------------------------------------
// KillSwitch — bounded-latency force flatten
// -----------------------------------------------------------------------------
//
// @brief  Flattens one position at the broker within a hard deadline,
//         bypassing the exit state machine's cancel-then-exit sequence.
//
// @details
// activate(key, reason) on the shard loop:
//   1. No-op if already active for the key, or if the position is flat and
//      Idle (confirmed flat already).
//   2. Exit state → ConfirmFlat (from any state).
//   3. Cancels go to the shared WorkerPool: every working order (local book
//      plus the broker's list), each cancel single-shot.
//   4. The flatten gets a lane of its own, a thread started for this
//      activation alone, so it never queues behind other desks' broker
//      calls or other kill switches. The lane makes one broker position
//      query (falls back to the ledger quantity), sends a market exit for
//      |quantity|, then polls the broker every poll_interval_ms until flat
//      or deadline_ms has passed since activation.
//   5. A KillSwitchDeadlineEvent is scheduled at deadline + grace in case
//      the lane never reports.
// The loop thread never blocks on the broker here.
//
// Every activation carries an expiry flag shared with its lane. fail() and
// the destructor raise it. The lane checks it, and the steady-clock
// deadline, right before placeOrder(), so a halted symbol never receives a
// late flatten.
//
// The lane reports back with KillSwitchReportEvent:
//   order placed → the flatten order is tracked, so the drift reconciler
//                  treats its fill as in flight
//   broker flat  → exit state → Idle once the ledger agrees. If the flatten
//                  fill has not reached the ledger yet the position waits
//                  in ConfirmFlat for it; at the deadline the ledger is
//                  corrected to the broker instead.
//   otherwise    → Fatal AlertEvent, position halted, exit state left at
//                  ConfirmFlat. No further automated attempt: repeated
//                  flattens against a broker that is not answering risk
//                  duplicate fills. operatorReset() clears it.
//
// Thread model:
//   activate() and the event handlers run on the shard loop. Worker tasks
//   and lanes only touch the BrokerGateway and hand results back through
//   the EventSink.
//
// Ownership:
//   Owned by PositionDesk. Owns its lanes and joins them on destruction.
//   The WorkerPool, scheduler and gateway are owned by TradingEngine and
//   outlive every desk.
// -----------------------------------------------------------------------------
class KillSwitch {
 public:
  KillSwitch(EventBus& bus, PositionLedger& ledger, OrderTracker& tracker,
             BrokerGateway& gateway, DriftReconciler& reconciler,
             WorkerPool& workers, IScheduler& scheduler, EventSink post,
             const ITimeProvider& time_provider, KillSwitchSettings settings);
  ~KillSwitch();

  KillSwitch(const KillSwitch&) = delete;
  KillSwitch& operator=(const KillSwitch&) = delete;

  domain::CommandResult activate(const domain::PositionKey& key,
                                 const std::string& reason);

  bool isActive(const domain::PositionKey& key) const;

  const KillSwitchSettings& settings() const { return settings_; }

 private:
  using Flag = std::shared_ptr<std::atomic<bool>>;

  struct Activation {
    std::uint64_t generation{0};
    std::int64_t started_at_ms{0};
    std::string reason;
    Flag expired;
    domain::BrokerOrderId flatten_order_id;
    bool awaiting_fill{false};   // broker flat, ledger waiting on the fill
  };

  struct Lane {
    std::thread thread;
    Flag done;
  };

  void onReport(const KillSwitchReportEvent& event);
  void onFill(const BrokerFillEvent& event);
  void onDeadline(const KillSwitchDeadlineEvent& event);

  // Ledger matches the broker: exit state → Idle, activation closed.
  void settle(const domain::PositionKey& key, const std::string& note);
  void fail(const domain::PositionKey& key, const std::string& message);

  // Joins lanes that have finished.
  void reapLanes();

  EventBus& bus_;
  PositionLedger& ledger_;
  OrderTracker& tracker_;
  BrokerGateway& gateway_;
  DriftReconciler& reconciler_;
  WorkerPool& workers_;
  IScheduler& scheduler_;
  EventSink post_;
  const ITimeProvider& time_provider_;
  KillSwitchSettings settings_;

  std::uint64_t next_generation_{1};
  std::map<domain::PositionKey, Activation> active_;
  std::vector<Lane> lanes_;

  SubscriptionSet subscriptions_;
};

}  // namespace flatguard
