#pragma once

#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/concurrent/i_scheduler.hpp"
#include "flatguard/dca/dca_engine.hpp"
#include "flatguard/domain/command_result.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/events/engine_events.hpp"
#include "flatguard/events/event.hpp"
#include "flatguard/exit/kill_switch.hpp"
#include "flatguard/ledger/order_tracker.hpp"
#include "flatguard/ledger/position_ledger.hpp"
#include "flatguard/reconcile/drift_reconciler.hpp"
#include "flatguard/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace flatguard {

// What to do when an exit order is rejected and the broker still holds a
// position.
enum class RejectedExitPolicy {
  RequireManualClear,    // Idle + needs_attention; an operator decides
  RetryOnce,             // one more market exit, then manual clear
  EscalateToKillSwitch,  // hand the position to the kill switch
};

const char* toString(RejectedExitPolicy policy);
std::optional<RejectedExitPolicy> parseRejectedExitPolicy(const std::string& text);

struct ExitSettings {
  std::int64_t confirm_poll_interval_ms{50};
  std::int64_t confirm_timeout_ms{2000};
  RejectedExitPolicy rejected_exit_policy{RejectedExitPolicy::RequireManualClear};
};

// -----------------------------------------------------------------------------
// ExitStateMachine — per-position exit controller
// -----------------------------------------------------------------------------
//
// @brief  Drives IDLE → PREPARE_EXIT → WORKING_EXIT → CONFIRM_FLAT → IDLE
//         for every position of the shard. The state itself lives on the
//         Position (PositionLedger::setExitState()), so it is persisted and
//         visible to every other component.
//
// @details
// requestExit(key, reason):
//   - Not Idle → no-op, returns the current state. At most one exit is in
//     flight per position.
//   - Ledger flat → refused if the broker also reports flat (or cannot be
//     asked); otherwise the exit proceeds and realigns the ledger below.
//   - PREPARE_EXIT: cancel every working order (local book and the
//     broker's list; NotFound is ignored, other cancel failures are logged
//     and the exit proceeds), then query the broker position fresh. If the
//     ledger disagrees it is corrected first. Broker flat → Idle.
//   - Market exit for |broker quantity| → WORKING_EXIT, confirmation
//     deadline = now + confirm_timeout_ms, first poll scheduled.
//
// Exit fill (ledger reaches 0) → CONFIRM_FLAT and an immediate poll.
//
// Confirmation poll (every confirm_poll_interval_ms):
//   broker 0, ledger 0             → IDLE
//   broker 0, ledger != 0          → wait for the fill push while the exit
//                                    order is working and the deadline has
//                                    not passed; then correct the ledger to
//                                    the broker and go IDLE
//   broker != 0 past the deadline  → TimeoutError, kill switch
//
// Rejected exit (synchronous RejectError or OrderRejectedEvent for the
// exit order): re-query the broker. Flat → finalize. Otherwise apply
// RejectedExitPolicy.
//
// Automatic triggers on PriceTickEvent (Idle, open, not halted, not
// needs_attention): stop-loss touched, or price beyond the take-profit
// level while the resting take-profit has not filled. Both exit at market.
//
// Thread model: Shard loop thread only. Polls are scheduled through the
//               IScheduler and come back as ConfirmPollEvent on the loop.
// Ownership:    Owned by PositionDesk.
// -----------------------------------------------------------------------------
class ExitStateMachine {
 public:
  ExitStateMachine(EventBus& bus, PositionLedger& ledger, OrderTracker& tracker,
                   BrokerGateway& gateway, const DcaEngine& dca,
                   DriftReconciler& reconciler, KillSwitch& kill_switch,
                   IScheduler& scheduler, EventSink post,
                   const ITimeProvider& time_provider, ExitSettings settings);

  ExitStateMachine(const ExitStateMachine&) = delete;
  ExitStateMachine& operator=(const ExitStateMachine&) = delete;

  domain::CommandResult requestExit(const domain::PositionKey& key,
                                    const std::string& reason);

  domain::ExitState state(const domain::PositionKey& key) const;

  // Drops any in-flight cycle for the key. Used by operator reset.
  void forget(const domain::PositionKey& key);

  const ExitSettings& settings() const { return settings_; }

 private:
  struct ExitCycle {
    std::uint64_t generation{0};
    std::int64_t deadline_ms{0};
    domain::BrokerOrderId exit_order_id;
    std::string reason;
    bool retried{false};
  };

  void onTick(const PriceTickEvent& event);
  void onPositionChanged(const PositionChangedEvent& event);
  void onOrderRejected(const OrderRejectedEvent& event);
  void onConfirmPoll(const ConfirmPollEvent& event);
  void onExitStateChanged(const ExitStateChangedEvent& event);

  void cancelWorkingOrders(const domain::PositionKey& key);
  domain::CommandResult submitExit(const domain::PositionKey& key,
                                   std::int64_t broker_quantity);
  domain::CommandResult handleRejectedExit(const domain::PositionKey& key,
                                           const std::string& reason);
  void finalize(const domain::PositionKey& key, const std::string& reason);
  void schedulePoll(const domain::PositionKey& key, std::int64_t delay_ms);
  void alert(const domain::PositionKey& key, AlertEvent::Severity severity,
             const std::string& message);

  EventBus& bus_;
  PositionLedger& ledger_;
  OrderTracker& tracker_;
  BrokerGateway& gateway_;
  const DcaEngine& dca_;
  DriftReconciler& reconciler_;
  KillSwitch& kill_switch_;
  IScheduler& scheduler_;
  EventSink post_;
  const ITimeProvider& time_provider_;
  ExitSettings settings_;

  std::uint64_t next_generation_{1};
  std::map<domain::PositionKey, ExitCycle> cycles_;

  SubscriptionSet subscriptions_;
};

}  // namespace flatguard
