#pragma once

#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/concurrent/event_loop_thread.hpp"
#include "flatguard/concurrent/i_scheduler.hpp"
#include "flatguard/concurrent/order_id_generator.hpp"
#include "flatguard/concurrent/worker_pool.hpp"
#include "flatguard/config/engine_config.hpp"
#include "flatguard/dca/dca_engine.hpp"
#include "flatguard/domain/command_result.hpp"
#include "flatguard/exit/exit_state_machine.hpp"
#include "flatguard/exit/kill_switch.hpp"
#include "flatguard/feed/price_feed.hpp"
#include "flatguard/ledger/order_tracker.hpp"
#include "flatguard/ledger/position_ledger.hpp"
#include "flatguard/persistence/i_state_store.hpp"
#include "flatguard/pnl/pnl_engine.hpp"
#include "flatguard/reconcile/drift_reconciler.hpp"
#include "flatguard/time/i_time_provider.hpp"

#include <map>

namespace flatguard {

// Shared, engine-owned collaborators every desk is built over.
struct DeskResources {
  IStateStore& store;
  const domain::InstrumentTable& instruments;
  const PriceFeed& feed;
  BrokerGateway& gateway;
  WorkerPool& workers;
  IScheduler& scheduler;
  const ITimeProvider& time_provider;
  OrderIdGenerator& drift_ids;
};

// -----------------------------------------------------------------------------
// PositionDesk — the component chain of one shard
// -----------------------------------------------------------------------------
//
// @brief  Owns one instance of every per-position component, wired to the
//         shard's EventBus, and serves the command events routed to the
//         shard.
//
// @details
// Construction order is subscription order, and subscription order is
// dispatch order for every event on the shard bus:
//
//   OrderTracker → PositionLedger → PnlEngine → DcaEngine
//     → DriftReconciler → KillSwitch → ExitStateMachine → desk commands
//
// so a broker fill reaches the order book first, then the ledger, and only
// then the controllers that react to the new position.
//
// Commands (from TradingEngine, answered through the promise they carry):
//   OpenPositionCommand   flat or same side: market entry (scale-in).
//                         Opposite side: exit with reason "reversal", the
//                         entry is parked and placed when the exit returns
//                         to IDLE flat. Exit in flight: ConflictingIntentError.
//   ExitCommand           ExitStateMachine::requestExit()
//   ForceFlattenCommand   KillSwitch::activate()
//   OperatorResetCommand  clears halted / needs_attention, returns the exit
//                         state to IDLE and forces a reconcile.
//
// Thread model: Everything runs on the shard loop thread, except the
//               const accessors, which go through the ledger's lock or
//               the store's.
// Ownership:    Owned by TradingEngine, one per shard.
// -----------------------------------------------------------------------------
class PositionDesk {
 public:
  PositionDesk(EventLoopThread& loop, DeskResources resources,
               const EngineConfig& config);

  PositionDesk(const PositionDesk&) = delete;
  PositionDesk& operator=(const PositionDesk&) = delete;

  // -------------------------------------------------------------------------
  // restorePosition(row)
  // -------------------------------------------------------------------------
  // @brief  Startup recovery for one persisted row. Call before the loop
  //         starts.
  //
  // @return false when the fill log contradicts the row (the row is then
  //         halted and a Fatal alert has been raised).
  //
  // A row persisted mid-exit comes back IDLE; if it still holds quantity
  // it is flagged needs_attention, since the exit's outcome is unknown
  // until the startup reconcile has run.
  // -------------------------------------------------------------------------
  bool restorePosition(const domain::Position& row);

  void restoreDcaConfig(const domain::PositionKey& key,
                        const domain::DcaConfig& config);

  domain::PositionStatus status(const domain::PositionKey& key) const;

  PositionLedger& ledger() { return ledger_; }
  const PositionLedger& ledger() const { return ledger_; }
  OrderTracker& tracker() { return tracker_; }
  DcaEngine& dca() { return dca_; }
  DriftReconciler& reconciler() { return reconciler_; }
  KillSwitch& killSwitch() { return kill_switch_; }
  ExitStateMachine& exits() { return exits_; }

 private:
  struct PendingEntry {
    domain::Side side{domain::Side::Buy};
    std::int64_t quantity{0};
  };

  void onOpen(const OpenPositionCommand& command);
  void onExit(const ExitCommand& command);
  void onForceFlatten(const ForceFlattenCommand& command);
  void onOperatorReset(const OperatorResetCommand& command);
  void onExitStateChanged(const ExitStateChangedEvent& event);

  domain::CommandResult open(const OpenPositionCommand& command);
  domain::CommandResult operatorReset(const domain::PositionKey& key);
  domain::BrokerOrderId placeEntry(const domain::PositionKey& key,
                                   domain::Side side, std::int64_t quantity);

  EventBus& bus_;
  DeskResources resources_;

  OrderTracker tracker_;
  PositionLedger ledger_;
  PnlEngine pnl_;
  DcaEngine dca_;
  DriftReconciler reconciler_;
  KillSwitch kill_switch_;
  ExitStateMachine exits_;

  std::map<domain::PositionKey, PendingEntry> pending_entries_;

  SubscriptionSet subscriptions_;
};

}  // namespace flatguard
