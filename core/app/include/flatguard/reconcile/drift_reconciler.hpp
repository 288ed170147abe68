#pragma once

#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/concurrent/order_id_generator.hpp"
#include "flatguard/domain/drift_record.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/events/broker_events.hpp"
#include "flatguard/events/timer_events.hpp"
#include "flatguard/feed/price_feed.hpp"
#include "flatguard/ledger/order_tracker.hpp"
#include "flatguard/ledger/position_ledger.hpp"
#include "flatguard/persistence/i_state_store.hpp"
#include "flatguard/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flatguard {

struct ReconcileSettings {
  // A market order younger than this may still have a fill in flight.
  std::int64_t pending_order_grace_ms{2000};
};

// -----------------------------------------------------------------------------
// DriftReconciler — the only component that corrects the ledger
// -----------------------------------------------------------------------------
//
// @brief  Compares ledger quantity with the broker's, records every
//         mismatch as a DriftRecord, and brings the ledger back in line
//         with the broker by accounting entries only.
//
// @details
// Triggers:
//   ReconcileTimerEvent     sweep() over every key the shard knows
//   PositionSnapshotEvent   reconcile() against the pushed quantity
//   correctToBroker()       forced, from the exit state machine and the
//                           kill switch when they see the broker disagree
//
// Unforced reconciles are deferred (no record, no correction) while:
//   - the position's exit state is not Idle (an exit or a kill switch
//     owns it; it will force a correction itself if needed)
//   - the position is halted
//   - a market order placed less than pending_order_grace_ms ago has not
//     filled yet
//
// On mismatch:
//   1. Append a Pending DriftRecord, publish DriftDetectedEvent.
//   2. Ask the broker for its fill history. If it nets to the broker's
//      quantity, it replaces the local fill log and the ledger is rebuilt
//      (RebuiltFromBrokerFills). Local fill roles are kept for fill ids
//      both logs share.
//   3. Otherwise book Reconcile-role fills (CorrectedToBroker):
//        broker flat       close at the last price (or the average)
//        broker avg known  close at our average (no PnL), reopen at theirs
//        otherwise         one fill for the difference at the last price
//   4. Append the resolved record under the same id, publish again, and
//      raise a Warning AlertEvent.
// A failure in step 2 or 3 leaves the record Unresolved.
//
// Never places, cancels or modifies an order.
//
// Thread model: Shard loop thread only. DriftRecord ids come from an
//               OrderIdGenerator shared by all shards.
// Ownership:    Owned by PositionDesk.
// -----------------------------------------------------------------------------
class DriftReconciler {
 public:
  DriftReconciler(EventBus& bus, PositionLedger& ledger,
                  const OrderTracker& tracker, BrokerGateway& gateway,
                  IStateStore& store, const PriceFeed& feed,
                  const ITimeProvider& time_provider,
                  OrderIdGenerator& drift_ids, ReconcileSettings settings);

  DriftReconciler(const DriftReconciler&) = delete;
  DriftReconciler& operator=(const DriftReconciler&) = delete;

  // Compares and corrects. Returns the record when drift was found.
  std::optional<domain::DriftRecord> reconcile(const domain::PositionKey& key,
                                               const BrokerPosition& broker,
                                               bool force = false,
                                               const std::string& reason = {});

  // Forced reconcile against a broker position the caller just queried.
  std::optional<domain::DriftRecord> correctToBroker(
      const domain::PositionKey& key, const BrokerPosition& broker,
      const std::string& reason);

  // Queries the broker (with retry) and reconciles.
  std::optional<domain::DriftRecord> reconcileKey(const domain::PositionKey& key,
                                                  bool force = false);

  // reconcileKey() for every key in the ledger.
  void sweep();

  std::vector<domain::DriftRecord> driftRecords(
      const domain::PositionKey& key) const;

  bool shouldDefer(const domain::Position& position) const;

 private:
  void onTimer(const ReconcileTimerEvent& event);
  void onSnapshot(const PositionSnapshotEvent& event);

  bool rebuildFromBrokerFills(const domain::PositionKey& key,
                              std::int64_t broker_quantity);
  void bookCorrection(const domain::Position& position,
                      const BrokerPosition& broker, std::uint64_t drift_id);
  void publish(const domain::DriftRecord& record);

  EventBus& bus_;
  PositionLedger& ledger_;
  const OrderTracker& tracker_;
  BrokerGateway& gateway_;
  IStateStore& store_;
  const PriceFeed& feed_;
  const ITimeProvider& time_provider_;
  OrderIdGenerator& drift_ids_;
  ReconcileSettings settings_;

  SubscriptionSet subscriptions_;
};

}  // namespace flatguard
