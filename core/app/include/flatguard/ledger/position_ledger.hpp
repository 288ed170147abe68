#pragma once

#include "flatguard/domain/fill.hpp"
#include "flatguard/domain/instrument.hpp"
#include "flatguard/domain/position.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/events/broker_events.hpp"
#include "flatguard/ledger/order_tracker.hpp"
#include "flatguard/persistence/i_state_store.hpp"
#include "flatguard/time/i_time_provider.hpp"

#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// PositionLedger — fill log and derived positions of one shard
// -----------------------------------------------------------------------------
//
// @brief  Books fills into per-(account, symbol) positions, persists them,
//         and publishes PositionChangedEvent after every change.
//
// @details
// A Position is a pure function of its ordered fill log (applyFill()).
// recordFill() is the only way quantity changes; everything else the
// ledger stores (exit state, fired DCA rungs, halt flags, marks) is
// controller state written through the setters below, persisted with the
// row and published so telemetry can follow it.
//
// recordFill(fill):
//   1. Ignore a fill_id already booked for the key (returns nullopt).
//   2. Resolve the FillRole from the OrderTracker (falls back to the role
//      the broker reported for orders this shard did not place).
//   3. Refuse a fill that grows |quantity| while exit_state != Idle
//      (ConflictingIntentError). Reconcile fills are exempt.
//   4. Apply, then persist: store.appendFill() before store.savePosition().
//   5. Commit to memory and publish PositionChangedEvent.
//
// Lifecycle bookkeeping inside applyFill():
//   opening from flat  → opened_at_ms set, marks and fired rungs reset
//   landing on flat    → closed_at_ms set, average reset to 0, fired rungs
//                        cleared (the next position starts a fresh ladder)
//
// The broker push stream also arrives here: the ledger subscribes to
// BrokerFillEvent and books each fill, logging and alerting on failure.
//
// Thread model:
//   Mutations run on the shard's loop thread only. positions_ is guarded
//   by a shared_mutex so snapshots() / currentPosition() may be called from
//   other threads (IPC status, TradingEngine::getStatus()).
//
// Subscriber ordering constraint:
//   Constructed after OrderTracker and before every component that reacts
//   to PositionChangedEvent.
//
// Ownership:
//   Owned by PositionDesk. References the shard bus, the state store, the
//   instrument table, the shard's OrderTracker and the clock.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  PositionLedger(EventBus& bus, IStateStore& store,
                 const domain::InstrumentTable& instruments,
                 const OrderTracker& tracker,
                 const ITimeProvider& time_provider);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // -------------------------------------------------------------------------
  // recordFill(fill)
  // -------------------------------------------------------------------------
  // @return The updated position, or nullopt for a duplicate fill_id.
  //
  // @throws ConflictingIntentError  fill would grow the position mid-exit.
  // @throws StateStoreError         the store rejected the write; memory
  //                                 is left unchanged.
  // -------------------------------------------------------------------------
  std::optional<domain::Position> recordFill(const domain::Fill& fill);

  // Current position, or a flat one for a key never seen.
  domain::Position currentPosition(const domain::PositionKey& key) const;

  bool contains(const domain::PositionKey& key) const;

  // -------------------------------------------------------------------------
  // rebuild(key)
  // -------------------------------------------------------------------------
  // @brief  Replays the stored fill log for the key and replaces the
  //         fill-derived fields. Controller state is kept. Publishes
  //         PositionChangedEvent without a fill.
  // -------------------------------------------------------------------------
  domain::Position rebuild(const domain::PositionKey& key);

  // -------------------------------------------------------------------------
  // restore(row)
  // -------------------------------------------------------------------------
  // @brief  Startup recovery for one persisted row.
  //
  // @details
  // The fill log is replayed and compared with the row:
  //   replay has more fills than the row  → crash between appendFill and
  //                                         savePosition; replay wins
  //   fill counts equal, quantity differs → corruption
  //   replay has fewer fills than the row → corruption (log lost entries)
  // On corruption the row is kept, halted is set, last_error explains,
  // a Fatal AlertEvent is published, and LedgerCorruptionError is thrown
  // after the halted row has been committed.
  // -------------------------------------------------------------------------
  domain::Position restore(const domain::Position& row);

  // -------------------------------------------------------------------------
  // Controller-state setters
  // -------------------------------------------------------------------------
  // Each persists the row. setExitState() also publishes
  // ExitStateChangedEvent and returns false (logging why) for an illegal
  // transition or a no-op.
  // -------------------------------------------------------------------------
  bool setExitState(const domain::PositionKey& key, domain::ExitState next,
                    const std::string& reason);
  void markDcaRungFired(const domain::PositionKey& key, int rung_index);
  void setHalted(const domain::PositionKey& key, bool halted,
                 const std::string& reason);
  void setNeedsAttention(const domain::PositionKey& key, bool needs_attention);
  void recordError(const domain::PositionKey& key, const std::string& error);

  // Mark-to-market results from PnlEngine. In memory only; persisted with
  // the next row write.
  void updateMarks(const domain::PositionKey& key, double unrealized,
                   double worst, double best);

  // -------------------------------------------------------------------------
  // verifyAgainstBroker(key, broker_quantity)
  // -------------------------------------------------------------------------
  // @throws DriftDetectedError when the ledger quantity differs.
  // -------------------------------------------------------------------------
  void verifyAgainstBroker(const domain::PositionKey& key,
                           std::int64_t broker_quantity) const;

  std::vector<domain::Position> snapshots() const;
  std::vector<domain::PositionKey> keys() const;

  // Applies one fill in place, with the role it should carry.
  static void applyFill(domain::Position& position, const domain::Fill& fill,
                        double multiplier);

  // Folds a fill log into a fresh position for the key. Duplicate fill ids
  // inside the log are applied once.
  static domain::Position replay(const domain::PositionKey& key,
                                 const std::vector<domain::Fill>& fills,
                                 const domain::InstrumentTable& instruments);

 private:
  void onBrokerFill(const BrokerFillEvent& event);

  domain::FillRole roleFor(const domain::Fill& fill) const;

  // Copies the row, lets fn modify it, persists, commits. Returns the
  // committed row.
  template <typename Fn>
  domain::Position mutate(const domain::PositionKey& key, Fn fn);

  domain::Position rowOrFlat(const domain::PositionKey& key) const;
  void commit(const domain::Position& position);

  EventBus& bus_;
  IStateStore& store_;
  const domain::InstrumentTable& instruments_;
  const OrderTracker& tracker_;
  const ITimeProvider& time_provider_;

  mutable std::shared_mutex positions_mutex_;
  std::map<domain::PositionKey, domain::Position> positions_;

  // Loop thread only.
  std::map<domain::PositionKey, std::unordered_set<std::string>> seen_fill_ids_;

  SubscriptionSet subscriptions_;
};

}  // namespace flatguard
