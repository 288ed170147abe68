// =============================================================================
// drift_reconciler_test.cpp
// =============================================================================
// Unit tests for flatguard::DriftReconciler.
//
// Validates:
//   - Broker holds a position the ledger does not know about: a drift record
//     is written and the ledger corrected, with no order sent
//   - The broker's fill history is adopted when it nets to the broker
//     quantity
//   - Reconciliation defers during exits, for halted positions, and while a
//     fresh market order is unfilled
//   - Operator-forced reconciliation ignores the deferral rules
//   - Broker outages skip the key instead of guessing
// =============================================================================

#include "support/shard_harness.hpp"

#include <gtest/gtest.h>

using flatguard::domain::DriftResolution;
using flatguard::domain::ExitState;
using flatguard::domain::FillRole;
using flatguard::domain::OrderIntent;
using flatguard::domain::OrderPurpose;
using flatguard::domain::PositionKey;
using flatguard::domain::Side;

class DriftReconcilerTest : public ::testing::Test {
 protected:
  flatguard::testing_support::ShardHarness h;
  const PositionKey key{"ACC1", "TEST"};

  std::size_t driftCount() const {
    return h.reconciler->driftRecords(key).size();
  }
};

// -----------------------------------------------------------------------------
// 1. Ledger flat, broker long 2: a drift record, a ledger correction to 2,
//    and no order.
// Why: The engine must never trade its way out of a disagreement on its
//      own; it records and adopts the broker's view.
// -----------------------------------------------------------------------------
TEST_F(DriftReconcilerTest, UnknownBrokerPositionIsAdoptedWithoutOrders) {
  h.tick("TEST", 100.0);
  h.broker.setPosition(key, 2);

  flatguard::PositionSnapshotEvent snapshot;
  snapshot.account_id = key.account_id;
  snapshot.symbol = key.symbol;
  snapshot.quantity = 2;
  h.bus.publish(snapshot);

  const auto position = h.ledger->currentPosition(key);
  EXPECT_EQ(position.quantity, 2);
  EXPECT_DOUBLE_EQ(position.average_entry_price, 100.0);
  EXPECT_EQ(h.broker.placeCalls(), 0);

  const auto records = h.reconciler->driftRecords(key);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].virtual_quantity, 0);
  EXPECT_EQ(records[0].broker_quantity, 2);
  EXPECT_EQ(records[0].resolution, DriftResolution::CorrectedToBroker);
  EXPECT_GT(records[0].resolved_at_ms, 0);

  const auto fills = h.store.loadFills(key);
  ASSERT_EQ(fills.size(), 1u);
  EXPECT_EQ(fills[0].role, FillRole::Reconcile);

  const auto events = h.seenOf<flatguard::DriftDetectedEvent>();
  ASSERT_EQ(events.size(), 2u);
  EXPECT_EQ(events[0].record.resolution, DriftResolution::Pending);
  EXPECT_EQ(events[1].record.resolution, DriftResolution::CorrectedToBroker);
}

// -----------------------------------------------------------------------------
// 2. A missed fill that appears in the broker's history is rebuilt from it,
//    keeping local roles.
// -----------------------------------------------------------------------------
TEST_F(DriftReconcilerTest, RebuildsFromBrokerFillHistory) {
  h.open(key, Side::Buy, 2, 100.0);

  flatguard::domain::Fill missed;
  missed.fill_id = "F-MISSED";
  missed.account_id = key.account_id;
  missed.symbol = key.symbol;
  missed.side = Side::Buy;
  missed.quantity = 1;
  missed.price = 103.0;
  h.broker.addHistoryFill(missed);
  h.broker.setPosition(key, 3);

  h.bus.publish(flatguard::ReconcileTimerEvent{1});

  const auto position = h.ledger->currentPosition(key);
  EXPECT_EQ(position.quantity, 3);
  EXPECT_DOUBLE_EQ(position.average_entry_price, 101.0);
  EXPECT_EQ(position.fill_count, 2u);

  const auto records = h.reconciler->driftRecords(key);
  ASSERT_EQ(records.size(), 1u);
  EXPECT_EQ(records[0].resolution, DriftResolution::RebuiltFromBrokerFills);

  const auto fills = h.store.loadFills(key);
  ASSERT_EQ(fills.size(), 2u);
  EXPECT_EQ(fills[0].role, FillRole::Entry);
  EXPECT_EQ(h.broker.placeCalls(), 1);  // the entry only
}

// -----------------------------------------------------------------------------
// 3. Automated passes wait while an exit is in flight or the symbol is
//    halted; an operator-forced pass does not.
// Why: Mid-exit the ledger and broker legitimately disagree for a moment.
// -----------------------------------------------------------------------------
TEST_F(DriftReconcilerTest, DefersDuringExitAndWhenHalted) {
  h.open(key, Side::Buy, 1, 100.0);
  h.broker.setPosition(key, 0);

  h.ledger->setExitState(key, ExitState::PrepareExit, "test");
  h.reconciler->sweep();
  EXPECT_EQ(driftCount(), 0u);

  h.ledger->setExitState(key, ExitState::Idle, "test");
  h.ledger->setHalted(key, true, "test halt");
  EXPECT_FALSE(h.reconciler->reconcileKey(key).has_value());
  EXPECT_EQ(driftCount(), 0u);

  const auto forced = h.reconciler->reconcileKey(key, true);
  ASSERT_TRUE(forced.has_value());
  EXPECT_EQ(forced->note, "operator");
  EXPECT_TRUE(h.ledger->currentPosition(key).isFlat());
}

// -----------------------------------------------------------------------------
// 4. A market order placed within the grace window defers reconciliation;
//    once the window passes the drift is handled.
// -----------------------------------------------------------------------------
TEST_F(DriftReconcilerTest, PendingMarketOrderGraceWindow) {
  h.open(key, Side::Buy, 1, 100.0);

  const OrderIntent scale =
      OrderIntent::market(key, Side::Buy, 1, OrderPurpose::Entry);
  h.tracker->track(h.gateway.placeOrder(scale), scale, h.clock.now_ms());
  h.broker.setPosition(key, 2);

  h.reconciler->sweep();
  EXPECT_EQ(driftCount(), 0u);

  h.clock.advance_by(h.config.reconcile.pending_order_grace_ms + 1);
  h.reconciler->sweep();
  EXPECT_EQ(driftCount(), 1u);
  EXPECT_EQ(h.ledger->currentPosition(key).quantity, 2);
}

// -----------------------------------------------------------------------------
// 5. Agreement records nothing; an unreachable broker skips the key.
// -----------------------------------------------------------------------------
TEST_F(DriftReconcilerTest, NoDriftAndBrokerOutageRecordNothing) {
  h.open(key, Side::Sell, 2, 100.0);

  EXPECT_FALSE(h.reconciler->reconcileKey(key).has_value());

  h.broker.setPosition(key, 0);
  h.broker.failNextQueries(3);
  EXPECT_FALSE(h.reconciler->reconcileKey(key).has_value());
  EXPECT_EQ(driftCount(), 0u);
  EXPECT_EQ(h.ledger->currentPosition(key).quantity, -2);
}

// -----------------------------------------------------------------------------
// 6. Drift ids come from the shared generator and keep increasing.
// -----------------------------------------------------------------------------
TEST_F(DriftReconcilerTest, DriftIdsIncrease) {
  h.broker.setPosition(key, 1);
  const auto first = h.reconciler->reconcileKey(key);
  h.broker.setPosition(key, 3);
  const auto second = h.reconciler->reconcileKey(key);

  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->id, 1u);
  EXPECT_EQ(second->id, 2u);
  EXPECT_EQ(h.store.lastDriftId(), 2u);
}
