// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for flatguard::PositionLedger and flatguard::OrderTracker.
//
// Validates:
//   - Fill math: open, scale-in average, partial close, reversal through zero
//   - Realized PnL is in currency (contract multiplier applied)
//   - Fill roles come from the tracked order's purpose
//   - Duplicate fill ids are ignored
//   - A fill that would grow a position during an exit is refused
//   - Startup restore: replay wins when the log is ahead, corruption halts
//   - Exit-state transitions are validated and published
//   - rebuild() replays the fill log to the incrementally booked state
//   - The tracker applies fills that reach it before the order is tracked
//
// Runs one shard's component chain on a bare EventBus (ShardHarness).
// =============================================================================

#include "flatguard/domain/errors.hpp"

#include "support/shard_harness.hpp"

#include <gtest/gtest.h>

#include <string>

using flatguard::domain::ExitState;
using flatguard::domain::Fill;
using flatguard::domain::FillRole;
using flatguard::domain::Position;
using flatguard::domain::PositionKey;
using flatguard::domain::Side;

class PositionLedgerTest : public ::testing::Test {
 protected:
  flatguard::testing_support::ShardHarness h;
  const PositionKey key{"ACC1", "TEST"};
  const PositionKey mes{"ACC1", "MES"};

  Fill makeFill(const std::string& id, const PositionKey& k, Side side,
                std::int64_t quantity, double price) {
    Fill fill;
    fill.fill_id = id;
    fill.account_id = k.account_id;
    fill.symbol = k.symbol;
    fill.side = side;
    fill.quantity = quantity;
    fill.price = price;
    fill.timestamp_ms = h.clock.now_ms();
    return fill;
  }
};

// -----------------------------------------------------------------------------
// 1. An entry fill opens the position and is published.
// Why: Everything downstream (PnL, DCA, exits) keys off PositionChangedEvent.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, EntryFillOpensPositionAndPublishes) {
  const Position p = h.open(key, Side::Buy, 3, 100.0);

  EXPECT_EQ(p.quantity, 3);
  EXPECT_EQ(p.side, flatguard::domain::PositionSide::Long);
  EXPECT_DOUBLE_EQ(p.average_entry_price, 100.0);
  EXPECT_EQ(p.opened_at_ms, h.clock.now_ms());
  EXPECT_EQ(p.fill_count, 1u);

  auto changes = h.seenOf<flatguard::PositionChangedEvent>();
  ASSERT_EQ(changes.size(), 1u);
  ASSERT_TRUE(changes[0].fill.has_value());
  EXPECT_EQ(changes[0].fill->role, FillRole::Entry);
  EXPECT_EQ(h.store.loadFills(key).size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Scale-in averages the entry; a partial close realizes PnL in currency.
// Why: MES is worth 5 per point. Points instead of dollars would understate
//      losses five-fold.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ScaleInAveragesAndCloseRealizesWithMultiplier) {
  h.ledger->recordFill(makeFill("F1", mes, Side::Buy, 1, 5000.0));
  h.ledger->recordFill(makeFill("F2", mes, Side::Buy, 1, 5010.0));

  Position p = h.ledger->currentPosition(mes);
  EXPECT_EQ(p.quantity, 2);
  EXPECT_DOUBLE_EQ(p.average_entry_price, 5005.0);

  h.ledger->recordFill(makeFill("F3", mes, Side::Sell, 1, 5015.0));
  p = h.ledger->currentPosition(mes);
  EXPECT_EQ(p.quantity, 1);
  EXPECT_DOUBLE_EQ(p.average_entry_price, 5005.0);
  EXPECT_DOUBLE_EQ(p.realized_pnl, 10.0 * 5.0);
}

// -----------------------------------------------------------------------------
// 3. A fill that crosses zero closes the old side and opens the new one at
//    the fill price.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ReversalFillCrossesZero) {
  h.ledger->recordFill(makeFill("F1", key, Side::Buy, 2, 100.0));
  h.clock.advance_by(1000);
  h.ledger->recordFill(makeFill("F2", key, Side::Sell, 3, 110.0));

  const Position p = h.ledger->currentPosition(key);
  EXPECT_EQ(p.quantity, -1);
  EXPECT_EQ(p.side, flatguard::domain::PositionSide::Short);
  EXPECT_DOUBLE_EQ(p.average_entry_price, 110.0);
  EXPECT_DOUBLE_EQ(p.realized_pnl, 20.0);
  EXPECT_EQ(p.opened_at_ms, h.clock.now_ms());
}

// -----------------------------------------------------------------------------
// 4. The same fill id delivered twice is booked once.
// Why: Brokers replay fills after reconnects; double-booking doubles the
//      position the engine thinks it has to exit.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, DuplicateFillIdIsIgnored) {
  const Fill fill = makeFill("F1", key, Side::Buy, 2, 100.0);
  h.bus.publish(flatguard::BrokerFillEvent{fill, {}});
  h.bus.publish(flatguard::BrokerFillEvent{fill, {}});

  EXPECT_FALSE(h.ledger->recordFill(fill).has_value());
  const Position p = h.ledger->currentPosition(key);
  EXPECT_EQ(p.quantity, 2);
  EXPECT_EQ(p.fill_count, 1u);
  EXPECT_EQ(h.store.loadFills(key).size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. While an exit is in flight a growing fill is refused; a reducing fill
//    is booked.
// Why: An entry landing mid-exit would leave the exit undersized.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, GrowingFillDuringExitIsRefused) {
  h.ledger->recordFill(makeFill("F1", key, Side::Buy, 2, 100.0));
  ASSERT_TRUE(h.ledger->setExitState(key, ExitState::PrepareExit, "test"));

  EXPECT_THROW(h.ledger->recordFill(makeFill("F2", key, Side::Buy, 1, 99.0)),
               flatguard::ConflictingIntentError);
  EXPECT_EQ(h.ledger->currentPosition(key).quantity, 2);

  // Through the bus the refusal becomes an alert and a recorded error.
  h.bus.publish(flatguard::BrokerFillEvent{
      makeFill("F3", key, Side::Buy, 1, 99.0), {}});
  auto alerts = h.seenOf<flatguard::AlertEvent>();
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].source, "PositionLedger");
  EXPECT_FALSE(h.ledger->currentPosition(key).last_error.empty());

  h.ledger->recordFill(makeFill("F4", key, Side::Sell, 1, 101.0));
  EXPECT_EQ(h.ledger->currentPosition(key).quantity, 1);
}

// -----------------------------------------------------------------------------
// 6. On restore, a fill log that is ahead of the stored row wins.
// Why: The row write can be lost in a crash after the fill append.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RestoreReplaysWhenLogIsAhead) {
  h.store.appendFill(makeFill("F1", key, Side::Buy, 2, 100.0));
  h.store.appendFill(makeFill("F2", key, Side::Buy, 1, 103.0));

  Position row;
  row.account_id = key.account_id;
  row.symbol = key.symbol;
  row.quantity = 2;
  row.average_entry_price = 100.0;
  row.fill_count = 1;

  const Position restored = h.ledger->restore(row);
  EXPECT_EQ(restored.quantity, 3);
  EXPECT_DOUBLE_EQ(restored.average_entry_price, 101.0);
  EXPECT_EQ(restored.fill_count, 2u);
  EXPECT_FALSE(restored.halted);

  // Restored fill ids are remembered for de-duplication.
  EXPECT_FALSE(
      h.ledger->recordFill(makeFill("F2", key, Side::Buy, 1, 103.0)).has_value());
}

// -----------------------------------------------------------------------------
// 7. A row that disagrees with its fill log halts the symbol.
// Why: Neither copy can be trusted; trading on a guessed size is worse than
//      stopping.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RestoreDetectsCorruptionAndHalts) {
  h.store.appendFill(makeFill("F1", key, Side::Buy, 2, 100.0));

  Position row;
  row.account_id = key.account_id;
  row.symbol = key.symbol;
  row.quantity = 5;
  row.fill_count = 1;

  EXPECT_THROW(h.ledger->restore(row), flatguard::LedgerCorruptionError);
  const Position p = h.ledger->currentPosition(key);
  EXPECT_TRUE(p.halted);
  EXPECT_NE(p.last_error.find("ledger corruption"), std::string::npos);

  auto alerts = h.seenOf<flatguard::AlertEvent>();
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].severity, flatguard::AlertEvent::Severity::Fatal);

  row.fill_count = 3;
  row.quantity = 2;
  EXPECT_THROW(h.ledger->restore(row), flatguard::LedgerCorruptionError);
}

// -----------------------------------------------------------------------------
// 8. Only legal exit transitions are applied, and each one is published.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ExitTransitionsAreValidated) {
  h.ledger->recordFill(makeFill("F1", key, Side::Buy, 1, 100.0));

  EXPECT_FALSE(h.ledger->setExitState(key, ExitState::WorkingExit, "skip"));
  EXPECT_FALSE(h.ledger->setExitState(key, ExitState::Idle, "same"));
  EXPECT_TRUE(h.ledger->setExitState(key, ExitState::PrepareExit, "exit"));
  EXPECT_TRUE(h.ledger->setExitState(key, ExitState::WorkingExit, "sent"));

  auto changes = h.seenOf<flatguard::ExitStateChangedEvent>();
  ASSERT_EQ(changes.size(), 2u);
  EXPECT_EQ(changes[1].from, ExitState::PrepareExit);
  EXPECT_EQ(changes[1].to, ExitState::WorkingExit);
  EXPECT_EQ(h.ledger->currentPosition(key).last_transition,
            "PREPARE_EXIT -> WORKING_EXIT: sent");
}

// -----------------------------------------------------------------------------
// 9. verifyAgainstBroker reports both quantities on mismatch.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, VerifyAgainstBrokerThrowsOnMismatch) {
  h.ledger->recordFill(makeFill("F1", key, Side::Sell, 2, 100.0));

  EXPECT_NO_THROW(h.ledger->verifyAgainstBroker(key, -2));
  try {
    h.ledger->verifyAgainstBroker(key, 0);
    FAIL() << "expected DriftDetectedError";
  } catch (const flatguard::DriftDetectedError& e) {
    EXPECT_EQ(e.virtualQuantity(), -2);
    EXPECT_EQ(e.brokerQuantity(), 0);
  }
}

// -----------------------------------------------------------------------------
// 10. Orders leave the working set when filled or cancelled, but their
//     purpose stays known for late events.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, TrackerKeepsPurposeAfterOrderCompletes) {
  const auto intent = flatguard::domain::OrderIntent::limit(
      key, Side::Sell, 1, 120.0, flatguard::domain::OrderPurpose::TakeProfit);
  h.tracker->track("TP-1", intent, h.clock.now_ms());
  EXPECT_EQ(h.tracker->workingOrders(key).size(), 1u);
  EXPECT_FALSE(h.tracker->hasPendingMarketOrders(key, h.clock.now_ms(), 2000));

  h.tracker->markCanceled("TP-1");
  EXPECT_TRUE(h.tracker->workingOrders(key).empty());
  EXPECT_FALSE(h.tracker->find("TP-1").has_value());
  ASSERT_TRUE(h.tracker->purposeOf("TP-1").has_value());
  EXPECT_EQ(*h.tracker->purposeOf("TP-1"),
            flatguard::domain::OrderPurpose::TakeProfit);

  EXPECT_TRUE(flatguard::OrderTracker::transitionStatus(
      flatguard::domain::OrderStatus::Accepted,
      flatguard::domain::OrderStatus::Filled));
  EXPECT_FALSE(flatguard::OrderTracker::transitionStatus(
      flatguard::domain::OrderStatus::Filled,
      flatguard::domain::OrderStatus::Canceled));
}

// -----------------------------------------------------------------------------
// 11. Replaying the fill log reproduces the incrementally booked position.
// Why: Restart recovery and drift repair both rebuild from the log; a replay
//      that disagrees with live booking would move the position on restart.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RebuildMatchesIncrementalBooking) {
  h.ledger->recordFill(makeFill("F1", key, Side::Buy, 2, 100.0));
  h.ledger->recordFill(makeFill("F2", key, Side::Buy, 1, 94.0));
  h.ledger->recordFill(makeFill("F3", key, Side::Sell, 1, 105.0));
  const Fill reversal = makeFill("F4", key, Side::Sell, 4, 110.0);
  h.ledger->recordFill(reversal);
  EXPECT_FALSE(h.ledger->recordFill(reversal).has_value());
  Fill correction = makeFill("RECON-1-1", key, Side::Buy, 1, 108.0);
  correction.role = FillRole::Reconcile;
  h.ledger->recordFill(correction);

  const Position live = h.ledger->currentPosition(key);
  EXPECT_EQ(live.quantity, -1);
  EXPECT_EQ(live.fill_count, 5u);

  const Position rebuilt = h.ledger->rebuild(key);
  EXPECT_EQ(rebuilt.quantity, live.quantity);
  EXPECT_EQ(rebuilt.side, live.side);
  EXPECT_DOUBLE_EQ(rebuilt.average_entry_price, live.average_entry_price);
  EXPECT_DOUBLE_EQ(rebuilt.realized_pnl, live.realized_pnl);
  EXPECT_EQ(rebuilt.fill_count, live.fill_count);
  EXPECT_EQ(h.ledger->currentPosition(key).quantity, live.quantity);
}

// -----------------------------------------------------------------------------
// 12. A fill that arrives before its order is tracked is applied on track().
// Why: The kill switch places its flatten off-loop, so the fill can win the
//      race to the shard.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, TrackerAppliesFillsThatArriveFirst) {
  using flatguard::domain::OrderPurpose;
  Fill early = makeFill("F1", key, Side::Sell, 1, 100.0);
  early.order_id = "KS-1";
  h.bus.publish(flatguard::BrokerFillEvent{early, {}});

  h.tracker->track("KS-1",
                   flatguard::domain::OrderIntent::exit(key, Side::Sell, 2),
                   h.clock.now_ms());
  ASSERT_TRUE(h.tracker->find("KS-1").has_value());
  EXPECT_EQ(h.tracker->find("KS-1")->status,
            flatguard::domain::OrderStatus::PartiallyFilled);
  EXPECT_EQ(h.tracker->workingQuantity(key, OrderPurpose::Exit), 1);

  Fill whole = makeFill("F2", key, Side::Sell, 1, 100.0);
  whole.order_id = "KS-2";
  h.bus.publish(flatguard::BrokerFillEvent{whole, {}});
  h.tracker->track("KS-2",
                   flatguard::domain::OrderIntent::exit(key, Side::Sell, 1),
                   h.clock.now_ms());
  EXPECT_FALSE(h.tracker->find("KS-2").has_value());
  ASSERT_TRUE(h.tracker->purposeOf("KS-2").has_value());
  EXPECT_EQ(*h.tracker->purposeOf("KS-2"), OrderPurpose::Exit);
}
