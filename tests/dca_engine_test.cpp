// =============================================================================
// dca_engine_test.cpp
// =============================================================================
// Unit tests for flatguard::DcaEngine.
//
// Validates:
//   - A rung fires once price reaches its adverse distance, the average
//     entry is recomputed from the fill, and the take-profit is replaced
//   - Fired rungs are persisted and never re-fire after a restore
//   - max_quantity caps the ladder, counting scale-ins not yet filled
//   - At most one rung per tick, and none on a tick through the stop-loss
//   - PERCENT and ATR trigger modes, and the short side
//   - No rung fires while an exit is in flight
//   - A rejected rung raises an alert and restores the take-profit
//   - Invalid ladders are refused
// =============================================================================

#include "flatguard/domain/errors.hpp"

#include "support/shard_harness.hpp"

#include <gtest/gtest.h>

using flatguard::domain::DcaConfig;
using flatguard::domain::DcaRung;
using flatguard::domain::DcaTriggerMode;
using flatguard::domain::OrderPurpose;
using flatguard::domain::PositionKey;
using flatguard::domain::Side;

class DcaEngineTest : public ::testing::Test {
 protected:
  flatguard::testing_support::ShardHarness h;
  const PositionKey key{"ACC1", "TEST"};  // tick 1.0, multiplier 1

  static DcaConfig ladder(DcaTriggerMode mode, std::vector<DcaRung> rungs,
                          std::int64_t max_quantity, int take_profit_ticks = 0) {
    DcaConfig config;
    config.mode = mode;
    config.rungs = std::move(rungs);
    config.max_quantity = max_quantity;
    config.take_profit_ticks = take_profit_ticks;
    return config;
  }
};

// -----------------------------------------------------------------------------
// 1. Long 3 @ 100 with a rung at 10 ticks for 2: price 90 fires the rung,
//    the fill averages the entry to 96, and the take-profit is replaced.
// Why: A take-profit sized and priced for the old position would close only
//      part of the new one at the wrong level.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, RungFiresAveragesEntryAndReplacesTakeProfit) {
  h.dca->configure(key, ladder(DcaTriggerMode::Ticks, {{10.0, 2}}, 10, 5));
  h.open(key, Side::Buy, 3, 100.0);

  auto take_profits = h.placedWith(OrderPurpose::TakeProfit);
  ASSERT_EQ(take_profits.size(), 1u);
  const auto first_tp = take_profits[0];

  h.tick("TEST", 95.0);
  EXPECT_TRUE(h.placedWith(OrderPurpose::DcaEntry).empty());

  h.tick("TEST", 90.0);
  auto dca_orders = h.placedWith(OrderPurpose::DcaEntry);
  ASSERT_EQ(dca_orders.size(), 1u);
  EXPECT_EQ(h.ledger->currentPosition(key).dca_triggered_indices.count(0), 1u);
  const auto cancels = h.broker.cancels();
  ASSERT_EQ(cancels.size(), 1u);
  EXPECT_EQ(cancels[0], first_tp);

  h.fillOrder(dca_orders[0], 90.0);

  const auto position = h.ledger->currentPosition(key);
  EXPECT_EQ(position.quantity, 5);
  EXPECT_DOUBLE_EQ(position.average_entry_price, 96.0);

  take_profits = h.placedWith(OrderPurpose::TakeProfit);
  ASSERT_EQ(take_profits.size(), 2u);
  const auto replacement = h.broker.lastPlaced();
  ASSERT_TRUE(replacement.has_value());
  EXPECT_EQ(replacement->intent.purpose, OrderPurpose::TakeProfit);
  EXPECT_EQ(replacement->intent.side, Side::Sell);
  EXPECT_EQ(replacement->intent.quantity, 5);
  EXPECT_DOUBLE_EQ(replacement->intent.limit_price, 101.0);

  // The only rung has fired; lower prices add nothing.
  h.tick("TEST", 80.0);
  EXPECT_EQ(h.placedWith(OrderPurpose::DcaEntry).size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. Fired rung indices survive a restart.
// Why: Re-firing a rung after every restart would keep scaling in.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, FiredRungsDoNotRefireAfterRestore) {
  flatguard::domain::Fill entry;
  entry.fill_id = "F-1";
  entry.account_id = key.account_id;
  entry.symbol = key.symbol;
  entry.side = Side::Buy;
  entry.quantity = 3;
  entry.price = 100.0;
  h.store.appendFill(entry);

  flatguard::domain::Position row;
  row.account_id = key.account_id;
  row.symbol = key.symbol;
  row.quantity = 3;
  row.average_entry_price = 100.0;
  row.fill_count = 1;
  row.dca_triggered_indices = {0};
  h.ledger->restore(row);

  h.dca->configure(key,
                   ladder(DcaTriggerMode::Ticks, {{10.0, 1}, {20.0, 1}}, 10));

  h.tick("TEST", 90.0);
  EXPECT_TRUE(h.placedWith(OrderPurpose::DcaEntry).empty());

  h.tick("TEST", 80.0);
  ASSERT_EQ(h.placedWith(OrderPurpose::DcaEntry).size(), 1u);
  const auto stored = h.store.loadPositions();
  ASSERT_EQ(stored.size(), 1u);
  EXPECT_EQ(stored[0].dca_triggered_indices.count(1), 1u);
}

// -----------------------------------------------------------------------------
// 3. A rung that would exceed max_quantity is skipped.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, MaxQuantityCapsLadder) {
  h.dca->configure(key, ladder(DcaTriggerMode::Ticks, {{10.0, 2}}, 4));
  h.open(key, Side::Buy, 3, 100.0);

  h.tick("TEST", 85.0);
  EXPECT_TRUE(h.placedWith(OrderPurpose::DcaEntry).empty());
  EXPECT_TRUE(h.ledger->currentPosition(key).dca_triggered_indices.empty());
}

// -----------------------------------------------------------------------------
// 4. A scale-in that is sent but not yet filled still counts against
//    max_quantity.
// Why: Booked quantity alone lets every tick before the fill add a rung.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, UnfilledRungCountsTowardsCap) {
  h.dca->configure(key,
                   ladder(DcaTriggerMode::Ticks, {{10.0, 2}, {12.0, 2}}, 6));
  h.open(key, Side::Buy, 3, 100.0);

  h.tick("TEST", 88.0);
  ASSERT_EQ(h.placedWith(OrderPurpose::DcaEntry).size(), 1u);

  h.tick("TEST", 87.0);
  const auto dca_orders = h.placedWith(OrderPurpose::DcaEntry);
  EXPECT_EQ(dca_orders.size(), 1u);

  std::int64_t exposure = h.ledger->currentPosition(key).quantity;
  for (const auto& order : h.broker.placed()) {
    if (order.intent.purpose == OrderPurpose::DcaEntry) {
      exposure += order.intent.quantity;
    }
  }
  EXPECT_LE(exposure, 6);
  EXPECT_EQ(h.tracker->workingQuantity(key, OrderPurpose::DcaEntry), 2);
}

// -----------------------------------------------------------------------------
// 5. Two rungs newly in reach fire on separate ticks, nearest first.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, OneRungPerTick) {
  h.dca->configure(key,
                   ladder(DcaTriggerMode::Ticks, {{10.0, 1}, {12.0, 1}}, 10));
  h.open(key, Side::Buy, 3, 100.0);

  h.tick("TEST", 85.0);
  ASSERT_EQ(h.placedWith(OrderPurpose::DcaEntry).size(), 1u);
  auto fired = h.ledger->currentPosition(key).dca_triggered_indices;
  EXPECT_EQ(fired.size(), 1u);
  EXPECT_EQ(fired.count(0), 1u);

  h.tick("TEST", 85.0);
  EXPECT_EQ(h.placedWith(OrderPurpose::DcaEntry).size(), 2u);
  fired = h.ledger->currentPosition(key).dca_triggered_indices;
  EXPECT_EQ(fired.count(1), 1u);
}

// -----------------------------------------------------------------------------
// 6. A gap through both a rung and the stop-loss exits without scaling in.
// Why: A scale-in sent just before the exit only adds to what must be closed.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, NoRungOnTickThroughStopLoss) {
  DcaConfig config = ladder(DcaTriggerMode::Ticks, {{10.0, 2}}, 10);
  config.stop_loss_ticks = 15;
  h.dca->configure(key, config);
  h.open(key, Side::Buy, 3, 100.0);

  h.tick("TEST", 80.0);

  EXPECT_TRUE(h.placedWith(OrderPurpose::DcaEntry).empty());
  EXPECT_TRUE(h.ledger->currentPosition(key).dca_triggered_indices.empty());
  const auto exits = h.placedWith(OrderPurpose::Exit);
  ASSERT_EQ(exits.size(), 1u);
  EXPECT_EQ(h.broker.lastPlaced()->intent.quantity, 3);
  EXPECT_EQ(h.ledger->currentPosition(key).exit_state,
            flatguard::domain::ExitState::WorkingExit);
}

// -----------------------------------------------------------------------------
// 7. PERCENT mode measures from the average entry.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, PercentModeTriggers) {
  h.dca->configure(key, ladder(DcaTriggerMode::Percent, {{2.5, 1}}, 10));
  h.open(key, Side::Buy, 1, 100.0);

  h.tick("TEST", 98.0);
  EXPECT_TRUE(h.placedWith(OrderPurpose::DcaEntry).empty());
  h.tick("TEST", 97.0);
  EXPECT_EQ(h.placedWith(OrderPurpose::DcaEntry).size(), 1u);
}

// -----------------------------------------------------------------------------
// 8. ATR mode waits for an ATR value; a short position scales by selling.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, AtrModeOnShortNeedsAtr) {
  h.dca->configure(key, ladder(DcaTriggerMode::Atr, {{2.0, 1}}, 10));
  h.open(key, Side::Sell, 2, 100.0);

  h.tick("TEST", 106.0);
  EXPECT_TRUE(h.placedWith(OrderPurpose::DcaEntry).empty());

  h.tick("TEST", 106.0, 2.5);
  auto dca_orders = h.placedWith(OrderPurpose::DcaEntry);
  ASSERT_EQ(dca_orders.size(), 1u);
  EXPECT_EQ(h.broker.lastPlaced()->intent.side, Side::Sell);
}

// -----------------------------------------------------------------------------
// 9. No rung fires while an exit is in flight or the position is halted.
// Why: Scaling into a position that is being flattened fights the exit.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, NoRungWhileExitingOrHalted) {
  h.dca->configure(key, ladder(DcaTriggerMode::Ticks, {{10.0, 1}}, 10));
  h.open(key, Side::Buy, 1, 100.0);

  h.ledger->setExitState(key, flatguard::domain::ExitState::PrepareExit, "test");
  h.tick("TEST", 80.0);
  EXPECT_TRUE(h.placedWith(OrderPurpose::DcaEntry).empty());

  h.ledger->setExitState(key, flatguard::domain::ExitState::Idle, "test");
  h.ledger->setHalted(key, true, "test halt");
  h.tick("TEST", 80.0);
  EXPECT_TRUE(h.placedWith(OrderPurpose::DcaEntry).empty());
}

// -----------------------------------------------------------------------------
// 10. A rejected rung is alerted and the take-profit put back.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, RejectedRungAlertsAndRestoresTakeProfit) {
  h.dca->configure(key, ladder(DcaTriggerMode::Ticks, {{10.0, 1}}, 10, 4));
  h.open(key, Side::Buy, 1, 100.0);
  ASSERT_EQ(h.placedWith(OrderPurpose::TakeProfit).size(), 1u);

  h.broker.rejectNextOrder("insufficient margin");
  h.tick("TEST", 90.0);

  auto alerts = h.seenOf<flatguard::AlertEvent>();
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].source, "DcaEngine");
  EXPECT_NE(alerts[0].message.find("insufficient margin"), std::string::npos);

  EXPECT_EQ(h.placedWith(OrderPurpose::TakeProfit).size(), 2u);
  EXPECT_EQ(h.broker.lastPlaced()->intent.limit_price, 104.0);
  EXPECT_EQ(h.ledger->currentPosition(key).dca_triggered_indices.count(0), 1u);
}

// -----------------------------------------------------------------------------
// 11. Ladders with non-increasing distances or empty rungs are refused.
// -----------------------------------------------------------------------------
TEST_F(DcaEngineTest, InvalidLadderIsRefused) {
  EXPECT_THROW(h.dca->configure(key, ladder(DcaTriggerMode::Ticks,
                                            {{10.0, 1}, {10.0, 1}}, 10)),
               flatguard::ConfigError);
  EXPECT_THROW(
      h.dca->configure(key, ladder(DcaTriggerMode::Ticks, {{5.0, 0}}, 10)),
      flatguard::ConfigError);
  EXPECT_FALSE(h.dca->config(key).has_value());

  // Trigger formula guard rails.
  EXPECT_FALSE(flatguard::DcaEngine::adverseExcursion(
                   DcaTriggerMode::Atr, 1, 100.0, 90.0, 1.0, std::nullopt)
                   .has_value());
  EXPECT_DOUBLE_EQ(*flatguard::DcaEngine::adverseExcursion(
                       DcaTriggerMode::Ticks, -1, 100.0, 101.0, 0.25,
                       std::nullopt),
                   4.0);
}
