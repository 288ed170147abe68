#pragma once

#include "flatguard/domain/command_result.hpp"
#include "flatguard/domain/instrument.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/events/engine_events.hpp"
#include "flatguard/events/event_types.hpp"
#include "flatguard/feed/price_feed.hpp"
#include "flatguard/ledger/position_ledger.hpp"

namespace flatguard {

// -----------------------------------------------------------------------------
// PnlEngine — mark-to-market for the shard's open positions
// -----------------------------------------------------------------------------
//
// @brief  Recomputes unrealized PnL on every tick and after every position
//         change, and tracks the worst and best unrealized PnL of the
//         current lifecycle.
//
// @details
//   unrealized = (last - avg) * quantity * multiplier
//   worst      = min(worst, unrealized)   never moves up while open
//   best       = max(best, unrealized)
//
// Realized PnL is booked by the ledger when fills close quantity; this
// class only reads it for snapshot(). Results go back into the ledger via
// PositionLedger::updateMarks().
//
// Thread model: Shard loop thread only.
// Ownership:    Owned by PositionDesk.
// -----------------------------------------------------------------------------
class PnlEngine {
 public:
  PnlEngine(EventBus& bus, PositionLedger& ledger, const PriceFeed& feed,
            const domain::InstrumentTable& instruments);

  PnlEngine(const PnlEngine&) = delete;
  PnlEngine& operator=(const PnlEngine&) = delete;

  // Current PnL figures for the key, as last marked.
  domain::PnlSnapshot snapshot(const domain::PositionKey& key) const;

 private:
  void onTick(const PriceTickEvent& event);
  void onPositionChanged(const PositionChangedEvent& event);
  void mark(const domain::Position& position, double last_price);

  PositionLedger& ledger_;
  const PriceFeed& feed_;
  const domain::InstrumentTable& instruments_;

  SubscriptionSet subscriptions_;
};

}  // namespace flatguard
