#include "flatguard/pnl/pnl_engine.hpp"
#include "flatguard/pnl/pnl_math.hpp"

#include <algorithm>

namespace flatguard {

PnlEngine::PnlEngine(EventBus& bus, PositionLedger& ledger,
                     const PriceFeed& feed,
                     const domain::InstrumentTable& instruments)
    : ledger_(ledger),
      feed_(feed),
      instruments_(instruments),
      subscriptions_(bus) {
  subscriptions_.add<PriceTickEvent>(
      [this](const PriceTickEvent& e) { onTick(e); });
  subscriptions_.add<PositionChangedEvent>(
      [this](const PositionChangedEvent& e) { onPositionChanged(e); });
}

domain::PnlSnapshot PnlEngine::snapshot(const domain::PositionKey& key) const {
  const domain::Position position = ledger_.currentPosition(key);
  domain::PnlSnapshot snap;
  snap.realized = position.realized_pnl;
  snap.unrealized = position.unrealized_pnl;
  snap.worst_unrealized = position.worst_unrealized_pnl;
  snap.best_unrealized = position.best_unrealized_pnl;
  return snap;
}

void PnlEngine::onTick(const PriceTickEvent& event) {
  for (const domain::Position& position : ledger_.snapshots()) {
    if (position.symbol == event.symbol && !position.isFlat()) {
      mark(position, event.price);
    }
  }
}

void PnlEngine::onPositionChanged(const PositionChangedEvent& event) {
  const domain::Position& position = event.position;
  if (position.isFlat()) {
    return;
  }
  std::optional<double> last = feed_.lastPrice(position.symbol);
  if (last) {
    mark(position, *last);
  }
}

void PnlEngine::mark(const domain::Position& position, double last_price) {
  const double unrealized = pnl::unrealizedPnl(
      position.quantity, position.average_entry_price, last_price,
      instruments_.lookup(position.symbol).multiplier);
  ledger_.updateMarks(position.key(), unrealized,
                      std::min(position.worst_unrealized_pnl, unrealized),
                      std::max(position.best_unrealized_pnl, unrealized));
}

}  // namespace flatguard
