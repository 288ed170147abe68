#pragma once

#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/domain/dca_config.hpp"
#include "flatguard/domain/instrument.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/events/broker_events.hpp"
#include "flatguard/events/engine_events.hpp"
#include "flatguard/events/event_types.hpp"
#include "flatguard/feed/price_feed.hpp"
#include "flatguard/ledger/order_tracker.hpp"
#include "flatguard/ledger/position_ledger.hpp"
#include "flatguard/persistence/i_state_store.hpp"
#include "flatguard/time/i_time_provider.hpp"

#include <map>
#include <optional>

namespace flatguard {

// -----------------------------------------------------------------------------
// DcaEngine — scale-in ladder and take-profit maintenance
// -----------------------------------------------------------------------------
//
// @brief  Fires DCA rungs as price moves against an open position, and
//         keeps one resting take-profit order sized to the whole position.
//
// @details
// On every PriceTickEvent, for each open position of the tick's symbol that
// is Idle, not halted and not flagged needs_attention:
//
//   1. Measure adverse excursion from the current average entry price in
//      the ladder's unit (adverseExcursion()).
//   2. Walk rungs in index order, skipping fired ones. The first rung whose
//      distance is reached and whose quantity keeps |position| within
//      max_quantity fires. At most one rung fires per tick.
//   3. Firing: the rung index is persisted as fired FIRST, then working
//      take-profit orders are cancelled, then a market DcaEntry order is
//      placed. A crash at any point after step one cannot fire the rung
//      again; a rejected order does not un-fire it either.
//
// On PositionChangedEvent:
//   Entry/Dca fill → cancel the old take-profit, place a new one at
//                    avg ± take_profit_ticks * tick_size for |quantity|.
//   Position flat  → cancel any leftover take-profit.
//
// Ladders come from configure() (per position, persisted) or from the
// per-symbol defaults handed to the constructor.
//
// Thread model: Shard loop thread only.
// Ownership:    Owned by PositionDesk.
// -----------------------------------------------------------------------------
class DcaEngine {
 public:
  DcaEngine(EventBus& bus, PositionLedger& ledger, OrderTracker& tracker,
            BrokerGateway& gateway, IStateStore& store, const PriceFeed& feed,
            const domain::InstrumentTable& instruments,
            const ITimeProvider& time_provider,
            std::map<domain::Symbol, domain::DcaConfig> symbol_defaults);

  DcaEngine(const DcaEngine&) = delete;
  DcaEngine& operator=(const DcaEngine&) = delete;

  // Validates (ConfigError), persists and installs a ladder for the key.
  void configure(const domain::PositionKey& key, const domain::DcaConfig& config);

  // Installs a ladder read back from the store at startup. No write.
  void restoreConfig(const domain::PositionKey& key,
                     const domain::DcaConfig& config);

  // The key's ladder, else the symbol default, else nullopt.
  std::optional<domain::DcaConfig> config(const domain::PositionKey& key) const;

  // Protective levels for the current position; nullopt when flat or the
  // protection is disabled.
  std::optional<double> takeProfitPrice(const domain::PositionKey& key) const;
  std::optional<double> stopLossPrice(const domain::PositionKey& key) const;

  // Cancels working take-profit orders for the key. Used before exits.
  void cancelTakeProfits(const domain::PositionKey& key);

  // -------------------------------------------------------------------------
  // adverseExcursion(mode, quantity, avg, price, tick_size, atr)
  // -------------------------------------------------------------------------
  // @brief  How far price has moved against the position, in the ladder's
  //         unit. Positive means adverse.
  //
  //   Ticks    (avg - price) / tick_size        (long; mirrored for short)
  //   Percent  (avg - price) / avg * 100
  //   Atr      (avg - price) / atr              nullopt without an ATR
  // -------------------------------------------------------------------------
  static std::optional<double> adverseExcursion(domain::DcaTriggerMode mode,
                                                std::int64_t quantity,
                                                double average_price,
                                                double price, double tick_size,
                                                std::optional<double> atr);

 private:
  void onTick(const PriceTickEvent& event);
  void onPositionChanged(const PositionChangedEvent& event);
  void onOrderRejected(const OrderRejectedEvent& event);

  void evaluate(const domain::Position& position, double price);
  void fireRung(const domain::Position& position, int index,
                const domain::DcaRung& rung);
  void refreshTakeProfit(const domain::Position& position);
  void alert(const domain::PositionKey& key, const std::string& message);

  EventBus& bus_;
  PositionLedger& ledger_;
  OrderTracker& tracker_;
  BrokerGateway& gateway_;
  IStateStore& store_;
  const PriceFeed& feed_;
  const domain::InstrumentTable& instruments_;
  const ITimeProvider& time_provider_;

  std::map<domain::Symbol, domain::DcaConfig> symbol_defaults_;
  std::map<domain::PositionKey, domain::DcaConfig> configs_;

  SubscriptionSet subscriptions_;
};

}  // namespace flatguard
