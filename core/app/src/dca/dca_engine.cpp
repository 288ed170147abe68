#include "flatguard/dca/dca_engine.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/time/time_utils.hpp"

#include <cmath>
#include <cstdlib>
#include <iostream>

namespace flatguard {

namespace {

double roundToTick(double price, double tick_size) {
  return std::round(price / tick_size) * tick_size;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: subscribe to ticks, position changes and rejections
// -----------------------------------------------------------------------------
DcaEngine::DcaEngine(EventBus& bus, PositionLedger& ledger,
                     OrderTracker& tracker, BrokerGateway& gateway,
                     IStateStore& store, const PriceFeed& feed,
                     const domain::InstrumentTable& instruments,
                     const ITimeProvider& time_provider,
                     std::map<domain::Symbol, domain::DcaConfig> symbol_defaults)
    : bus_(bus),
      ledger_(ledger),
      tracker_(tracker),
      gateway_(gateway),
      store_(store),
      feed_(feed),
      instruments_(instruments),
      time_provider_(time_provider),
      symbol_defaults_(std::move(symbol_defaults)),
      subscriptions_(bus) {
  subscriptions_.add<PriceTickEvent>(
      [this](const PriceTickEvent& e) { onTick(e); });
  subscriptions_.add<PositionChangedEvent>(
      [this](const PositionChangedEvent& e) { onPositionChanged(e); });
  subscriptions_.add<OrderRejectedEvent>(
      [this](const OrderRejectedEvent& e) { onOrderRejected(e); });
}

void DcaEngine::configure(const domain::PositionKey& key,
                          const domain::DcaConfig& config) {
  domain::validateDcaConfig(config);
  store_.saveDcaConfig(key, config);
  configs_[key] = config;
}

void DcaEngine::restoreConfig(const domain::PositionKey& key,
                              const domain::DcaConfig& config) {
  configs_[key] = config;
}

std::optional<domain::DcaConfig> DcaEngine::config(
    const domain::PositionKey& key) const {
  auto it = configs_.find(key);
  if (it != configs_.end()) {
    return it->second;
  }
  auto def = symbol_defaults_.find(key.symbol);
  if (def != symbol_defaults_.end()) {
    return def->second;
  }
  return std::nullopt;
}

std::optional<double> DcaEngine::takeProfitPrice(
    const domain::PositionKey& key) const {
  const domain::Position position = ledger_.currentPosition(key);
  std::optional<domain::DcaConfig> cfg = config(key);
  if (position.isFlat() || !cfg || cfg->take_profit_ticks <= 0) {
    return std::nullopt;
  }
  const double tick = instruments_.lookup(key.symbol).tick_size;
  const double dir = position.quantity > 0 ? 1.0 : -1.0;
  return roundToTick(
      position.average_entry_price + dir * cfg->take_profit_ticks * tick, tick);
}

std::optional<double> DcaEngine::stopLossPrice(
    const domain::PositionKey& key) const {
  const domain::Position position = ledger_.currentPosition(key);
  std::optional<domain::DcaConfig> cfg = config(key);
  if (position.isFlat() || !cfg || cfg->stop_loss_ticks <= 0) {
    return std::nullopt;
  }
  const double tick = instruments_.lookup(key.symbol).tick_size;
  const double dir = position.quantity > 0 ? 1.0 : -1.0;
  return roundToTick(
      position.average_entry_price - dir * cfg->stop_loss_ticks * tick, tick);
}

// -----------------------------------------------------------------------------
// adverseExcursion: distance against the position in the ladder's unit
// -----------------------------------------------------------------------------
std::optional<double> DcaEngine::adverseExcursion(
    domain::DcaTriggerMode mode, std::int64_t quantity, double average_price,
    double price, double tick_size, std::optional<double> atr) {
  if (quantity == 0 || average_price <= 0.0) {
    return std::nullopt;
  }
  const double adverse_points =
      quantity > 0 ? average_price - price : price - average_price;

  switch (mode) {
    case domain::DcaTriggerMode::Ticks:
      if (tick_size <= 0.0) return std::nullopt;
      return adverse_points / tick_size;
    case domain::DcaTriggerMode::Percent:
      return adverse_points / average_price * 100.0;
    case domain::DcaTriggerMode::Atr:
      if (!atr || *atr <= 0.0) return std::nullopt;
      return adverse_points / *atr;
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// onTick: evaluate the ladder of every eligible open position
// -----------------------------------------------------------------------------
void DcaEngine::onTick(const PriceTickEvent& event) {
  for (const domain::Position& position : ledger_.snapshots()) {
    if (position.symbol != event.symbol || position.isFlat()) {
      continue;
    }
    if (position.exit_state != domain::ExitState::Idle || position.halted ||
        position.needs_attention) {
      continue;
    }
    evaluate(position, event.price);
  }
}

void DcaEngine::evaluate(const domain::Position& position, double price) {
  std::optional<domain::DcaConfig> cfg = config(position.key());
  if (!cfg || cfg->rungs.empty()) {
    return;
  }

  const std::optional<double> excursion = adverseExcursion(
      cfg->mode, position.quantity, position.average_entry_price, price,
      instruments_.lookup(position.symbol).tick_size,
      feed_.atr(position.symbol));
  if (!excursion || *excursion <= 0.0) {
    return;
  }

  // A tick at or through the stop belongs to the exit, not the ladder.
  const std::optional<double> stop = stopLossPrice(position.key());
  if (stop && (position.quantity > 0 ? price <= *stop : price >= *stop)) {
    return;
  }

  // Scale-ins already sent but not yet filled count against the cap.
  const std::int64_t held =
      std::llabs(position.quantity) +
      tracker_.workingQuantity(position.key(), domain::OrderPurpose::DcaEntry);
  for (std::size_t i = 0; i < cfg->rungs.size(); ++i) {
    const int index = static_cast<int>(i);
    const domain::DcaRung& rung = cfg->rungs[i];
    if (position.dca_triggered_indices.count(index) > 0) {
      continue;
    }
    if (*excursion < rung.distance) {
      return;  // Distances increase; nothing further is reachable.
    }
    if (held + rung.quantity > cfg->max_quantity) {
      continue;
    }
    fireRung(position, index, rung);
    return;
  }
}

// -----------------------------------------------------------------------------
// fireRung: persist the index, pull the take-profit, send the order
// -----------------------------------------------------------------------------
void DcaEngine::fireRung(const domain::Position& position, int index,
                         const domain::DcaRung& rung) {
  const domain::PositionKey key = position.key();

  ledger_.markDcaRungFired(key, index);
  cancelTakeProfits(key);

  const domain::OrderIntent intent = domain::OrderIntent::market(
      key, domain::openingSide(position.side), rung.quantity,
      domain::OrderPurpose::DcaEntry);

  std::cout << "[DcaEngine] " << key.toString() << " rung " << index
            << " firing: " << domain::toString(intent.side) << " "
            << rung.quantity << "\n";

  try {
    const domain::BrokerOrderId id = gateway_.placeOrder(intent);
    tracker_.track(id, intent, time_provider_.now_ms());
  } catch (const RejectError& e) {
    alert(key, "dca rung " + std::to_string(index) + " " + e.what());
    refreshTakeProfit(ledger_.currentPosition(key));
  } catch (const TransientBrokerError& e) {
    alert(key, "dca rung " + std::to_string(index) + " outcome unknown: " +
                   e.what());
  }
}

// -----------------------------------------------------------------------------
// onPositionChanged: keep the take-profit in step with the position
// -----------------------------------------------------------------------------
void DcaEngine::onPositionChanged(const PositionChangedEvent& event) {
  const domain::Position& position = event.position;
  if (position.isFlat()) {
    if (!tracker_.workingOrders(position.key(),
                                domain::OrderPurpose::TakeProfit).empty()) {
      cancelTakeProfits(position.key());
    }
    return;
  }
  if (!event.fill) {
    return;
  }
  const domain::FillRole role = event.fill->role;
  if ((role == domain::FillRole::Entry || role == domain::FillRole::Dca) &&
      position.exit_state == domain::ExitState::Idle) {
    refreshTakeProfit(position);
  }
}

void DcaEngine::refreshTakeProfit(const domain::Position& position) {
  if (position.isFlat() || position.exit_state != domain::ExitState::Idle) {
    return;
  }
  const domain::PositionKey key = position.key();
  std::optional<double> target = takeProfitPrice(key);
  if (!target) {
    return;
  }

  cancelTakeProfits(key);

  const domain::OrderIntent intent = domain::OrderIntent::limit(
      key, domain::closingSide(position.quantity),
      std::llabs(position.quantity), *target, domain::OrderPurpose::TakeProfit);
  try {
    const domain::BrokerOrderId id = gateway_.placeOrder(intent);
    tracker_.track(id, intent, time_provider_.now_ms());
    std::cout << "[DcaEngine] " << key.toString() << " take-profit "
              << intent.quantity << " @ " << *target << " (" << id << ")\n";
  } catch (const RejectError& e) {
    alert(key, std::string("take-profit ") + e.what());
  } catch (const TransientBrokerError& e) {
    alert(key, std::string("take-profit outcome unknown: ") + e.what());
  }
}

void DcaEngine::cancelTakeProfits(const domain::PositionKey& key) {
  for (const domain::BrokerOrderId& id :
       tracker_.workingOrders(key, domain::OrderPurpose::TakeProfit)) {
    try {
      gateway_.cancelOrder(key.account_id, id);
      tracker_.markCanceled(id);
    } catch (const NotFoundError&) {
      tracker_.markCanceled(id);
    } catch (const FlatguardError& e) {
      std::cerr << "[DcaEngine] WARNING: cancel of take-profit " << id
                << " failed: " << e.what() << "\n";
    }
  }
}

void DcaEngine::onOrderRejected(const OrderRejectedEvent& event) {
  std::optional<domain::OrderIntent> intent = tracker_.intentOf(event.order_id);
  if (!intent || (intent->purpose != domain::OrderPurpose::DcaEntry &&
                  intent->purpose != domain::OrderPurpose::TakeProfit)) {
    return;
  }
  alert(intent->key(), std::string(domain::toString(intent->purpose)) +
                           " order " + event.order_id + " rejected: " +
                           event.reason);
}

void DcaEngine::alert(const domain::PositionKey& key,
                      const std::string& message) {
  std::cerr << "[DcaEngine] WARNING: " << key.toString() << " " << message
            << "\n";
  ledger_.recordError(key, message);

  AlertEvent event;
  event.key = key;
  event.severity = AlertEvent::Severity::Warning;
  event.source = "DcaEngine";
  event.message = message;
  event.timestamp = ms_to_timestamp(time_provider_.now_ms());
  bus_.publish(event);
}

}  // namespace flatguard
