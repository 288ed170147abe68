#include "flatguard/broker/simulated_broker.hpp"
#include "flatguard/domain/errors.hpp"
#include "flatguard/pnl/pnl_math.hpp"
#include "flatguard/time/time_utils.hpp"

#include <iostream>

namespace flatguard {

SimulatedBroker::SimulatedBroker(const PriceFeed& feed,
                                 const ITimeProvider& time_provider,
                                 const domain::InstrumentTable& instruments)
    : feed_(feed), time_provider_(time_provider), instruments_(instruments) {}

void SimulatedBroker::setEventSink(EventSink sink) {
  std::lock_guard lock(mutex_);
  sink_ = std::move(sink);
}

// -----------------------------------------------------------------------------
// placeOrder: market fills now, limit rests
// -----------------------------------------------------------------------------
domain::BrokerOrderId SimulatedBroker::placeOrder(
    const domain::OrderIntent& intent) {
  std::vector<Event> out;
  domain::BrokerOrderId id;
  {
    std::lock_guard lock(mutex_);
    ++orders_received_;

    if (reject_next_ > 0) {
      --reject_next_;
      throw RejectError(reject_reason_);
    }
    if (intent.quantity <= 0) {
      throw RejectError("invalid quantity");
    }

    id = order_ids_.next_tag("SIM");

    if (reject_async_) {
      OrderRejectedEvent rejected;
      rejected.account_id = intent.account_id;
      rejected.symbol = intent.symbol;
      rejected.order_id = id;
      rejected.reason = async_reject_reason_;
      rejected.timestamp = ms_to_timestamp(time_provider_.now_ms());
      out.emplace_back(std::move(rejected));
    } else if (intent.type == domain::OrderType::Market) {
      std::optional<double> price = feed_.lastPrice(intent.symbol);
      if (!price) {
        throw RejectError("no market price for " + intent.symbol);
      }
      fillLocked(id, intent, *price, out);
    } else {
      working_[id] = WorkingOrder{id, intent};
    }
  }
  emit(out);
  return id;
}

void SimulatedBroker::cancelOrder(const domain::AccountId& account_id,
                                  const domain::BrokerOrderId& order_id) {
  std::lock_guard lock(mutex_);
  auto it = working_.find(order_id);
  if (it == working_.end() || it->second.intent.account_id != account_id) {
    throw NotFoundError("no working order " + order_id);
  }
  working_.erase(it);
}

BrokerPosition SimulatedBroker::queryPosition(
    const domain::AccountId& account_id, const domain::Symbol& symbol) {
  std::lock_guard lock(mutex_);
  throwIfQueryFails();
  BrokerPosition position;
  auto it = books_.find(domain::PositionKey{account_id, symbol});
  if (it != books_.end()) {
    position.quantity = it->second.quantity;
    position.average_price = it->second.average_price;
  }
  position.side = domain::positionSideFor(position.quantity);
  return position;
}

std::vector<domain::BrokerOrderId> SimulatedBroker::queryOrders(
    const domain::AccountId& account_id, const domain::Symbol& symbol) {
  std::lock_guard lock(mutex_);
  throwIfQueryFails();
  std::vector<domain::BrokerOrderId> ids;
  for (const auto& [id, order] : working_) {
    if (order.intent.account_id == account_id &&
        order.intent.symbol == symbol) {
      ids.push_back(id);
    }
  }
  return ids;
}

std::vector<domain::Fill> SimulatedBroker::queryFills(
    const domain::AccountId& account_id, const domain::Symbol& symbol) {
  std::lock_guard lock(mutex_);
  throwIfQueryFails();
  auto it = books_.find(domain::PositionKey{account_id, symbol});
  if (it == books_.end()) {
    return {};
  }
  return it->second.fills;
}

// -----------------------------------------------------------------------------
// onTick: fill crossed resting limits at their limit price
// -----------------------------------------------------------------------------
void SimulatedBroker::onTick(const domain::Symbol& symbol, double price) {
  std::vector<Event> out;
  {
    std::lock_guard lock(mutex_);
    for (auto it = working_.begin(); it != working_.end();) {
      const domain::OrderIntent& intent = it->second.intent;
      const bool crossed =
          intent.symbol == symbol &&
          ((intent.side == domain::Side::Buy && price <= intent.limit_price) ||
           (intent.side == domain::Side::Sell && price >= intent.limit_price));
      if (!crossed) {
        ++it;
        continue;
      }
      fillLocked(it->first, intent, intent.limit_price, out);
      it = working_.erase(it);
    }
  }
  emit(out);
}

void SimulatedBroker::rejectNextOrders(int count, std::string reason) {
  std::lock_guard lock(mutex_);
  reject_next_ = count;
  reject_reason_ = std::move(reason);
}

void SimulatedBroker::rejectOrdersAsync(bool enabled, std::string reason) {
  std::lock_guard lock(mutex_);
  reject_async_ = enabled;
  async_reject_reason_ = std::move(reason);
}

void SimulatedBroker::failNextQueries(int count) {
  std::lock_guard lock(mutex_);
  fail_queries_ = count;
}

void SimulatedBroker::setPushFills(bool enabled) {
  std::lock_guard lock(mutex_);
  push_fills_ = enabled;
}

void SimulatedBroker::setPushSnapshots(bool enabled) {
  std::lock_guard lock(mutex_);
  push_snapshots_ = enabled;
}

void SimulatedBroker::applyExternalFill(const domain::AccountId& account_id,
                                        const domain::Symbol& symbol,
                                        domain::Side side,
                                        std::int64_t quantity, double price) {
  std::vector<Event> out;
  {
    std::lock_guard lock(mutex_);
    domain::OrderIntent intent;
    intent.account_id = account_id;
    intent.symbol = symbol;
    intent.side = side;
    intent.quantity = quantity;
    fillLocked(order_ids_.next_tag("EXT"), intent, price, out);
  }
  std::cout << "[SimulatedBroker] external " << domain::toString(side) << " "
            << quantity << " " << symbol << " @ " << price << " for "
            << account_id << "\n";
  emit(out);
}

std::int64_t SimulatedBroker::positionOf(const domain::AccountId& account_id,
                                         const domain::Symbol& symbol) const {
  std::lock_guard lock(mutex_);
  auto it = books_.find(domain::PositionKey{account_id, symbol});
  return it == books_.end() ? 0 : it->second.quantity;
}

std::size_t SimulatedBroker::workingOrderCount() const {
  std::lock_guard lock(mutex_);
  return working_.size();
}

std::uint64_t SimulatedBroker::ordersReceived() const {
  std::lock_guard lock(mutex_);
  return orders_received_;
}

// -----------------------------------------------------------------------------
// fillLocked: book a fill and queue the push events
// -----------------------------------------------------------------------------
void SimulatedBroker::fillLocked(const domain::BrokerOrderId& order_id,
                                 const domain::OrderIntent& intent,
                                 double price, std::vector<Event>& out) {
  const std::int64_t now = time_provider_.now_ms();

  domain::Fill fill;
  fill.fill_id = fill_ids_.next_tag("SIMFILL");
  fill.order_id = order_id;
  fill.account_id = intent.account_id;
  fill.symbol = intent.symbol;
  fill.side = intent.side;
  fill.quantity = intent.quantity;
  fill.price = price;
  fill.timestamp_ms = now;
  fill.role = intent.purpose == domain::OrderPurpose::Exit
                  ? domain::FillRole::Exit
                  : intent.purpose == domain::OrderPurpose::DcaEntry
                        ? domain::FillRole::Dca
                        : domain::FillRole::Entry;

  Book& book = books_[intent.key()];
  const pnl::FillEffect effect = pnl::applySignedFill(
      book.quantity, book.average_price, fill.signedQuantity(), price,
      instruments_.lookup(intent.symbol).multiplier);
  book.quantity = effect.quantity;
  book.average_price = effect.average_price;
  book.fills.push_back(fill);

  if (push_fills_) {
    out.emplace_back(BrokerFillEvent{fill, ms_to_timestamp(now)});
  }
  if (push_snapshots_) {
    PositionSnapshotEvent snapshot;
    snapshot.account_id = intent.account_id;
    snapshot.symbol = intent.symbol;
    snapshot.quantity = book.quantity;
    snapshot.average_price = book.average_price;
    snapshot.timestamp = ms_to_timestamp(now);
    out.emplace_back(std::move(snapshot));
  }
}

void SimulatedBroker::throwIfQueryFails() {
  if (fail_queries_ > 0) {
    --fail_queries_;
    throw TransientBrokerError("simulated network failure");
  }
}

void SimulatedBroker::emit(std::vector<Event>& events) {
  if (events.empty()) {
    return;
  }
  EventSink sink;
  {
    std::lock_guard lock(mutex_);
    sink = sink_;
  }
  if (!sink) {
    return;
  }
  for (Event& event : events) {
    sink(std::move(event));
  }
}

}  // namespace flatguard
