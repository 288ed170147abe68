#include "flatguard/ledger/order_tracker.hpp"

#include <iostream>

namespace flatguard {

// -----------------------------------------------------------------------------
// Constructor: subscribe to fills and rejections
// -----------------------------------------------------------------------------
OrderTracker::OrderTracker(EventBus& bus) : subscriptions_(bus) {
  subscriptions_.add<BrokerFillEvent>(
      [this](const BrokerFillEvent& e) { onFill(e); });
  subscriptions_.add<OrderRejectedEvent>(
      [this](const OrderRejectedEvent& e) { onRejected(e); });
}

void OrderTracker::track(const domain::BrokerOrderId& id,
                         const domain::OrderIntent& intent,
                         std::int64_t now_ms) {
  TrackedOrder order;
  order.id = id;
  order.intent = intent;
  order.placed_at_ms = now_ms;
  history_[id] = intent;

  auto early = early_fills_.find(id);
  if (early != early_fills_.end()) {
    order.filled_quantity = early->second;
    early_fills_.erase(early);
    if (order.filled_quantity >= intent.quantity) {
      return;
    }
    order.status = domain::OrderStatus::PartiallyFilled;
  }
  active_orders_[id] = order;
}

std::optional<OrderTracker::TrackedOrder> OrderTracker::find(
    const domain::BrokerOrderId& id) const {
  auto it = active_orders_.find(id);
  if (it == active_orders_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::OrderIntent> OrderTracker::intentOf(
    const domain::BrokerOrderId& id) const {
  auto it = history_.find(id);
  if (it == history_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<domain::OrderPurpose> OrderTracker::purposeOf(
    const domain::BrokerOrderId& id) const {
  auto it = history_.find(id);
  if (it == history_.end()) {
    return std::nullopt;
  }
  return it->second.purpose;
}

std::vector<domain::BrokerOrderId> OrderTracker::workingOrders(
    const domain::PositionKey& key,
    std::optional<domain::OrderPurpose> purpose) const {
  std::vector<domain::BrokerOrderId> ids;
  for (const auto& [id, order] : active_orders_) {
    if (order.intent.key() != key) {
      continue;
    }
    if (purpose && order.intent.purpose != *purpose) {
      continue;
    }
    ids.push_back(id);
  }
  return ids;
}

std::int64_t OrderTracker::workingQuantity(const domain::PositionKey& key,
                                           domain::OrderPurpose purpose) const {
  std::int64_t quantity = 0;
  for (const auto& [id, order] : active_orders_) {
    if (order.intent.key() == key && order.intent.purpose == purpose) {
      quantity += order.intent.quantity - order.filled_quantity;
    }
  }
  return quantity;
}

bool OrderTracker::hasPendingMarketOrders(const domain::PositionKey& key,
                                          std::int64_t now_ms,
                                          std::int64_t grace_ms) const {
  for (const auto& [id, order] : active_orders_) {
    if (order.intent.key() == key &&
        order.intent.type == domain::OrderType::Market &&
        now_ms - order.placed_at_ms < grace_ms) {
      return true;
    }
  }
  return false;
}

void OrderTracker::markCanceled(const domain::BrokerOrderId& id) {
  advance(id, domain::OrderStatus::Canceled, 0);
}

// -----------------------------------------------------------------------------
// transitionStatus: validate state machine transitions
// -----------------------------------------------------------------------------
bool OrderTracker::transitionStatus(domain::OrderStatus current,
                                    domain::OrderStatus next) {
  using S = domain::OrderStatus;

  switch (current) {
    case S::Accepted:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled ||
             next == S::Rejected;

    case S::PartiallyFilled:
      return next == S::PartiallyFilled ||
             next == S::Filled ||
             next == S::Canceled;

    case S::Filled:
    case S::Canceled:
    case S::Rejected:
      return false;
  }

  return false;
}

bool OrderTracker::isTerminal(domain::OrderStatus status) {
  return status == domain::OrderStatus::Filled ||
         status == domain::OrderStatus::Canceled ||
         status == domain::OrderStatus::Rejected;
}

// -----------------------------------------------------------------------------
// onFill: advance to PartiallyFilled or Filled
// -----------------------------------------------------------------------------
void OrderTracker::onFill(const BrokerFillEvent& event) {
  const domain::Fill& fill = event.fill;
  auto it = active_orders_.find(fill.order_id);
  if (it == active_orders_.end()) {
    if (history_.count(fill.order_id) == 0) {
      rememberEarlyFill(fill.order_id, fill.quantity);
    }
    return;
  }
  const std::int64_t remaining =
      it->second.intent.quantity - it->second.filled_quantity - fill.quantity;
  advance(fill.order_id,
          remaining > 0 ? domain::OrderStatus::PartiallyFilled
                        : domain::OrderStatus::Filled,
          fill.quantity);
}

// Orders placed off-loop (kill switch) or outside the engine.
void OrderTracker::rememberEarlyFill(const domain::BrokerOrderId& id,
                                     std::int64_t quantity) {
  auto [it, inserted] = early_fills_.emplace(id, 0);
  it->second += quantity;
  if (!inserted) {
    return;
  }
  early_fill_order_.push_back(id);
  if (early_fill_order_.size() > kMaxEarlyFills) {
    early_fills_.erase(early_fill_order_.front());
    early_fill_order_.pop_front();
  }
}

void OrderTracker::onRejected(const OrderRejectedEvent& event) {
  if (active_orders_.count(event.order_id) == 0) {
    return;
  }
  std::cerr << "[OrderTracker] order " << event.order_id << " rejected: "
            << event.reason << "\n";
  advance(event.order_id, domain::OrderStatus::Rejected, 0);
}

void OrderTracker::advance(const domain::BrokerOrderId& id,
                           domain::OrderStatus next,
                           std::int64_t filled_delta) {
  auto it = active_orders_.find(id);
  if (it == active_orders_.end()) {
    return;
  }
  TrackedOrder& order = it->second;
  if (!transitionStatus(order.status, next)) {
    std::cerr << "[OrderTracker] WARNING: illegal transition "
              << domain::toString(order.status) << " -> "
              << domain::toString(next) << " for order " << id << "\n";
    return;
  }
  order.status = next;
  order.filled_quantity += filled_delta;
  if (isTerminal(next)) {
    active_orders_.erase(it);
  }
}

}  // namespace flatguard
