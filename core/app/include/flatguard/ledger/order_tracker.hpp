#pragma once

#include "flatguard/domain/order_intent.hpp"
#include "flatguard/domain/order_status.hpp"
#include "flatguard/eventbus/event_bus.hpp"
#include "flatguard/events/broker_events.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// OrderTracker — the shard's book of orders the engine placed
// -----------------------------------------------------------------------------
//
// @brief  Remembers every order placed from this shard with its intent, and
//         advances its status from broker fills and rejections.
//
// @details
// Components call track() right after BrokerGateway::placeOrder() returns.
// The tracker subscribes to:
//
//   1. BrokerFillEvent    → Accepted/PartiallyFilled → PartiallyFilled/Filled
//   2. OrderRejectedEvent → Rejected
//
// The kill switch places its flatten off-loop, so that order's fill can
// reach the shard before track() does. Fills for unknown order ids are
// remembered (the most recent kMaxEarlyFills of them) and applied when the
// order is tracked.
//
// Status changes pass through transitionStatus(); an illegal transition is
// logged and ignored. Terminal orders (Filled, Canceled, Rejected) leave
// the working set, but their intent is kept so a late fill can still be
// attributed (PositionLedger asks purposeOf() to pick the FillRole).
//
// Queries used elsewhere:
//   workingOrders(key, purpose)   cancel targets for exits and DCA
//   workingQuantity(key, purpose) scale-ins the DCA cap must count
//   hasPendingMarketOrders(...)   drift reconciler's grace check
//
// Thread model:
//   Lives on one shard loop. Every method is called from that loop only,
//   so there is no mutex.
//
// Subscriber ordering constraint:
//   Must be constructed before PositionLedger so fills update the order
//   book before the ledger books them.
//
// Ownership:
//   Owned by PositionDesk. Holds a reference to the shard's EventBus.
// -----------------------------------------------------------------------------
class OrderTracker {
 public:
  struct TrackedOrder {
    domain::BrokerOrderId id;
    domain::OrderIntent intent;
    domain::OrderStatus status{domain::OrderStatus::Accepted};
    std::int64_t filled_quantity{0};
    std::int64_t placed_at_ms{0};
  };

  explicit OrderTracker(EventBus& bus);

  OrderTracker(const OrderTracker&) = delete;
  OrderTracker& operator=(const OrderTracker&) = delete;
  OrderTracker(OrderTracker&&) = delete;
  OrderTracker& operator=(OrderTracker&&) = delete;

  // Registers an order the broker has just accepted. Fills that arrived
  // for it beforehand are applied; a fully filled order goes straight to
  // the history.
  void track(const domain::BrokerOrderId& id, const domain::OrderIntent& intent,
             std::int64_t now_ms);

  std::optional<TrackedOrder> find(const domain::BrokerOrderId& id) const;

  // Intent and purpose of any order ever tracked, terminal or not.
  std::optional<domain::OrderIntent> intentOf(
      const domain::BrokerOrderId& id) const;
  std::optional<domain::OrderPurpose> purposeOf(
      const domain::BrokerOrderId& id) const;

  // Non-terminal orders for the key, optionally filtered by purpose.
  std::vector<domain::BrokerOrderId> workingOrders(
      const domain::PositionKey& key,
      std::optional<domain::OrderPurpose> purpose = std::nullopt) const;

  // Unfilled quantity of the working orders for the key and purpose.
  std::int64_t workingQuantity(const domain::PositionKey& key,
                               domain::OrderPurpose purpose) const;

  // -------------------------------------------------------------------------
  // hasPendingMarketOrders(key, now_ms, grace_ms)
  // -------------------------------------------------------------------------
  // @brief  True when a market order for the key was placed less than
  //         grace_ms ago and has not filled. Its fill may still be in
  //         flight, so the broker and the ledger are expected to disagree.
  // -------------------------------------------------------------------------
  bool hasPendingMarketOrders(const domain::PositionKey& key,
                              std::int64_t now_ms,
                              std::int64_t grace_ms) const;

  // Called after a successful cancel, or when the broker says the order
  // no longer exists.
  void markCanceled(const domain::BrokerOrderId& id);

  std::size_t workingCount() const { return active_orders_.size(); }

  // Validates an order status change.
  //   Accepted        → PartiallyFilled, Filled, Canceled, Rejected
  //   PartiallyFilled → PartiallyFilled, Filled, Canceled
  //   Filled, Canceled, Rejected → (terminal)
  static bool transitionStatus(domain::OrderStatus current,
                               domain::OrderStatus next);

 private:
  void onFill(const BrokerFillEvent& event);
  void onRejected(const OrderRejectedEvent& event);
  void rememberEarlyFill(const domain::BrokerOrderId& id,
                         std::int64_t quantity);

  // Applies the transition or logs why not. Erases terminal orders.
  void advance(const domain::BrokerOrderId& id, domain::OrderStatus next,
               std::int64_t filled_delta);

  static bool isTerminal(domain::OrderStatus status);

  static constexpr std::size_t kMaxEarlyFills = 256;

  std::unordered_map<domain::BrokerOrderId, TrackedOrder> active_orders_;
  std::unordered_map<domain::BrokerOrderId, domain::OrderIntent> history_;
  std::unordered_map<domain::BrokerOrderId, std::int64_t> early_fills_;
  std::deque<domain::BrokerOrderId> early_fill_order_;

  SubscriptionSet subscriptions_;
};

}  // namespace flatguard
