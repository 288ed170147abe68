#pragma once

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — lifecycle of an order the engine placed
// -----------------------------------------------------------------------------
// Accepted is the first state: BrokerGateway::placeOrder() only returns
// once the broker has assigned an id. Filled, Canceled and Rejected are
// terminal. Transition rules live in OrderTracker::transitionStatus().
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Accepted,
  PartiallyFilled,
  Filled,
  Canceled,
  Rejected,
};

inline const char* toString(OrderStatus status) {
  switch (status) {
    case OrderStatus::Accepted:        return "Accepted";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::Canceled:        return "Canceled";
    case OrderStatus::Rejected:        return "Rejected";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace flatguard
