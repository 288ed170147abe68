#pragma once

#include "flatguard/domain/types.hpp"

#include <cstdint>

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// OrderIntent — what the engine asks the broker to do
// -----------------------------------------------------------------------------
//
// @brief  Account, symbol, side, size, order type and purpose of one order.
//
// @details
// Exit-purpose intents are always Market. A resting limit exit can be
// stranded when price gaps through it, leaving the engine flat on paper
// while the broker still holds the position. normalized() enforces this
// and BrokerGateway::placeOrder() normalizes every intent before it leaves
// the process, so no configuration or caller can send a limit exit.
// -----------------------------------------------------------------------------
struct OrderIntent {
  AccountId account_id;
  Symbol symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};             // Contracts/shares, always > 0
  OrderType type{OrderType::Market};
  OrderPurpose purpose{OrderPurpose::Entry};
  double limit_price{0.0};              // Only meaningful for Limit

  PositionKey key() const { return PositionKey{account_id, symbol}; }

  OrderIntent normalized() const {
    OrderIntent copy = *this;
    if (copy.purpose == OrderPurpose::Exit) {
      copy.type = OrderType::Market;
      copy.limit_price = 0.0;
    }
    return copy;
  }

  static OrderIntent market(const PositionKey& key, Side side,
                            std::int64_t quantity, OrderPurpose purpose) {
    OrderIntent intent;
    intent.account_id = key.account_id;
    intent.symbol = key.symbol;
    intent.side = side;
    intent.quantity = quantity;
    intent.type = OrderType::Market;
    intent.purpose = purpose;
    return intent;
  }

  static OrderIntent limit(const PositionKey& key, Side side,
                           std::int64_t quantity, double price,
                           OrderPurpose purpose) {
    OrderIntent intent = market(key, side, quantity, purpose);
    intent.type = OrderType::Limit;
    intent.limit_price = price;
    return intent;
  }

  // The only sanctioned way to build an exit.
  static OrderIntent exit(const PositionKey& key, Side side,
                          std::int64_t quantity) {
    return market(key, side, quantity, OrderPurpose::Exit);
  }
};

}  // namespace domain
}  // namespace flatguard
