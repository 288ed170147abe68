#pragma once

#include "flatguard/domain/types.hpp"

#include <cstdint>
#include <string>

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// Fill — one immutable execution, the unit of the ledger
// -----------------------------------------------------------------------------
// A Position's quantity, average entry price and realized PnL are a pure
// function of its ordered Fill sequence. fill_id is the broker's execution
// id and is unique per (account, symbol); the ledger ignores a fill_id it
// has already booked.
// -----------------------------------------------------------------------------
struct Fill {
  std::string fill_id;
  BrokerOrderId order_id;          // Empty for reconciliation fills
  AccountId account_id;
  Symbol symbol;
  Side side{Side::Buy};
  std::int64_t quantity{0};        // Unsigned size; side carries direction
  double price{0.0};
  std::int64_t timestamp_ms{0};
  FillRole role{FillRole::Entry};

  PositionKey key() const { return PositionKey{account_id, symbol}; }

  std::int64_t signedQuantity() const {
    return side == Side::Buy ? quantity : -quantity;
  }
};

}  // namespace domain
}  // namespace flatguard
