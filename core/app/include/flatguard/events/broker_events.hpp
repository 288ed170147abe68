#pragma once

#include "flatguard/domain/fill.hpp"
#include "flatguard/domain/types.hpp"
#include "flatguard/events/event_types.hpp"

#include <cstdint>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// Broker push events
// -----------------------------------------------------------------------------
// The broker's push stream, normalized. Routed to the shard that owns
// (account, symbol) and processed there in arrival order: OrderTracker
// first, then PositionLedger, then DCA / exit / reconciler.
//
// OrderRejectedEvent may arrive without a symbol (the broker only names the
// order). Such events are broadcast; only the shard that placed the order
// recognises the id.
// -----------------------------------------------------------------------------
struct BrokerFillEvent {
  domain::Fill fill;
  Timestamp timestamp{};
};

struct PositionSnapshotEvent {
  domain::AccountId account_id;
  domain::Symbol symbol;
  std::int64_t quantity{0};
  double average_price{0.0};   // 0 when the broker does not report it
  Timestamp timestamp{};
};

struct OrderRejectedEvent {
  domain::AccountId account_id;
  domain::Symbol symbol;       // May be empty
  domain::BrokerOrderId order_id;
  std::string reason;
  Timestamp timestamp{};
};

}  // namespace flatguard
