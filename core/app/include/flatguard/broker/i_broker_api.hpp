#pragma once

#include "flatguard/domain/fill.hpp"
#include "flatguard/domain/order_intent.hpp"
#include "flatguard/domain/types.hpp"

#include <cstdint>
#include <vector>

namespace flatguard {

// Broker-reported position for one (account, symbol).
struct BrokerPosition {
  std::int64_t quantity{0};                       // Signed
  domain::PositionSide side{domain::PositionSide::Flat};
  double average_price{0.0};                      // 0 when not reported
};

// -----------------------------------------------------------------------------
// IBrokerApi — capability object for one brokerage connection
// -----------------------------------------------------------------------------
//
// @brief  The calls the engine makes against a broker. Implementations wrap
//         a broker's REST/WebSocket client; the credential layer that builds
//         them is outside this codebase. SimulatedBroker is the in-process
//         implementation for the `simulated` environment and for tests.
//
// @details
// Error contract (all implementations):
//   placeOrder    → RejectError when refused; TransientBrokerError when
//                   the outcome is unknown (network failure, timeout).
//   cancelOrder   → NotFoundError when the broker has no such working order.
//   query*        → TransientBrokerError on network failure.
//
// Push events (fills, position snapshots, rejections) do not go through
// this interface. Implementations deliver them to an EventSink handed to
// them at construction.
//
// queryFills() returns the broker's execution history for the symbol, or
// an empty vector when the broker cannot provide it.
//
// Thread model: Implementations must be safe to call from several threads
//               at once (event loops and kill-switch workers).
// -----------------------------------------------------------------------------
class IBrokerApi {
 public:
  virtual ~IBrokerApi() = default;

  virtual domain::BrokerOrderId placeOrder(const domain::OrderIntent& intent) = 0;

  virtual void cancelOrder(const domain::AccountId& account_id,
                           const domain::BrokerOrderId& order_id) = 0;

  virtual BrokerPosition queryPosition(const domain::AccountId& account_id,
                                       const domain::Symbol& symbol) = 0;

  virtual std::vector<domain::BrokerOrderId> queryOrders(
      const domain::AccountId& account_id, const domain::Symbol& symbol) = 0;

  virtual std::vector<domain::Fill> queryFills(
      const domain::AccountId& account_id, const domain::Symbol& symbol) = 0;
};

}  // namespace flatguard
