#pragma once

#include "flatguard/broker/account_registry.hpp"
#include "flatguard/broker/i_broker_api.hpp"
#include "flatguard/broker/retry_policy.hpp"

#include <atomic>
#include <cstdint>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// BrokerGateway — the single outbound path to the broker
// -----------------------------------------------------------------------------
//
// @brief  Wraps an IBrokerApi with the engine's outbound rules: exit orders
//         are forced to Market, every call spends a token from the auth
//         token's rate limiter, queries are retried, placements are not.
//
// @details
// Components never talk to IBrokerApi directly. The gateway is the one
// shared, concurrently used resource in the core: entries, DCA, exits and
// the kill switch all call it from their own threads.
//
// Per-call policy:
//   placeOrder     normalize (exit → market), one token, single shot.
//   cancelOrder    one token, single shot. NotFoundError propagates.
//   queryPosition  token per attempt, retried on TransientBrokerError.
//   queryOrders    same.
//   queryFills     same.
//
// Each attempt takes its own token, so a retry storm is rate limited like
// any other traffic.
//
// Thread model: All methods are safe from any thread. The gateway holds no
//               mutable state of its own beyond counters.
// Ownership:    Owned by TradingEngine. Holds references to the broker
//               capability and the account registry, which outlive it.
// -----------------------------------------------------------------------------
class BrokerGateway {
 public:
  BrokerGateway(IBrokerApi& broker, AccountRegistry& accounts,
                RetryPolicy retry_policy);

  BrokerGateway(const BrokerGateway&) = delete;
  BrokerGateway& operator=(const BrokerGateway&) = delete;

  // -------------------------------------------------------------------------
  // placeOrder(intent)
  // -------------------------------------------------------------------------
  // @brief  Submits one order. Exit-purpose intents are sent as Market
  //         regardless of what the caller built.
  //
  // @return Broker order id.
  //
  // @throws RejectError when the broker refuses; TransientBrokerError when
  //         the outcome is unknown. Neither is retried here.
  // -------------------------------------------------------------------------
  domain::BrokerOrderId placeOrder(const domain::OrderIntent& intent);

  void cancelOrder(const domain::AccountId& account_id,
                   const domain::BrokerOrderId& order_id);

  BrokerPosition queryPosition(const domain::AccountId& account_id,
                               const domain::Symbol& symbol);

  std::vector<domain::BrokerOrderId> queryOrders(
      const domain::AccountId& account_id, const domain::Symbol& symbol);

  std::vector<domain::Fill> queryFills(const domain::AccountId& account_id,
                                       const domain::Symbol& symbol);

  // Single attempt, no retry. The kill switch uses these because it cannot
  // afford backoff sleeps inside its deadline.
  BrokerPosition queryPositionOnce(const domain::AccountId& account_id,
                                   const domain::Symbol& symbol);
  std::vector<domain::BrokerOrderId> queryOrdersOnce(
      const domain::AccountId& account_id, const domain::Symbol& symbol);

  std::uint64_t ordersPlaced() const { return orders_placed_.load(); }
  std::uint64_t ordersRejected() const { return orders_rejected_.load(); }

 private:
  IBrokerApi& broker_;
  AccountRegistry& accounts_;
  RetryPolicy retry_policy_;

  std::atomic<std::uint64_t> orders_placed_{0};
  std::atomic<std::uint64_t> orders_rejected_{0};
};

}  // namespace flatguard
