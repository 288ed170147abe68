#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/domain/errors.hpp"

#include <iostream>

namespace flatguard {

BrokerGateway::BrokerGateway(IBrokerApi& broker, AccountRegistry& accounts,
                             RetryPolicy retry_policy)
    : broker_(broker),
      accounts_(accounts),
      retry_policy_(std::move(retry_policy)) {}

// -----------------------------------------------------------------------------
// placeOrder(): normalize, rate limit, single shot
// -----------------------------------------------------------------------------
domain::BrokerOrderId BrokerGateway::placeOrder(
    const domain::OrderIntent& intent) {
  if (intent.quantity <= 0) {
    throw RejectError("non-positive quantity " +
                      std::to_string(intent.quantity));
  }

  const domain::OrderIntent normalized = intent.normalized();
  if (normalized.type != intent.type) {
    std::cerr << "[BrokerGateway] WARNING: exit intent for "
              << intent.key().toString()
              << " was built as Limit; sending as Market\n";
  }

  accounts_.limiterFor(normalized.account_id).acquire();

  try {
    domain::BrokerOrderId id = retry_policy_.singleShot(
        "placeOrder", [&] { return broker_.placeOrder(normalized); });
    orders_placed_.fetch_add(1);
    std::cout << "[BrokerGateway] placed " << domain::toString(normalized.purpose)
              << " " << domain::toString(normalized.type) << " "
              << domain::toString(normalized.side) << " " << normalized.quantity
              << " " << normalized.symbol << " for " << normalized.account_id
              << " -> " << id << "\n";
    return id;
  } catch (const RejectError& e) {
    orders_rejected_.fetch_add(1);
    std::cerr << "[BrokerGateway] " << domain::toString(normalized.purpose)
              << " order for " << normalized.key().toString() << " "
              << e.what() << "\n";
    throw;
  }
}

// -----------------------------------------------------------------------------
// cancelOrder(): single shot
// -----------------------------------------------------------------------------
void BrokerGateway::cancelOrder(const domain::AccountId& account_id,
                                const domain::BrokerOrderId& order_id) {
  accounts_.limiterFor(account_id).acquire();
  retry_policy_.singleShot("cancelOrder",
                           [&] { broker_.cancelOrder(account_id, order_id); });
}

// -----------------------------------------------------------------------------
// Queries: retried on TransientBrokerError, one token per attempt
// -----------------------------------------------------------------------------
BrokerPosition BrokerGateway::queryPosition(const domain::AccountId& account_id,
                                            const domain::Symbol& symbol) {
  return retry_policy_.query("queryPosition " + account_id + ":" + symbol,
                             [&] { return queryPositionOnce(account_id, symbol); });
}

std::vector<domain::BrokerOrderId> BrokerGateway::queryOrders(
    const domain::AccountId& account_id, const domain::Symbol& symbol) {
  return retry_policy_.query("queryOrders " + account_id + ":" + symbol,
                             [&] { return queryOrdersOnce(account_id, symbol); });
}

std::vector<domain::Fill> BrokerGateway::queryFills(
    const domain::AccountId& account_id, const domain::Symbol& symbol) {
  return retry_policy_.query("queryFills " + account_id + ":" + symbol, [&] {
    accounts_.limiterFor(account_id).acquire();
    return broker_.queryFills(account_id, symbol);
  });
}

BrokerPosition BrokerGateway::queryPositionOnce(
    const domain::AccountId& account_id, const domain::Symbol& symbol) {
  accounts_.limiterFor(account_id).acquire();
  BrokerPosition position = broker_.queryPosition(account_id, symbol);
  position.side = domain::positionSideFor(position.quantity);
  return position;
}

std::vector<domain::BrokerOrderId> BrokerGateway::queryOrdersOnce(
    const domain::AccountId& account_id, const domain::Symbol& symbol) {
  accounts_.limiterFor(account_id).acquire();
  return broker_.queryOrders(account_id, symbol);
}

}  // namespace flatguard
