// =============================================================================
// broker_gateway_test.cpp
// =============================================================================
// Unit tests for the outbound broker path.
//
// Validates:
//   - BrokerGateway sends exit intents as Market whatever the caller built
//   - Placements are single shot; queries are retried with backoff
//   - TokenBucket spends, refills and refuses a bucket that never refills
//   - AccountRegistry shares one bucket per auth token
// =============================================================================

#include "flatguard/broker/account_registry.hpp"
#include "flatguard/broker/broker_gateway.hpp"
#include "flatguard/broker/retry_policy.hpp"
#include "flatguard/broker/token_bucket.hpp"
#include "flatguard/domain/errors.hpp"

#include "support/scripted_broker.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <vector>

using flatguard::domain::OrderIntent;
using flatguard::domain::OrderPurpose;
using flatguard::domain::OrderType;
using flatguard::domain::PositionKey;
using flatguard::domain::Side;

// -----------------------------------------------------------------------------
// Fixture: gateway over a scripted broker with a recording sleeper
// -----------------------------------------------------------------------------
class BrokerGatewayTest : public ::testing::Test {
 protected:
  BrokerGatewayTest()
      : accounts({flatguard::AccountSession{"ACC1", "tok-1",
                                            flatguard::BrokerEnvironment::Simulated}},
                 {}, flatguard::RateLimit{1000.0, 1000.0}),
        gateway(broker, accounts,
                flatguard::RetryPolicy(
                    flatguard::RetrySettings{3, 10, 15},
                    [this](std::chrono::milliseconds d) { sleeps.push_back(d); })) {}

  const PositionKey key{"ACC1", "MES"};
  std::vector<std::chrono::milliseconds> sleeps;
  flatguard::testing_support::ScriptedBroker broker;
  flatguard::AccountRegistry accounts;
  flatguard::BrokerGateway gateway;
};

// -----------------------------------------------------------------------------
// 1. An exit built as a limit order still goes out as Market.
// Why: A resting exit can sit unfilled while the market runs away; exits
//      must always be marketable.
// -----------------------------------------------------------------------------
TEST_F(BrokerGatewayTest, ExitIntentIsSentAsMarket) {
  const OrderIntent intent =
      OrderIntent::limit(key, Side::Sell, 2, 5010.0, OrderPurpose::Exit);

  const auto id = gateway.placeOrder(intent);

  const auto placed = broker.lastPlaced();
  ASSERT_TRUE(placed.has_value());
  EXPECT_EQ(placed->id, id);
  EXPECT_EQ(placed->intent.type, OrderType::Market);
  EXPECT_EQ(placed->intent.quantity, 2);
  EXPECT_EQ(gateway.ordersPlaced(), 1u);

  // Take-profits are allowed to rest.
  gateway.placeOrder(
      OrderIntent::limit(key, Side::Sell, 2, 5010.0, OrderPurpose::TakeProfit));
  EXPECT_EQ(broker.lastPlaced()->intent.type, OrderType::Limit);
}

// -----------------------------------------------------------------------------
// 2. Zero or negative quantities never reach the broker.
// -----------------------------------------------------------------------------
TEST_F(BrokerGatewayTest, NonPositiveQuantityIsRejectedLocally) {
  EXPECT_THROW(gateway.placeOrder(OrderIntent::market(key, Side::Buy, 0,
                                                      OrderPurpose::Entry)),
               flatguard::RejectError);
  EXPECT_THROW(gateway.placeOrder(OrderIntent::exit(key, Side::Buy, -1)),
               flatguard::RejectError);
  EXPECT_EQ(broker.placeCalls(), 0);
}

// -----------------------------------------------------------------------------
// 3. A placement with an unknown outcome is not retried.
// Why: Retrying a placement that may have reached the broker can double the
//      position.
// -----------------------------------------------------------------------------
TEST_F(BrokerGatewayTest, PlacementIsSingleShot) {
  broker.failNextPlacement();
  EXPECT_THROW(gateway.placeOrder(OrderIntent::market(key, Side::Buy, 1,
                                                      OrderPurpose::Entry)),
               flatguard::TransientBrokerError);
  EXPECT_EQ(broker.placeCalls(), 1);
  EXPECT_TRUE(sleeps.empty());

  broker.rejectNextOrder("market closed");
  try {
    gateway.placeOrder(
        OrderIntent::market(key, Side::Buy, 1, OrderPurpose::Entry));
    FAIL() << "expected RejectError";
  } catch (const flatguard::RejectError& e) {
    EXPECT_EQ(std::string(e.what()), "market closed");
  }
  EXPECT_EQ(broker.placeCalls(), 2);
  EXPECT_EQ(gateway.ordersRejected(), 1u);
}

// -----------------------------------------------------------------------------
// 4. Queries retry transient failures with capped doubling backoff.
// -----------------------------------------------------------------------------
TEST_F(BrokerGatewayTest, QueriesRetryWithBackoff) {
  broker.setPosition(key, -3, 5000.0);
  broker.failNextQueries(2);

  const auto position = gateway.queryPosition(key.account_id, key.symbol);
  EXPECT_EQ(position.quantity, -3);
  EXPECT_EQ(position.side, flatguard::domain::PositionSide::Short);
  EXPECT_EQ(broker.positionQueries(), 3);
  ASSERT_EQ(sleeps.size(), 2u);
  EXPECT_EQ(sleeps[0], std::chrono::milliseconds(10));
  EXPECT_EQ(sleeps[1], std::chrono::milliseconds(15));
}

// -----------------------------------------------------------------------------
// 5. Exhausted retries propagate; the single-attempt variant never retries.
// -----------------------------------------------------------------------------
TEST_F(BrokerGatewayTest, ExhaustedAndSingleAttemptQueriesThrow) {
  broker.failNextQueries(3);
  EXPECT_THROW(gateway.queryPosition(key.account_id, key.symbol),
               flatguard::TransientBrokerError);
  EXPECT_EQ(broker.positionQueries(), 3);

  broker.failNextQueries(1);
  EXPECT_THROW(gateway.queryPositionOnce(key.account_id, key.symbol),
               flatguard::TransientBrokerError);
  EXPECT_EQ(broker.positionQueries(), 4);
}

// -----------------------------------------------------------------------------
// 6. Cancelling an order the broker does not hold is NotFound.
// -----------------------------------------------------------------------------
TEST_F(BrokerGatewayTest, CancelUnknownOrderIsNotFound) {
  EXPECT_THROW(gateway.cancelOrder(key.account_id, "ORD-404"),
               flatguard::NotFoundError);

  const auto id = gateway.placeOrder(
      OrderIntent::limit(key, Side::Buy, 1, 4990.0, OrderPurpose::Entry));
  EXPECT_NO_THROW(gateway.cancelOrder(key.account_id, id));
  EXPECT_TRUE(gateway.queryOrders(key.account_id, key.symbol).empty());
}

// -----------------------------------------------------------------------------
// 7. TokenBucket: capacity spent, then refused when it never refills.
// -----------------------------------------------------------------------------
TEST(TokenBucketTest, SpendsCapacityAndRefusesWithoutRefill) {
  flatguard::TokenBucket bucket(2.0, 0.0);
  EXPECT_TRUE(bucket.tryAcquire());
  EXPECT_TRUE(bucket.tryAcquire());
  EXPECT_FALSE(bucket.tryAcquire());
  EXPECT_THROW(bucket.acquire(), flatguard::TransientBrokerError);
}

// -----------------------------------------------------------------------------
// 8. TokenBucket: an empty bucket makes acquire() wait for the refill.
// -----------------------------------------------------------------------------
TEST(TokenBucketTest, AcquireWaitsForRefill) {
  flatguard::TokenBucket bucket(1.0, 100.0);
  EXPECT_EQ(bucket.acquire(), std::chrono::milliseconds(0));

  const auto waited = bucket.acquire();
  EXPECT_GT(waited.count(), 0);
  EXPECT_LE(waited.count(), 10);
}

// -----------------------------------------------------------------------------
// 9. Accounts sharing an auth token share one limiter.
// Why: Brokers rate-limit per session, not per account.
// -----------------------------------------------------------------------------
TEST(AccountRegistryTest, OneBucketPerToken) {
  using flatguard::AccountSession;
  using flatguard::BrokerEnvironment;
  flatguard::AccountRegistry registry(
      {AccountSession{"A1", "shared", BrokerEnvironment::Simulated},
       AccountSession{"A2", "shared", BrokerEnvironment::Simulated},
       AccountSession{"L1", "live-tok", BrokerEnvironment::Live}},
      {{"shared", flatguard::RateLimit{3.0, 1.0}}},
      flatguard::RateLimit{7.0, 1.0});

  EXPECT_EQ(&registry.limiterFor("A1"), &registry.limiterFor("A2"));
  EXPECT_NE(&registry.limiterFor("A1"), &registry.limiterFor("L1"));
  EXPECT_DOUBLE_EQ(registry.limiterFor("A1").capacity(), 3.0);
  EXPECT_DOUBLE_EQ(registry.limiterFor("L1").capacity(), 7.0);

  // Unknown accounts get a private bucket at the default limit.
  flatguard::TokenBucket& unknown = registry.limiterFor("NOPE");
  EXPECT_NE(&unknown, &registry.limiterFor("A1"));
  EXPECT_EQ(&unknown, &registry.limiterFor("NOPE"));
  EXPECT_DOUBLE_EQ(unknown.capacity(), 7.0);

  EXPECT_EQ(registry.environmentOf("L1"), BrokerEnvironment::Live);
  EXPECT_EQ(registry.environmentOf("NOPE"), BrokerEnvironment::Simulated);
  EXPECT_EQ(registry.accounts().size(), 3u);
}
