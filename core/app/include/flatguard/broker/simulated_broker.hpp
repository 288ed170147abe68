#pragma once

#include "flatguard/broker/i_broker_api.hpp"
#include "flatguard/concurrent/order_id_generator.hpp"
#include "flatguard/domain/instrument.hpp"
#include "flatguard/events/event.hpp"
#include "flatguard/feed/price_feed.hpp"
#include "flatguard/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace flatguard {

// -----------------------------------------------------------------------------
// SimulatedBroker — in-process IBrokerApi for the simulated environment
// -----------------------------------------------------------------------------
//
// @brief  Keeps broker-side positions, working orders and fill history,
//         and pushes fills and position snapshots to an EventSink the way a
//         real broker's stream would.
//
// @details
// Execution model:
//   Market  → fills immediately, in full, at the feed's last price.
//             Rejected when the symbol has no price yet.
//   Limit   → rests. onTick() fills it in full at the limit price once the
//             tick trades through (buy: price <= limit, sell: price >= limit).
//
// Every fill is pushed as BrokerFillEvent followed by PositionSnapshotEvent.
// Events are emitted after the internal lock is released, so the sink may
// call back into the broker.
//
// Fault injection, used by tests and operator drills:
//   rejectNextOrders(n, reason)  next n placeOrder() calls throw RejectError
//   rejectOrdersAsync(on)        placements are accepted, then rejected via
//                                OrderRejectedEvent instead of filled
//   failNextQueries(n)           next n query*() calls throw
//                                TransientBrokerError
//   setPushFills(false)          fills are booked but never pushed (lost
//                                push stream)
//   applyExternalFill(...)       a trade done outside the engine (manual
//                                order in the broker UI)
//
// Thread model: All methods are safe from any thread; one mutex guards all
//               state.
// Ownership:    Owned by main() or the test. The PriceFeed, time provider and
//               instrument table must outlive it.
// -----------------------------------------------------------------------------
class SimulatedBroker final : public IBrokerApi {
 public:
  SimulatedBroker(const PriceFeed& feed, const ITimeProvider& time_provider,
                  const domain::InstrumentTable& instruments);

  SimulatedBroker(const SimulatedBroker&) = delete;
  SimulatedBroker& operator=(const SimulatedBroker&) = delete;

  // Set before the engine starts. Without a sink, fills are only booked.
  void setEventSink(EventSink sink);

  domain::BrokerOrderId placeOrder(const domain::OrderIntent& intent) override;

  void cancelOrder(const domain::AccountId& account_id,
                   const domain::BrokerOrderId& order_id) override;

  BrokerPosition queryPosition(const domain::AccountId& account_id,
                               const domain::Symbol& symbol) override;

  std::vector<domain::BrokerOrderId> queryOrders(
      const domain::AccountId& account_id,
      const domain::Symbol& symbol) override;

  std::vector<domain::Fill> queryFills(const domain::AccountId& account_id,
                                       const domain::Symbol& symbol) override;

  // Fills resting limit orders crossed by this price.
  void onTick(const domain::Symbol& symbol, double price);

  void rejectNextOrders(int count, std::string reason);
  void rejectOrdersAsync(bool enabled, std::string reason = "simulated reject");
  void failNextQueries(int count);
  void setPushFills(bool enabled);
  void setPushSnapshots(bool enabled);
  void applyExternalFill(const domain::AccountId& account_id,
                         const domain::Symbol& symbol, domain::Side side,
                         std::int64_t quantity, double price);

  std::int64_t positionOf(const domain::AccountId& account_id,
                          const domain::Symbol& symbol) const;
  std::size_t workingOrderCount() const;
  std::uint64_t ordersReceived() const;

 private:
  struct Book {
    std::int64_t quantity{0};
    double average_price{0.0};
    std::vector<domain::Fill> fills;
  };

  struct WorkingOrder {
    domain::BrokerOrderId id;
    domain::OrderIntent intent;
  };

  // Books a fill and appends the push events to `out`. Caller holds mutex_.
  void fillLocked(const domain::BrokerOrderId& order_id,
                  const domain::OrderIntent& intent, double price,
                  std::vector<Event>& out);

  void throwIfQueryFails();
  void emit(std::vector<Event>& events);

  const PriceFeed& feed_;
  const ITimeProvider& time_provider_;
  const domain::InstrumentTable& instruments_;

  OrderIdGenerator order_ids_;
  OrderIdGenerator fill_ids_;

  mutable std::mutex mutex_;
  EventSink sink_;
  std::map<domain::PositionKey, Book> books_;
  std::map<domain::BrokerOrderId, WorkingOrder> working_;
  int reject_next_{0};
  std::string reject_reason_{"simulated reject"};
  bool reject_async_{false};
  std::string async_reject_reason_{"simulated reject"};
  int fail_queries_{0};
  bool push_fills_{true};
  bool push_snapshots_{true};
  std::uint64_t orders_received_{0};
};

}  // namespace flatguard
