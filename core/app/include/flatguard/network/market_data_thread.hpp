#pragma once

#include "flatguard/gateway/market_data_gateway.hpp"

#include <memory>
#include <string>
#include <thread>

namespace flatguard {

// -----------------------------------------------------------------------------
// MarketDataThread — dedicated I/O thread running the MarketDataGateway
// -----------------------------------------------------------------------------
//
// @brief  Owns the gateway and the std::thread that runs its recv loop.
//
// @details
// The gateway is created in start(), not in the constructor, so the engine
// can finish its startup recovery before any tick arrives.
//
// The gateway has its own blocking recv loop, so this is a raw std::thread
// rather than an EventLoopThread.
//
// Thread model: start()/stop() from the owning thread. The tick sink is
//               invoked on the recv thread.
// Ownership:    Owned by TradingEngine via std::unique_ptr.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  MarketDataThread(MarketDataGateway::TickSink tick_sink, std::string endpoint,
                   MarketDataGateway::ClockHook clock_hook = {});

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent; blocks until the recv loop exits.
  void stop();

 private:
  MarketDataGateway::TickSink tick_sink_;
  std::string endpoint_;
  MarketDataGateway::ClockHook clock_hook_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace flatguard
