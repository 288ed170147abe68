#include "flatguard/network/market_data_thread.hpp"

#include <iostream>
#include <utility>

namespace flatguard {

MarketDataThread::MarketDataThread(MarketDataGateway::TickSink tick_sink,
                                   std::string endpoint,
                                   MarketDataGateway::ClockHook clock_hook)
    : tick_sink_(std::move(tick_sink)),
      endpoint_(std::move(endpoint)),
      clock_hook_(std::move(clock_hook)) {}

MarketDataThread::~MarketDataThread() { stop(); }

// -----------------------------------------------------------------------------
// start(): create gateway and spawn recv thread
// -----------------------------------------------------------------------------
void MarketDataThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<MarketDataGateway>(tick_sink_, endpoint_,
                                                 clock_hook_);

  thread_ = std::thread([this] {
    std::cout << "[MarketDataThread] listening on " << endpoint_ << "\n";
    try {
      gateway_->run();
    } catch (const zmq::error_t& e) {
      std::cerr << "[MarketDataThread] FATAL: socket error: " << e.what()
                << "; market data stopped\n";
    }
    std::cout << "[MarketDataThread] recv loop exited.\n";
  });
}

// -----------------------------------------------------------------------------
// stop(): signal gateway and join thread
// -----------------------------------------------------------------------------
void MarketDataThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace flatguard
