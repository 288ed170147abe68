#include "flatguard/gateway/market_data_gateway.hpp"
#include "flatguard/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace flatguard {

// -----------------------------------------------------------------------------
// Constructor: SUB socket, subscribe to everything, bounded recv
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(TickSink tick_sink,
                                     const std::string& endpoint,
                                     ClockHook clock_hook)
    : tick_sink_(std::move(tick_sink)), clock_hook_(std::move(clock_hook)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// decodeTick
// -----------------------------------------------------------------------------
PriceTickEvent MarketDataGateway::decodeTick(const std::string& payload) {
  const nlohmann::json json = nlohmann::json::parse(payload);

  PriceTickEvent tick;
  tick.symbol = json.at("symbol").get<std::string>();
  tick.price = json.at("price").get<double>();
  tick.timestamp = ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>());
  if (json.contains("atr") && !json.at("atr").is_null()) {
    tick.atr = json.at("atr").get<double>();
  }
  return tick;
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    zmq::recv_result_t result;
    try {
      result = socket_.recv(msg, zmq::recv_flags::none);
    } catch (const zmq::error_t& e) {
      if (e.num() == EINTR) {
        continue;
      }
      throw;
    }
    if (!result.has_value()) {
      continue;
    }

    const std::string payload = msg.to_string();
    try {
      PriceTickEvent tick = decodeTick(payload);
      tick.sequence_id = next_sequence_id_++;
      if (clock_hook_) {
        clock_hook_(timestamp_to_ms(tick.timestamp));
      }
      tick_sink_(std::move(tick));
    } catch (const nlohmann::json::exception& e) {
      std::cerr << "[MarketDataGateway] bad tick skipped: " << e.what()
                << " payload: " << payload << "\n";
    }
  }
}

void MarketDataGateway::stop() { running_.store(false); }

}  // namespace flatguard
