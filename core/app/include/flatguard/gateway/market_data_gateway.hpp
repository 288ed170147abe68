#pragma once

#include "flatguard/events/event_types.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ SUB bridge for price ticks
// -----------------------------------------------------------------------------
//
// @brief  Receives JSON ticks on a SUB socket, decodes them into
//         PriceTickEvent and hands them to the tick sink (bound to
//         TradingEngine::onTick()).
//
// @details
// Expected payload:
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "symbol":       "MES",
//     "price":        5012.25,
//     "atr":          6.5               // optional
//   }
//
// When a clock hook is given it is called with timestamp_ms BEFORE the
// tick is handed on, so a replay driven by a SimulationTimeProvider sees
// the tick's time during its processing.
//
// Malformed payloads are logged and skipped.
//
// Thread model:
//   run() blocks; call it from a dedicated thread (MarketDataThread).
//   stop() may be called from any thread. ZMQ_RCVTIMEO bounds how long
//   the loop takes to notice it.
//
// Ownership:
//   Owns the zmq context and socket (RAII).
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using TickSink = std::function<void(PriceTickEvent)>;
  using ClockHook = std::function<void(std::int64_t)>;

  MarketDataGateway(TickSink tick_sink, const std::string& endpoint,
                    ClockHook clock_hook = {});

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // decodeTick(payload)
  // -------------------------------------------------------------------------
  // @throws nlohmann::json::exception  malformed JSON or a missing field.
  // -------------------------------------------------------------------------
  static PriceTickEvent decodeTick(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  TickSink tick_sink_;
  ClockHook clock_hook_;
  std::uint64_t next_sequence_id_{1};

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
};

}  // namespace flatguard
