#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by events for ordering and audit.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// PriceTickEvent
// -----------------------------------------------------------------------------
// Responsibility: One normalized price update from the quote feed. Drives
// DCA evaluation, mark-to-market, stop checks and simulated limit fills.
// Broadcast to every shard; each shard acts on the positions it owns.
// atr is set when the feed supplies a fresh ATR for the symbol.
// -----------------------------------------------------------------------------
struct PriceTickEvent {
  std::string symbol;
  double price{0.0};
  std::optional<double> atr;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace flatguard
