#pragma once

#include "flatguard/domain/types.hpp"

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace flatguard {

// -----------------------------------------------------------------------------
// PriceFeed — per-symbol last-price table
// -----------------------------------------------------------------------------
//
// @brief  Normalizes pushed ticks into the latest price (and ATR, when
//         supplied) for each symbol.
//
// @details
// Written by whichever thread receives ticks (market data thread, IPC,
// tests) and read from every shard and from the simulated broker. Ticks
// with a non-positive or non-finite price are dropped and counted.
//
// ATR is needed for ATR-mode DCA ladders. It may arrive on the tick itself
// or be set separately (IPC SET_ATR); a symbol without ATR simply never
// triggers ATR rungs.
//
// Thread model: All methods are safe from any thread. Readers take a
//               shared_lock; update()/setAtr() take a unique_lock.
// Ownership:    Owned by TradingEngine; outlives shards and the broker.
// -----------------------------------------------------------------------------
class PriceFeed {
 public:
  struct Quote {
    double price{0.0};
    std::optional<double> atr;
    std::int64_t updated_at_ms{0};
  };

  PriceFeed() = default;

  PriceFeed(const PriceFeed&) = delete;
  PriceFeed& operator=(const PriceFeed&) = delete;

  // Returns false (and records nothing) for an unusable price.
  bool update(const domain::Symbol& symbol, double price,
              std::optional<double> atr, std::int64_t now_ms);

  void setAtr(const domain::Symbol& symbol, double atr);

  std::optional<double> lastPrice(const domain::Symbol& symbol) const;
  std::optional<double> atr(const domain::Symbol& symbol) const;
  std::optional<Quote> quote(const domain::Symbol& symbol) const;

  std::uint64_t rejectedTicks() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::Symbol, Quote> quotes_;
  std::uint64_t rejected_ticks_{0};
};

}  // namespace flatguard
