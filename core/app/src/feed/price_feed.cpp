#include "flatguard/feed/price_feed.hpp"

#include <cmath>
#include <iostream>
#include <mutex>

namespace flatguard {

// -----------------------------------------------------------------------------
// update(): record one tick
// -----------------------------------------------------------------------------
bool PriceFeed::update(const domain::Symbol& symbol, double price,
                       std::optional<double> atr, std::int64_t now_ms) {
  std::unique_lock lock(mutex_);

  if (symbol.empty() || !std::isfinite(price) || price <= 0.0) {
    ++rejected_ticks_;
    std::cerr << "[PriceFeed] WARNING: dropping tick symbol='" << symbol
              << "' price=" << price << "\n";
    return false;
  }

  Quote& quote = quotes_[symbol];
  quote.price = price;
  quote.updated_at_ms = now_ms;
  if (atr && std::isfinite(*atr) && *atr > 0.0) {
    quote.atr = atr;
  }
  return true;
}

void PriceFeed::setAtr(const domain::Symbol& symbol, double atr) {
  if (!std::isfinite(atr) || atr <= 0.0) {
    return;
  }
  std::unique_lock lock(mutex_);
  quotes_[symbol].atr = atr;
}

std::optional<double> PriceFeed::lastPrice(const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = quotes_.find(symbol);
  if (it == quotes_.end() || it->second.price <= 0.0) {
    return std::nullopt;
  }
  return it->second.price;
}

std::optional<double> PriceFeed::atr(const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = quotes_.find(symbol);
  return it == quotes_.end() ? std::nullopt : it->second.atr;
}

std::optional<PriceFeed::Quote> PriceFeed::quote(
    const domain::Symbol& symbol) const {
  std::shared_lock lock(mutex_);
  auto it = quotes_.find(symbol);
  if (it == quotes_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::uint64_t PriceFeed::rejectedTicks() const {
  std::shared_lock lock(mutex_);
  return rejected_ticks_;
}

}  // namespace flatguard
