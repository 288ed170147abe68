#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// Identifiers
// -----------------------------------------------------------------------------
// Accounts, symbols and broker order ids are opaque strings owned by the
// broker and the credential layer. The aliases keep signatures readable.
// -----------------------------------------------------------------------------
using AccountId = std::string;
using Symbol = std::string;
using BrokerOrderId = std::string;

// Order side as sent to the broker.
enum class Side {
  Buy,
  Sell,
};

// Net direction of a Position. Flat exactly when quantity == 0.
enum class PositionSide {
  Long,
  Short,
  Flat,
};

enum class OrderType {
  Market,
  Limit,
};

// Why an order exists. Exit-purpose orders are always Market; see
// OrderIntent::normalized().
enum class OrderPurpose {
  Entry,
  TakeProfit,
  StopLoss,
  DcaEntry,
  Exit,
};

// How a fill was booked in the ledger. Reconcile fills are accounting
// corrections written by the drift reconciler; no order stands behind them.
enum class FillRole {
  Entry,
  Exit,
  Dca,
  Reconcile,
};

// -----------------------------------------------------------------------------
// PositionKey — (account, symbol), the unit of serialization
// -----------------------------------------------------------------------------
// Every Position, exit state machine, DCA ladder and drift record is keyed
// by this pair. All events for one key are handled by the same event loop.
// -----------------------------------------------------------------------------
struct PositionKey {
  AccountId account_id;
  Symbol symbol;

  bool operator==(const PositionKey& other) const {
    return account_id == other.account_id && symbol == other.symbol;
  }
  bool operator!=(const PositionKey& other) const { return !(*this == other); }
  bool operator<(const PositionKey& other) const {
    return account_id != other.account_id ? account_id < other.account_id
                                          : symbol < other.symbol;
  }

  std::string toString() const { return account_id + ":" + symbol; }
};

struct PositionKeyHash {
  std::size_t operator()(const PositionKey& key) const {
    std::size_t h1 = std::hash<std::string>{}(key.account_id);
    std::size_t h2 = std::hash<std::string>{}(key.symbol);
    return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
  }
};

// -----------------------------------------------------------------------------
// Side helpers
// -----------------------------------------------------------------------------
inline Side opposite(Side side) {
  return side == Side::Buy ? Side::Sell : Side::Buy;
}

// +1 for Buy, -1 for Sell.
inline int sideSign(Side side) { return side == Side::Buy ? 1 : -1; }

inline PositionSide positionSideFor(std::int64_t quantity) {
  if (quantity > 0) return PositionSide::Long;
  if (quantity < 0) return PositionSide::Short;
  return PositionSide::Flat;
}

// The order side that reduces a position of the given signed quantity.
inline Side closingSide(std::int64_t quantity) {
  return quantity > 0 ? Side::Sell : Side::Buy;
}

// The order side that opens or grows a position in the given direction.
inline Side openingSide(PositionSide side) {
  return side == PositionSide::Short ? Side::Sell : Side::Buy;
}

// -----------------------------------------------------------------------------
// String conversions (logs, JSON files, IPC payloads)
// -----------------------------------------------------------------------------
const char* toString(Side side);
const char* toString(PositionSide side);
const char* toString(OrderType type);
const char* toString(OrderPurpose purpose);
const char* toString(FillRole role);

// Parsers accept the exact strings produced above, plus the lowercase
// aliases used on the command surface ("buy", "long", "sell", "short").
std::optional<Side> parseSide(const std::string& text);
std::optional<OrderType> parseOrderType(const std::string& text);
std::optional<OrderPurpose> parseOrderPurpose(const std::string& text);
std::optional<FillRole> parseFillRole(const std::string& text);

}  // namespace domain
}  // namespace flatguard
