#pragma once

#include "flatguard/domain/types.hpp"

#include <unordered_map>
#include <vector>

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// InstrumentSpec — contract economics for one symbol
// -----------------------------------------------------------------------------
// multiplier converts a one-point price move on one contract into currency
// (ES: 50, MES: 5, equities: 1). tickValue() is the currency value of one
// minimum price increment.
// -----------------------------------------------------------------------------
struct InstrumentSpec {
  Symbol symbol;
  double tick_size{0.01};
  double multiplier{1.0};

  double tickValue() const { return tick_size * multiplier; }
};

// -----------------------------------------------------------------------------
// InstrumentTable
// -----------------------------------------------------------------------------
// @brief  Symbol → InstrumentSpec lookup with a fallback for unknown
//         symbols (tick 0.01, multiplier 1, i.e. a plain equity).
//
// @details
// Constructed with the usual CME index futures pre-loaded; configuration
// may override or add entries. Immutable once the engine starts, so it is
// shared across event loops without locking.
// -----------------------------------------------------------------------------
class InstrumentTable {
 public:
  InstrumentTable();

  void upsert(const InstrumentSpec& spec);

  // Never fails: unknown symbols get the fallback spec with the symbol set.
  InstrumentSpec lookup(const Symbol& symbol) const;

  bool contains(const Symbol& symbol) const;

  std::vector<InstrumentSpec> all() const;

 private:
  std::unordered_map<Symbol, InstrumentSpec> specs_;
};

}  // namespace domain
}  // namespace flatguard
