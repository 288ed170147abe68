#include "flatguard/domain/instrument.hpp"

namespace flatguard {
namespace domain {

// -----------------------------------------------------------------------------
// Constructor: built-in index futures
// -----------------------------------------------------------------------------
InstrumentTable::InstrumentTable() {
  upsert({"ES", 0.25, 50.0});
  upsert({"MES", 0.25, 5.0});
  upsert({"NQ", 0.25, 20.0});
  upsert({"MNQ", 0.25, 2.0});
  upsert({"YM", 1.0, 5.0});
  upsert({"MYM", 1.0, 0.5});
  upsert({"RTY", 0.10, 50.0});
  upsert({"M2K", 0.10, 5.0});
}

void InstrumentTable::upsert(const InstrumentSpec& spec) {
  specs_[spec.symbol] = spec;
}

InstrumentSpec InstrumentTable::lookup(const Symbol& symbol) const {
  auto it = specs_.find(symbol);
  if (it != specs_.end()) {
    return it->second;
  }
  InstrumentSpec fallback;
  fallback.symbol = symbol;
  return fallback;
}

bool InstrumentTable::contains(const Symbol& symbol) const {
  return specs_.count(symbol) != 0;
}

std::vector<InstrumentSpec> InstrumentTable::all() const {
  std::vector<InstrumentSpec> result;
  result.reserve(specs_.size());
  for (const auto& [symbol, spec] : specs_) {
    result.push_back(spec);
  }
  return result;
}

}  // namespace domain
}  // namespace flatguard
