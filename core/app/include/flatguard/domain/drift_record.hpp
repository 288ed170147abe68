#pragma once

#include "flatguard/domain/types.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace flatguard {
namespace domain {

enum class DriftResolution {
  Pending,                 // Detected, correction not yet applied
  RebuiltFromBrokerFills,  // Ledger replaced by the broker's fill history
  CorrectedToBroker,       // Reconciliation fill(s) booked to match broker
  Unresolved,              // Correction failed; operator review needed
};

// -----------------------------------------------------------------------------
// DriftRecord — audit row for one virtual/broker quantity mismatch
// -----------------------------------------------------------------------------
// Appended when the drift reconciler sees virtual_quantity !=
// broker_quantity, and appended again under the same id when resolved.
// The store keeps the last version per id.
// -----------------------------------------------------------------------------
struct DriftRecord {
  std::uint64_t id{0};
  AccountId account_id;
  Symbol symbol;
  std::int64_t virtual_quantity{0};
  std::int64_t broker_quantity{0};
  std::int64_t detected_at_ms{0};
  DriftResolution resolution{DriftResolution::Pending};
  std::int64_t resolved_at_ms{0};
  std::string note;

  PositionKey key() const { return PositionKey{account_id, symbol}; }
};

const char* toString(DriftResolution resolution);
std::optional<DriftResolution> parseDriftResolution(const std::string& text);

}  // namespace domain
}  // namespace flatguard
