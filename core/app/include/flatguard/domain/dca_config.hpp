#pragma once

#include "flatguard/domain/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace flatguard {
namespace domain {

// Unit in which a rung's distance is measured from the average entry.
enum class DcaTriggerMode {
  Ticks,    // distance in ticks of the instrument
  Percent,  // distance in percent of the average entry price
  Atr,      // distance in multiples of the symbol's current ATR
};

// One scale-in level: fire `quantity` more contracts once adverse excursion
// reaches `distance` (in the config's unit).
struct DcaRung {
  double distance{0.0};
  std::int64_t quantity{0};
};

// -----------------------------------------------------------------------------
// DcaConfig — scale-in ladder and protective distances for one position
// -----------------------------------------------------------------------------
// Rungs are indexed by their position in `rungs`; that index is what gets
// recorded in Position::dca_triggered_indices. max_quantity caps the
// absolute position size a rung may produce (0 = no scale-ins at all).
// take_profit_ticks / stop_loss_ticks of 0 disable that protection.
// -----------------------------------------------------------------------------
struct DcaConfig {
  DcaTriggerMode mode{DcaTriggerMode::Ticks};
  std::vector<DcaRung> rungs;
  std::int64_t max_quantity{0};
  int take_profit_ticks{0};
  int stop_loss_ticks{0};
};

// Throws ConfigError unless distances are positive and strictly increasing,
// quantities are positive and the caps are non-negative.
inline void validateDcaConfig(const DcaConfig& config) {
  double previous = 0.0;
  for (std::size_t i = 0; i < config.rungs.size(); ++i) {
    const DcaRung& rung = config.rungs[i];
    if (rung.quantity <= 0) {
      throw ConfigError("dca rung " + std::to_string(i) +
                        ": quantity must be positive");
    }
    if (rung.distance <= previous) {
      throw ConfigError("dca rung " + std::to_string(i) +
                        ": distances must be positive and strictly increasing");
    }
    previous = rung.distance;
  }
  if (config.max_quantity < 0) {
    throw ConfigError("dca max_quantity must not be negative");
  }
  if (config.take_profit_ticks < 0 || config.stop_loss_ticks < 0) {
    throw ConfigError("dca protective tick distances must not be negative");
  }
}

const char* toString(DcaTriggerMode mode);
std::optional<DcaTriggerMode> parseDcaTriggerMode(const std::string& text);

}  // namespace domain
}  // namespace flatguard
