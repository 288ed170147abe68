#pragma once

#include <cstdint>

namespace flatguard {

// -----------------------------------------------------------------------------
// ITimeProvider — the engine's clock
// -----------------------------------------------------------------------------
// @brief  Epoch milliseconds. Every timestamp the engine records (fills,
//         opened/closed times, drift records) and every deadline it checks
//         comes from here.
//
// Implementations:
//   LiveTimeProvider       — system clock (production).
//   SimulationTimeProvider — advanced explicitly by the market data feed in
//                            replay mode, or by tests.
//
// Thread model: now_ms() is safe from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace flatguard
