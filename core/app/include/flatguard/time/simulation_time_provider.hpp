#pragma once

#include "flatguard/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace flatguard {

// Manually driven clock. advance_time() moves to an absolute time (replayed
// tick timestamps); advance_by() moves forward relative to now (tests).
// The clock never runs backwards: an out-of-order tick timestamp leaves it
// where it is, so exit and kill-switch deadlines cannot be pushed out.
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Returns false (and keeps the current time) for a time in the past.
  bool advance_time(std::int64_t new_time_ms);
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace flatguard
