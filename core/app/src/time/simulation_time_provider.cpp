#include "flatguard/time/simulation_time_provider.hpp"

namespace flatguard {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

bool SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  std::int64_t current = current_time_ms_.load();
  while (new_time_ms >= current) {
    if (current_time_ms_.compare_exchange_weak(current, new_time_ms)) {
      return true;
    }
  }
  return false;
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  if (delta_ms > 0) {
    current_time_ms_.fetch_add(delta_ms);
  }
}

}  // namespace flatguard
