#pragma once

#include "flatguard/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace flatguard {

// Conversions between the epoch-millisecond integers used in the domain
// and the Timestamp carried by events.
inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace flatguard
