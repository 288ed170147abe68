#pragma once

#include "flatguard/time/i_time_provider.hpp"

namespace flatguard {

class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace flatguard
