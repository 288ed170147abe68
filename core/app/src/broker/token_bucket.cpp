#include "flatguard/broker/token_bucket.hpp"
#include "flatguard/domain/errors.hpp"

#include <algorithm>
#include <thread>

namespace flatguard {

TokenBucket::TokenBucket(double capacity, double refill_per_second)
    : capacity_(std::max(1.0, capacity)),
      refill_per_second_(std::max(0.0, refill_per_second)),
      tokens_(std::max(1.0, capacity)),
      last_refill_(Clock::now()) {}

// -----------------------------------------------------------------------------
// refill(): credit tokens for the time elapsed since the last refill
// -----------------------------------------------------------------------------
void TokenBucket::refill(Clock::time_point now) {
  const std::chrono::duration<double> elapsed = now - last_refill_;
  tokens_ = std::min(capacity_, tokens_ + elapsed.count() * refill_per_second_);
  last_refill_ = now;
}

// -----------------------------------------------------------------------------
// acquire(): reserve under the lock, sleep outside it
// -----------------------------------------------------------------------------
std::chrono::milliseconds TokenBucket::acquire() {
  std::chrono::milliseconds wait{0};
  {
    std::lock_guard lock(mutex_);
    refill(Clock::now());
    tokens_ -= 1.0;
    if (tokens_ < 0.0) {
      if (refill_per_second_ <= 0.0) {
        // A bucket that never refills cannot be waited on.
        tokens_ += 1.0;
        throw TransientBrokerError("rate limit exhausted");
      }
      const double deficit_seconds = -tokens_ / refill_per_second_;
      wait = std::chrono::milliseconds(
          static_cast<long long>(deficit_seconds * 1000.0 + 0.5));
    }
  }

  if (wait.count() > 0) {
    std::this_thread::sleep_for(wait);
  }
  return wait;
}

bool TokenBucket::tryAcquire() {
  std::lock_guard lock(mutex_);
  refill(Clock::now());
  if (tokens_ < 1.0) {
    return false;
  }
  tokens_ -= 1.0;
  return true;
}

double TokenBucket::available() {
  std::lock_guard lock(mutex_);
  refill(Clock::now());
  return tokens_;
}

}  // namespace flatguard
