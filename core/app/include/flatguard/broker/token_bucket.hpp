#pragma once

#include <chrono>
#include <mutex>

namespace flatguard {

// -----------------------------------------------------------------------------
// TokenBucket — outbound call limiter for one broker auth token
// -----------------------------------------------------------------------------
//
// @brief  Classic token bucket: holds up to `capacity` tokens, refilled
//         continuously at `refill_per_second`. Every broker call spends one.
//
// @details
// Brokers rate-limit per session token, and several accounts may share a
// token, so one bucket exists per token (see AccountRegistry).
//
// acquire() reserves a token under the lock and sleeps, if needed, after
// releasing it; the balance may go negative to represent callers already
// waiting. No lock is held while sleeping.
//
// Thread model: All methods are safe from any thread.
// -----------------------------------------------------------------------------
class TokenBucket {
 public:
  using Clock = std::chrono::steady_clock;

  TokenBucket(double capacity, double refill_per_second);

  TokenBucket(const TokenBucket&) = delete;
  TokenBucket& operator=(const TokenBucket&) = delete;

  // Blocks until a token is available, then spends it. Returns the time
  // spent waiting. Throws TransientBrokerError when the bucket is empty
  // and never refills.
  std::chrono::milliseconds acquire();

  // Spends a token only if one is available right now.
  bool tryAcquire();

  // Current balance after refill. Diagnostics and tests.
  double available();

  double capacity() const { return capacity_; }
  double refillPerSecond() const { return refill_per_second_; }

 private:
  // Caller must hold mutex_.
  void refill(Clock::time_point now);

  const double capacity_;
  const double refill_per_second_;

  std::mutex mutex_;
  double tokens_;
  Clock::time_point last_refill_;
};

}  // namespace flatguard
