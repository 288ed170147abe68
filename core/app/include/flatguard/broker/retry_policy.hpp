#pragma once

#include "flatguard/domain/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>
#include <thread>

namespace flatguard {

struct RetrySettings {
  int max_attempts{3};
  std::int64_t initial_backoff_ms{50};
  std::int64_t max_backoff_ms{500};
};

// -----------------------------------------------------------------------------
// RetryPolicy — the one place that decides what may be retried
// -----------------------------------------------------------------------------
//
// @brief  Retries idempotent broker queries on TransientBrokerError with
//         exponential backoff. Order placement never goes through here.
//
// @details
// Two entry points make the distinction explicit at every call site:
//
//   query(what, fn)      idempotent read (position, orders, fills):
//                        up to max_attempts tries, backoff doubling from
//                        initial_backoff_ms and capped at max_backoff_ms.
//   singleShot(what, fn) non-idempotent call (place/cancel): exactly one
//                        try; every error propagates to the caller.
//
// A duplicate order on retry is worse than a visible failure, so there is
// no way to ask this class to retry a placement.
//
// The sleeper is injectable so tests can run without real delays.
// -----------------------------------------------------------------------------
class RetryPolicy {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  explicit RetryPolicy(RetrySettings settings = {}, Sleeper sleeper = {})
      : settings_(settings), sleeper_(std::move(sleeper)) {
    if (settings_.max_attempts < 1) {
      settings_.max_attempts = 1;
    }
    if (!sleeper_) {
      sleeper_ = [](std::chrono::milliseconds d) {
        std::this_thread::sleep_for(d);
      };
    }
  }

  template <typename Fn>
  auto query(const std::string& what, Fn&& fn) const -> decltype(fn()) {
    std::int64_t backoff = settings_.initial_backoff_ms;
    for (int attempt = 1;; ++attempt) {
      try {
        return fn();
      } catch (const TransientBrokerError& e) {
        if (attempt >= settings_.max_attempts) {
          std::cerr << "[RetryPolicy] " << what << " failed after " << attempt
                    << " attempt(s): " << e.what() << "\n";
          throw;
        }
        std::cerr << "[RetryPolicy] " << what << " attempt " << attempt
                  << " failed (" << e.what() << "), retrying in " << backoff
                  << " ms\n";
        sleeper_(std::chrono::milliseconds(backoff));
        backoff = std::min(backoff * 2, settings_.max_backoff_ms);
      }
    }
  }

  template <typename Fn>
  auto singleShot(const std::string& /*what*/, Fn&& fn) const -> decltype(fn()) {
    return fn();
  }

  const RetrySettings& settings() const { return settings_; }

 private:
  RetrySettings settings_;
  Sleeper sleeper_;
};

}  // namespace flatguard
