#pragma once

#include "flatguard/broker/token_bucket.hpp"
#include "flatguard/domain/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flatguard {

enum class BrokerEnvironment {
  Simulated,
  Live,
};

// One brokerage account as the credential layer hands it to us. The token
// itself is never logged; it only selects the rate limiter.
struct AccountSession {
  domain::AccountId account_id;
  std::string auth_token;
  BrokerEnvironment environment{BrokerEnvironment::Simulated};
};

struct RateLimit {
  double capacity{10.0};
  double refill_per_second{5.0};
};

// -----------------------------------------------------------------------------
// AccountRegistry
// -----------------------------------------------------------------------------
//
// @brief  Maps accounts to their session and each distinct auth token to
//         one shared TokenBucket.
//
// @details
// Two accounts with the same token get the same bucket. An account that
// was never registered is treated as its own token with the default rate
// limit; it is logged once so a missing configuration entry is visible.
//
// Thread model: limiterFor() is safe from any thread (the bucket map is
//               created lazily under a mutex). Buckets are never removed,
//               so returned references stay valid.
// -----------------------------------------------------------------------------
class AccountRegistry {
 public:
  AccountRegistry(std::vector<AccountSession> sessions,
                  std::map<std::string, RateLimit> token_limits,
                  RateLimit default_limit);

  AccountRegistry(const AccountRegistry&) = delete;
  AccountRegistry& operator=(const AccountRegistry&) = delete;

  TokenBucket& limiterFor(const domain::AccountId& account_id);

  BrokerEnvironment environmentOf(const domain::AccountId& account_id) const;

  std::vector<domain::AccountId> accounts() const;

 private:
  std::string tokenFor(const domain::AccountId& account_id);

  std::map<domain::AccountId, AccountSession> sessions_;
  std::map<std::string, RateLimit> token_limits_;
  RateLimit default_limit_;

  mutable std::mutex mutex_;
  std::map<std::string, std::unique_ptr<TokenBucket>> buckets_;
  std::map<domain::AccountId, std::string> unknown_accounts_;
};

}  // namespace flatguard
