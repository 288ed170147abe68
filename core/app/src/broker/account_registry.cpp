#include "flatguard/broker/account_registry.hpp"

#include <iostream>

namespace flatguard {

AccountRegistry::AccountRegistry(std::vector<AccountSession> sessions,
                                 std::map<std::string, RateLimit> token_limits,
                                 RateLimit default_limit)
    : token_limits_(std::move(token_limits)), default_limit_(default_limit) {
  for (auto& session : sessions) {
    sessions_[session.account_id] = std::move(session);
  }
}

// -----------------------------------------------------------------------------
// tokenFor(): caller holds mutex_
// -----------------------------------------------------------------------------
std::string AccountRegistry::tokenFor(const domain::AccountId& account_id) {
  auto it = sessions_.find(account_id);
  if (it != sessions_.end() && !it->second.auth_token.empty()) {
    return it->second.auth_token;
  }

  auto [unknown, inserted] =
      unknown_accounts_.emplace(account_id, "account:" + account_id);
  if (inserted) {
    std::cerr << "[AccountRegistry] WARNING: account '" << account_id
              << "' has no configured session; using a private rate limiter\n";
  }
  return unknown->second;
}

// -----------------------------------------------------------------------------
// limiterFor(): one bucket per token, created on first use
// -----------------------------------------------------------------------------
TokenBucket& AccountRegistry::limiterFor(const domain::AccountId& account_id) {
  std::lock_guard lock(mutex_);
  const std::string token = tokenFor(account_id);

  auto it = buckets_.find(token);
  if (it == buckets_.end()) {
    auto limit_it = token_limits_.find(token);
    const RateLimit& limit =
        limit_it != token_limits_.end() ? limit_it->second : default_limit_;
    it = buckets_
             .emplace(token, std::make_unique<TokenBucket>(
                                 limit.capacity, limit.refill_per_second))
             .first;
  }
  return *it->second;
}

BrokerEnvironment AccountRegistry::environmentOf(
    const domain::AccountId& account_id) const {
  auto it = sessions_.find(account_id);
  return it != sessions_.end() ? it->second.environment
                               : BrokerEnvironment::Simulated;
}

std::vector<domain::AccountId> AccountRegistry::accounts() const {
  std::vector<domain::AccountId> result;
  result.reserve(sessions_.size());
  for (const auto& [account_id, session] : sessions_) {
    result.push_back(account_id);
  }
  return result;
}

}  // namespace flatguard
