#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// OrderIdGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids from an atomic counter starting at 1 (0 is
//         the "unset" sentinel). Used by the simulated broker for order and
//         fill ids, and by the drift reconciler for DriftRecord ids.
//
// @details
// next_tag(prefix) formats the id as "<prefix>-<n>" for the string ids the
// broker contract uses. Relaxed ordering is enough: the only requirement is
// uniqueness per generator instance.
//
// Thread model: next_id() and next_tag() are safe from any thread.
// Ownership:    Value member of whichever component issues the ids.
// -----------------------------------------------------------------------------
class OrderIdGenerator {
 public:
  OrderIdGenerator() = default;

  // Explicit starting point, used after a restart so ids keep increasing.
  explicit OrderIdGenerator(std::uint64_t first) : next_id_(first) {}

  OrderIdGenerator(const OrderIdGenerator&) = delete;
  OrderIdGenerator& operator=(const OrderIdGenerator&) = delete;
  OrderIdGenerator(OrderIdGenerator&&) = delete;
  OrderIdGenerator& operator=(OrderIdGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  std::string next_tag(const std::string& prefix) {
    return prefix + "-" + std::to_string(next_id());
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace flatguard
