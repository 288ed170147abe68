#pragma once

#include <stdexcept>
#include <string>

namespace flatguard {

// -----------------------------------------------------------------------------
// Error taxonomy
// -----------------------------------------------------------------------------
// Everything the engine throws derives from FlatguardError so adapters can
// catch the family in one place. Which errors may be retried is decided by
// RetryPolicy: only TransientBrokerError, and only for read-only queries.
//
//   RejectError            broker refused an order. Never retried.
//   NotFoundError          cancel/query for an order the broker does not know.
//   TransientBrokerError   network failure or timeout talking to the broker.
//   ConflictingIntentError order or fill would grow a position mid-exit.
//   TimeoutError           confirmation or kill-switch deadline exceeded.
//   DriftDetectedError     virtual and broker quantity disagree. Informational.
//   LedgerCorruptionError  fill log does not reproduce the stored position.
//   ConfigError            invalid configuration input.
//   StateStoreError        durable store could not be read or written.
// -----------------------------------------------------------------------------
class FlatguardError : public std::runtime_error {
 public:
  explicit FlatguardError(const std::string& what) : std::runtime_error(what) {}
};

class RejectError : public FlatguardError {
 public:
  explicit RejectError(const std::string& reason)
      : FlatguardError("order rejected: " + reason), reason_(reason) {}

  const std::string& reason() const { return reason_; }

 private:
  std::string reason_;
};

class NotFoundError : public FlatguardError {
 public:
  using FlatguardError::FlatguardError;
};

class TransientBrokerError : public FlatguardError {
 public:
  using FlatguardError::FlatguardError;
};

class ConflictingIntentError : public FlatguardError {
 public:
  using FlatguardError::FlatguardError;
};

class TimeoutError : public FlatguardError {
 public:
  using FlatguardError::FlatguardError;
};

class DriftDetectedError : public FlatguardError {
 public:
  DriftDetectedError(const std::string& what, long long virtual_quantity,
                     long long broker_quantity)
      : FlatguardError(what),
        virtual_quantity_(virtual_quantity),
        broker_quantity_(broker_quantity) {}

  long long virtualQuantity() const { return virtual_quantity_; }
  long long brokerQuantity() const { return broker_quantity_; }

 private:
  long long virtual_quantity_;
  long long broker_quantity_;
};

class LedgerCorruptionError : public FlatguardError {
 public:
  using FlatguardError::FlatguardError;
};

class ConfigError : public FlatguardError {
 public:
  using FlatguardError::FlatguardError;
};

class StateStoreError : public FlatguardError {
 public:
  using FlatguardError::FlatguardError;
};

}  // namespace flatguard
