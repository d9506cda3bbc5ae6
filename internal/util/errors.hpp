#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace projmem::util {

/*
  Central error types.

  These get translated to OperationError kinds by the protocol handler.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CapacityExceeded : public std::runtime_error {
 public:
  explicit CapacityExceeded(const std::string& msg) : std::runtime_error(msg) {
  }
};

class RateLimitExceeded : public std::runtime_error {
 public:
  RateLimitExceeded(const std::string& msg, uint64_t remaining, std::chrono::milliseconds retry_after)
      : std::runtime_error(msg), remaining_(remaining), retry_after_(retry_after) {
  }

  uint64_t remaining() const {
    return remaining_;
  }

  std::chrono::milliseconds retry_after() const {
    return retry_after_;
  }

 private:
  uint64_t                  remaining_;
  std::chrono::milliseconds retry_after_;
};

// Transient; safe to retry with backoff.
class PoolExhausted : public std::runtime_error {
 public:
  explicit PoolExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Fatal for the process until an operator restores or reinitializes the store.
class StorageIntegrity : public std::runtime_error {
 public:
  explicit StorageIntegrity(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PermissionDenied : public std::runtime_error {
 public:
  explicit PermissionDenied(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SchemaVersionMismatch : public std::runtime_error {
 public:
  explicit SchemaVersionMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownOperation : public std::runtime_error {
 public:
  explicit UnknownOperation(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace projmem::util
