#pragma once

#include <functional>
#include <memory>
#include <string>

#include "internal/core/health_checker.hpp"
#include "internal/core/memory_store.hpp"
#include "internal/core/snapshot_codec.hpp"
#include "internal/ratelimit/rate_limiter.hpp"
#include "operation_names.hpp"
#include "projmem/v1/operations.pb.h"

namespace projmem::service {

/*
  ProtocolHandler

  Single entry point for every operation. Per call:

    read-only refusal (write ops) -> rate limit (non-exempt ops)
    -> argument shape -> purge confirmation -> store call -> OperationResponse

  Never throws: every failure becomes OperationResponse.error and is
  logged with the response's request id.
*/
class ProtocolHandler {
 public:
  ProtocolHandler(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<core::SnapshotCodec> codec,
                  std::shared_ptr<core::HealthChecker> health, std::shared_ptr<ratelimit::RateLimiter> limiter);

  projmem::v1::OperationResponse Handle(const projmem::v1::OperationRequest& request);

  // Wire name + JSON arguments ("" means no arguments). Unknown argument
  // fields are rejected.
  projmem::v1::OperationResponse HandleNamed(const std::string& name, const std::string& json_args);

 private:
  using RequestBuilder = std::function<projmem::v1::OperationRequest()>;

  projmem::v1::OperationResponse Run(OperationCase op, const RequestBuilder& build);

  void CheckRateLimit(OperationCase op, const std::string& request_id);

  void Dispatch(const projmem::v1::OperationRequest& request, projmem::v1::OperationResponse& response);

  std::shared_ptr<core::MemoryStore>      store_;
  std::shared_ptr<core::SnapshotCodec>    codec_;
  std::shared_ptr<core::HealthChecker>    health_;
  std::shared_ptr<ratelimit::RateLimiter> limiter_;
};

} // namespace projmem::service
