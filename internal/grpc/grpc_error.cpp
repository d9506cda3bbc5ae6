#include "grpc_error.hpp"

#include <new>

#include "internal/util/errors.hpp"

namespace projmem::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace projmem::util;

  if (dynamic_cast<const ValidationError*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const PoolExhausted*>(&e) || dynamic_cast<const RateLimitExceeded*>(&e) || dynamic_cast<const std::bad_alloc*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const PermissionDenied*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const StorageIntegrity*>(&e)) {
    return {::grpc::StatusCode::DATA_LOSS, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace projmem::grpc
