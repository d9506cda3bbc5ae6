#include "operation_error.hpp"

#include "internal/util/errors.hpp"

namespace projmem::service {

using namespace projmem::v1;

OperationError ToOperationError(const std::exception& e) {
  using namespace projmem::util;

  OperationError out;
  out.set_message(e.what());

  if (dynamic_cast<const ValidationError*>(&e)) {
    out.set_kind(ERROR_KIND_VALIDATION);
  } else if (dynamic_cast<const CapacityExceeded*>(&e)) {
    out.set_kind(ERROR_KIND_CAPACITY_EXCEEDED);
  } else if (const auto* limited = dynamic_cast<const RateLimitExceeded*>(&e)) {
    out.set_kind(ERROR_KIND_RATE_LIMIT_EXCEEDED);
    out.set_remaining(limited->remaining());
    out.set_retry_after_ms(static_cast<uint64_t>(limited->retry_after().count()));
  } else if (dynamic_cast<const PoolExhausted*>(&e)) {
    out.set_kind(ERROR_KIND_POOL_EXHAUSTED);
  } else if (dynamic_cast<const StorageIntegrity*>(&e)) {
    out.set_kind(ERROR_KIND_STORAGE_INTEGRITY);
  } else if (dynamic_cast<const PermissionDenied*>(&e)) {
    out.set_kind(ERROR_KIND_PERMISSION_DENIED);
  } else if (dynamic_cast<const SchemaVersionMismatch*>(&e)) {
    out.set_kind(ERROR_KIND_SCHEMA_VERSION);
  } else if (dynamic_cast<const UnknownOperation*>(&e)) {
    out.set_kind(ERROR_KIND_UNKNOWN_OPERATION);
  } else {
    out.set_kind(ERROR_KIND_INTERNAL);
  }
  return out;
}

std::string_view ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ERROR_KIND_VALIDATION:
      return "validation";
    case ERROR_KIND_CAPACITY_EXCEEDED:
      return "capacity_exceeded";
    case ERROR_KIND_RATE_LIMIT_EXCEEDED:
      return "rate_limit_exceeded";
    case ERROR_KIND_POOL_EXHAUSTED:
      return "pool_exhausted";
    case ERROR_KIND_STORAGE_INTEGRITY:
      return "storage_integrity";
    case ERROR_KIND_PERMISSION_DENIED:
      return "permission_denied";
    case ERROR_KIND_SCHEMA_VERSION:
      return "schema_version";
    case ERROR_KIND_UNKNOWN_OPERATION:
      return "unknown_operation";
    case ERROR_KIND_INTERNAL:
      return "internal";
    default:
      return "unspecified";
  }
}

bool IsClientError(ErrorKind kind) {
  switch (kind) {
    case ERROR_KIND_VALIDATION:
    case ERROR_KIND_CAPACITY_EXCEEDED:
    case ERROR_KIND_RATE_LIMIT_EXCEEDED:
    case ERROR_KIND_PERMISSION_DENIED:
    case ERROR_KIND_SCHEMA_VERSION:
    case ERROR_KIND_UNKNOWN_OPERATION:
      return true;
    default:
      return false;
  }
}

} // namespace projmem::service
