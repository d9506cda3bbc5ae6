#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace projmem::grpc {

/*
  Converts exceptions that escape the protocol handler into gRPC status
  codes. Service-level failures travel in-band as OperationError; only
  transport faults end up here.
*/

::grpc::Status ToStatus(const std::exception& e);

} // namespace projmem::grpc
