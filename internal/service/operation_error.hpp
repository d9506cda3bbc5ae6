#pragma once

#include <exception>
#include <string_view>

#include "projmem/v1/memory.pb.h"

namespace projmem::service {

/*
  Converts internal exceptions into structured OperationErrors.
  Anything outside the service taxonomy becomes ERROR_KIND_INTERNAL.
*/

projmem::v1::OperationError ToOperationError(const std::exception& e);

// "validation", "capacity_exceeded", ...
std::string_view ErrorKindName(projmem::v1::ErrorKind kind);

// Caller mistakes (bad input, limits) as opposed to service faults.
bool IsClientError(projmem::v1::ErrorKind kind);

} // namespace projmem::service
