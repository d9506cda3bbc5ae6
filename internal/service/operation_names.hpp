#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "projmem/v1/operations.pb.h"

namespace projmem::service {

using OperationCase = projmem::v1::OperationRequest::OperationCase;

// Wire name ("remember_decision", ...) -> oneof case. Fixed table, no reflection.
std::optional<OperationCase> OperationFromName(std::string_view name);

// "unknown" for OPERATION_NOT_SET.
std::string_view OperationName(OperationCase op);

// Every supported wire name, in declaration order.
std::vector<std::string_view> OperationNames();

// Request carrying `json_args` ("" = no arguments) parsed into op's argument
// message. Unknown fields are rejected with util::ValidationError.
projmem::v1::OperationRequest BuildRequest(OperationCase op, const std::string& json_args);

// Administrative / bulk operations that do not count against the rate limit.
bool IsRateLimitExempt(OperationCase op);

// Operations that modify stored data; refused up front in read-only mode.
bool IsWriteOperation(OperationCase op);

} // namespace projmem::service
