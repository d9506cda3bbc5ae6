#include "operation_names.hpp"

#include <google/protobuf/util/json_util.h>

#include <array>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace projmem::service {

namespace {

using Request = projmem::v1::OperationRequest;

constexpr std::array<std::pair<std::string_view, OperationCase>, 11> kOperations = {{
    {"remember_decision", Request::kRememberDecision},
    {"recall_decisions", Request::kRecallDecisions},
    {"store_pattern", Request::kStorePattern},
    {"get_patterns", Request::kGetPatterns},
    {"set_context", Request::kSetContext},
    {"get_context", Request::kGetContext},
    {"memory_stats", Request::kMemoryStats},
    {"export_memory", Request::kExportMemory},
    {"import_memory", Request::kImportMemory},
    {"health_check", Request::kHealthCheck},
    {"purge_memory", Request::kPurgeMemory},
}};

google::protobuf::Message* MutableArgs(Request& request, OperationCase op) {
  switch (op) {
    case Request::kRememberDecision:
      return request.mutable_remember_decision();
    case Request::kRecallDecisions:
      return request.mutable_recall_decisions();
    case Request::kStorePattern:
      return request.mutable_store_pattern();
    case Request::kGetPatterns:
      return request.mutable_get_patterns();
    case Request::kSetContext:
      return request.mutable_set_context();
    case Request::kGetContext:
      return request.mutable_get_context();
    case Request::kMemoryStats:
      return request.mutable_memory_stats();
    case Request::kExportMemory:
      return request.mutable_export_memory();
    case Request::kImportMemory:
      return request.mutable_import_memory();
    case Request::kHealthCheck:
      return request.mutable_health_check();
    case Request::kPurgeMemory:
      return request.mutable_purge_memory();
    case Request::OPERATION_NOT_SET:
      break;
  }
  throw util::UnknownOperation("request names no operation");
}

} // namespace

std::optional<OperationCase> OperationFromName(std::string_view name) {
  for (const auto& [wire, op] : kOperations) {
    if (wire == name) return op;
  }
  return std::nullopt;
}

std::string_view OperationName(OperationCase op) {
  for (const auto& [wire, candidate] : kOperations) {
    if (candidate == op) return wire;
  }
  return "unknown";
}

std::vector<std::string_view> OperationNames() {
  std::vector<std::string_view> out;
  out.reserve(kOperations.size());
  for (const auto& entry : kOperations) out.push_back(entry.first);
  return out;
}

projmem::v1::OperationRequest BuildRequest(OperationCase op, const std::string& json_args) {
  Request request;
  auto*   args = MutableArgs(request, op);

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json_args.empty() ? "{}" : json_args, args, options);
  if (!status.ok()) {
    throw util::ValidationError("invalid arguments for " + std::string(OperationName(op)) + ": " + std::string(status.message()));
  }
  return request;
}

bool IsRateLimitExempt(OperationCase op) {
  switch (op) {
    case Request::kMemoryStats:
    case Request::kExportMemory:
    case Request::kImportMemory:
    case Request::kHealthCheck:
    case Request::kPurgeMemory:
      return true;
    default:
      return false;
  }
}

bool IsWriteOperation(OperationCase op) {
  switch (op) {
    case Request::kRememberDecision:
    case Request::kStorePattern:
    case Request::kSetContext:
    case Request::kImportMemory:
    case Request::kPurgeMemory:
      return true;
    default:
      return false;
  }
}

} // namespace projmem::service
