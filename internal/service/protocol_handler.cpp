#include "protocol_handler.hpp"

#include "internal/core/validation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"
#include "operation_error.hpp"

namespace projmem::service {

using namespace projmem::v1;

ProtocolHandler::ProtocolHandler(std::shared_ptr<core::MemoryStore> store, std::shared_ptr<core::SnapshotCodec> codec,
                                 std::shared_ptr<core::HealthChecker> health, std::shared_ptr<ratelimit::RateLimiter> limiter)
    : store_(std::move(store)), codec_(std::move(codec)), health_(std::move(health)), limiter_(std::move(limiter)) {
}

OperationResponse ProtocolHandler::Handle(const OperationRequest& request) {
  return Run(request.operation_case(), [&request] {
    return request;
  });
}

OperationResponse ProtocolHandler::HandleNamed(const std::string& name, const std::string& json_args) {
  const auto op = OperationFromName(name);
  if (!op) {
    OperationResponse response;
    response.set_request_id(util::NewRequestId());
    *response.mutable_error() = ToOperationError(util::UnknownOperation("unknown operation '" + name + "'"));
    PROJMEM_LOG_WARN("Operation rejected", {observability::StringField("request_id", response.request_id()),
                                            observability::StringField("operation", name),
                                            observability::StringField("kind", "unknown_operation")});
    return response;
  }

  return Run(*op, [&] {
    return BuildRequest(*op, json_args);
  });
}

OperationResponse ProtocolHandler::Run(OperationCase op, const RequestBuilder& build) {
  OperationResponse response;
  response.set_request_id(util::NewRequestId());

  try {
    if (op == OperationRequest::OPERATION_NOT_SET) {
      throw util::UnknownOperation("request names no operation");
    }
    // read-only refusal wins over argument and quota checks
    if (IsWriteOperation(op)) store_->RequireWritable();
    CheckRateLimit(op, response.request_id());

    const auto request = build();
    Dispatch(request, response);
  } catch (const std::exception& e) {
    *response.mutable_error() = ToOperationError(e);

    const auto& error = response.error();
    const auto  level = IsClientError(error.kind()) ? spdlog::level::warn : spdlog::level::err;
    observability::Log(level, "Operation failed",
                       {observability::StringField("request_id", response.request_id()), observability::StringField("operation", OperationName(op)),
                        observability::StringField("kind", ErrorKindName(error.kind())), observability::StringField("error", error.message())});
  }
  return response;
}

void ProtocolHandler::CheckRateLimit(OperationCase op, const std::string& request_id) {
  if (IsRateLimitExempt(op)) return;

  const auto decision = limiter_->Allow();
  if (decision.allowed) return;

  PROJMEM_LOG_WARN("Rate limit exceeded", {observability::StringField("request_id", request_id), observability::StringField("operation", OperationName(op)),
                                           observability::DurationField("retry_after", decision.retry_after)});
  throw util::RateLimitExceeded("rate limit exceeded; retry in " + std::to_string(decision.retry_after.count()) + "ms", decision.remaining,
                                decision.retry_after);
}

void ProtocolHandler::Dispatch(const OperationRequest& request, OperationResponse& response) {
  switch (request.operation_case()) {
    case OperationRequest::kRememberDecision: {
      const auto& args = request.remember_decision();
      *response.mutable_remember_decision() = store_->RememberDecision(args.decision(), args.rationale(), args.context(), args.alternatives());
      return;
    }
    case OperationRequest::kRecallDecisions: {
      const auto& args = request.recall_decisions();
      *response.mutable_recall_decisions() = store_->RecallDecisions(args.keyword(), args.limit());
      return;
    }
    case OperationRequest::kStorePattern: {
      const auto& args = request.store_pattern();
      *response.mutable_store_pattern() = store_->StorePattern(args.name(), args.description(), args.example(), args.when_to_use());
      return;
    }
    case OperationRequest::kGetPatterns:
      *response.mutable_get_patterns() = store_->GetPatterns();
      return;
    case OperationRequest::kSetContext: {
      const auto& args = request.set_context();
      *response.mutable_set_context() = store_->SetContext(args.key(), args.value());
      return;
    }
    case OperationRequest::kGetContext:
      *response.mutable_get_context() = store_->GetContext();
      return;
    case OperationRequest::kMemoryStats:
      *response.mutable_memory_stats() = store_->Stats();
      return;
    case OperationRequest::kExportMemory:
      *response.mutable_export_memory() = codec_->Export();
      return;
    case OperationRequest::kImportMemory:
      if (request.import_memory().data().empty()) {
        throw util::ValidationError("import_memory requires data");
      }
      *response.mutable_import_memory() = codec_->Import(request.import_memory().data());
      return;
    case OperationRequest::kHealthCheck:
      *response.mutable_health_check() = health_->Check();
      return;
    case OperationRequest::kPurgeMemory:
      core::RequirePurgeConfirmation(request.purge_memory().confirm());
      *response.mutable_purge_memory() = store_->Purge(request.purge_memory().confirm());
      return;
    case OperationRequest::OPERATION_NOT_SET:
      break;
  }
  throw util::UnknownOperation("request names no operation");
}

} // namespace projmem::service
