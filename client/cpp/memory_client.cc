#include "memory_client.h"

namespace projmem::client {

using namespace projmem::v1;

MemoryClient::MemoryClient(std::shared_ptr<::grpc::Channel> channel, std::chrono::milliseconds deadline)
    : stub_(ProjectMemoryService::NewStub(channel)), deadline_(deadline) {
}

OperationResponse MemoryClient::Execute(const OperationRequest& request) const {
  ::grpc::ClientContext ctx;
  ctx.set_deadline(std::chrono::system_clock::now() + deadline_);

  OperationResponse response;
  auto              status = stub_->Execute(&ctx, request, &response);
  if (!status.ok()) {
    throw TransportError(status.error_code(), "Execute failed: " + status.error_message());
  }
  return response;
}

OperationResponse MemoryClient::Checked(const OperationRequest& request) const {
  auto response = Execute(request);
  if (response.has_error()) {
    throw OperationFailed(response.error());
  }
  return response;
}

RememberDecisionResult MemoryClient::RememberDecision(const std::string& decision, const std::string& rationale, const std::string& context,
                                                      const std::string& alternatives) const {
  OperationRequest req;
  auto*            args = req.mutable_remember_decision();
  args->set_decision(decision);
  args->set_rationale(rationale);
  args->set_context(context);
  args->set_alternatives(alternatives);
  return Checked(req).remember_decision();
}

RecallDecisionsResult MemoryClient::RecallDecisions(const std::string& keyword, uint32_t limit) const {
  OperationRequest req;
  req.mutable_recall_decisions()->set_keyword(keyword);
  req.mutable_recall_decisions()->set_limit(limit);
  return Checked(req).recall_decisions();
}

StorePatternResult MemoryClient::StorePattern(const std::string& name, const std::string& description, const std::string& example,
                                              const std::string& when_to_use) const {
  OperationRequest req;
  auto*            args = req.mutable_store_pattern();
  args->set_name(name);
  args->set_description(description);
  args->set_example(example);
  args->set_when_to_use(when_to_use);
  return Checked(req).store_pattern();
}

GetPatternsResult MemoryClient::GetPatterns() const {
  OperationRequest req;
  req.mutable_get_patterns();
  return Checked(req).get_patterns();
}

SetContextResult MemoryClient::SetContext(const std::string& key, const std::string& value) const {
  OperationRequest req;
  req.mutable_set_context()->set_key(key);
  req.mutable_set_context()->set_value(value);
  return Checked(req).set_context();
}

GetContextResult MemoryClient::GetContext() const {
  OperationRequest req;
  req.mutable_get_context();
  return Checked(req).get_context();
}

MemoryStats MemoryClient::Stats() const {
  OperationRequest req;
  req.mutable_memory_stats();
  return Checked(req).memory_stats();
}

ExportMemoryResult MemoryClient::Export() const {
  OperationRequest req;
  req.mutable_export_memory();
  return Checked(req).export_memory();
}

ImportSummary MemoryClient::Import(const std::string& json) const {
  OperationRequest req;
  req.mutable_import_memory()->set_data(json);
  return Checked(req).import_memory();
}

HealthReport MemoryClient::Health() const {
  OperationRequest req;
  req.mutable_health_check();
  return Checked(req).health_check();
}

PurgeSummary MemoryClient::Purge(const std::string& confirm) const {
  OperationRequest req;
  req.mutable_purge_memory()->set_confirm(confirm);
  return Checked(req).purge_memory();
}

} // namespace projmem::client
