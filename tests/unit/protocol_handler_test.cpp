#include "internal/service/protocol_handler.hpp"

#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/memory_options.hpp"
#include "internal/factory.hpp"
#include "internal/service/operation_error.hpp"
#include "internal/service/operation_names.hpp"
#include "internal/service/service_context.hpp"

namespace {

using projmem::config::MemoryOptions;
using projmem::service::ProtocolHandler;
using namespace projmem::v1;

std::shared_ptr<projmem::service::ServiceContext> Open(const std::string& name, const std::function<void(MemoryOptions&)>& tweak = {}) {
  const auto dir = std::filesystem::temp_directory_path() / "project_memory_protocol_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);

  MemoryOptions opts;
  opts.db_path      = path.string();
  opts.project_name = "protocol_test";
  opts.pool_size    = 2;
  if (tweak) tweak(opts);
  return projmem::factory::Build(opts);
}

void TestNamedOperationsRoundTrip() {
  auto  ctx     = Open("named");
  auto& handler = *ctx->handler;

  const auto remembered = handler.HandleNamed("remember_decision", R"({"decision":"Use gRPC","rationale":"typed contract","context":"transport"})");
  assert(remembered.result_case() == OperationResponse::kRememberDecision);
  assert(remembered.remember_decision().id() > 0);
  assert(!remembered.request_id().empty());

  const auto pattern = handler.HandleNamed("store_pattern", R"({"name":"repository","description":"wrap storage","when_to_use":"always"})");
  assert(pattern.result_case() == OperationResponse::kStorePattern);
  assert(!pattern.store_pattern().replaced());

  const auto context = handler.HandleNamed("set_context", R"({"key":"tech_stack","value":"C++20"})");
  assert(context.result_case() == OperationResponse::kSetContext);

  const auto recalled = handler.HandleNamed("recall_decisions", R"({"keyword":"grpc","limit":5})");
  assert(recalled.result_case() == OperationResponse::kRecallDecisions);
  assert(recalled.recall_decisions().decisions_size() == 1);
  assert(recalled.recall_decisions().decisions(0).context() == "transport");

  const auto patterns = handler.HandleNamed("get_patterns", "");
  assert(patterns.get_patterns().patterns(0).when_to_use() == "always");

  const auto stored_context = handler.HandleNamed("get_context", "{}");
  assert(stored_context.get_context().context().at("tech_stack") == "C++20");

  const auto stats = handler.HandleNamed("memory_stats", "");
  assert(stats.memory_stats().decisions() == 1);
  assert(stats.memory_stats().patterns() == 1);
  assert(stats.memory_stats().context_keys() == 1);

  const auto health = handler.HandleNamed("health_check", "");
  assert(health.result_case() == OperationResponse::kHealthCheck);
  assert(health.health_check().status() == HEALTH_STATUS_HEALTHY);

  assert(remembered.request_id() != pattern.request_id());
}

void TestExportImportThroughHandler() {
  auto  ctx     = Open("export_import");
  auto& handler = *ctx->handler;

  handler.HandleNamed("set_context", R"({"key":"k","value":"v"})");
  const auto exported = handler.HandleNamed("export_memory", "");
  assert(exported.result_case() == OperationResponse::kExportMemory);

  handler.HandleNamed("purge_memory", R"({"confirm":"CONFIRM_PURGE"})");

  OperationRequest import_request;
  import_request.mutable_import_memory()->set_data(exported.export_memory().json());
  const auto imported = handler.Handle(import_request);
  assert(imported.result_case() == OperationResponse::kImportMemory);
  assert(imported.import_memory().context_imported() == 1);

  const auto empty = handler.HandleNamed("import_memory", "");
  assert(empty.result_case() == OperationResponse::kError);
  assert(empty.error().kind() == ERROR_KIND_VALIDATION);
}

void TestRateLimitAppliesToNonExemptOps() {
  auto  ctx     = Open("rate_limit", [](MemoryOptions& o) { o.operations_per_window = 2; });
  auto& handler = *ctx->handler;

  assert(handler.HandleNamed("set_context", R"({"key":"a","value":"1"})").result_case() == OperationResponse::kSetContext);
  assert(handler.HandleNamed("get_context", "").result_case() == OperationResponse::kGetContext);

  const auto limited = handler.HandleNamed("set_context", R"({"key":"b","value":"2"})");
  assert(limited.result_case() == OperationResponse::kError);
  assert(limited.error().kind() == ERROR_KIND_RATE_LIMIT_EXCEEDED);
  assert(limited.error().remaining() == 0);
  assert(limited.error().retry_after_ms() > 0);

  // the rejected write never reached the store
  assert(ctx->store->GetContext().context().count("b") == 0);

  // administrative operations stay available
  assert(handler.HandleNamed("memory_stats", "").result_case() == OperationResponse::kMemoryStats);
  assert(handler.HandleNamed("health_check", "").result_case() == OperationResponse::kHealthCheck);
  assert(handler.HandleNamed("export_memory", "").result_case() == OperationResponse::kExportMemory);
  assert(ctx->limiter->Snapshot().current_usage == 2);
}

void TestUnknownOperationsAndArguments() {
  auto  ctx     = Open("unknown");
  auto& handler = *ctx->handler;

  const auto unknown = handler.HandleNamed("drop_tables", "");
  assert(unknown.result_case() == OperationResponse::kError);
  assert(unknown.error().kind() == ERROR_KIND_UNKNOWN_OPERATION);
  assert(ctx->limiter->Snapshot().current_usage == 0);

  const auto not_set = handler.Handle(OperationRequest{});
  assert(not_set.error().kind() == ERROR_KIND_UNKNOWN_OPERATION);

  const auto bad_field = handler.HandleNamed("set_context", R"({"key":"a","value":"1","ttl":5})");
  assert(bad_field.error().kind() == ERROR_KIND_VALIDATION);

  const auto bad_json = handler.HandleNamed("set_context", "{key:");
  assert(bad_json.error().kind() == ERROR_KIND_VALIDATION);

  const auto missing = handler.HandleNamed("remember_decision", R"({"decision":"only what"})");
  assert(missing.error().kind() == ERROR_KIND_VALIDATION);
}

void TestPurgeAndCapacityErrors() {
  auto  ctx     = Open("errors", [](MemoryOptions& o) { o.max_patterns = 1; });
  auto& handler = *ctx->handler;

  handler.HandleNamed("store_pattern", R"({"name":"one","description":"first"})");
  const auto full = handler.HandleNamed("store_pattern", R"({"name":"two","description":"second"})");
  assert(full.error().kind() == ERROR_KIND_CAPACITY_EXCEEDED);

  const auto no_token = handler.HandleNamed("purge_memory", "");
  assert(no_token.error().kind() == ERROR_KIND_PERMISSION_DENIED);
  assert(ctx->store->Stats().patterns() == 1);

  const auto purged = handler.HandleNamed("purge_memory", R"({"confirm":"CONFIRM_PURGE"})");
  assert(purged.result_case() == OperationResponse::kPurgeMemory);
  assert(purged.purge_memory().patterns_deleted() == 1);
}

void TestReadOnlyRefusesWritesBeforeArgumentChecks() {
  const auto dir  = std::filesystem::temp_directory_path() / "project_memory_protocol_tests";
  const auto path = (dir / "read_only.db").string();
  {
    auto ctx = Open("read_only");
    ctx->store->SetContext("kept", "value");
    ctx->Shutdown();
  }

  auto ctx = Open("read_only_reopen", [&](MemoryOptions& o) {
    o.db_path               = path;
    o.read_only             = true;
    o.operations_per_window = 1;
  });
  auto& handler = *ctx->handler;

  const auto empty_import = handler.HandleNamed("import_memory", "{}");
  assert(empty_import.error().kind() == ERROR_KIND_PERMISSION_DENIED);

  const auto bad_args = handler.HandleNamed("store_pattern", R"({"bogus":1})");
  assert(bad_args.error().kind() == ERROR_KIND_PERMISSION_DENIED);

  const auto missing = handler.HandleNamed("remember_decision", "");
  assert(missing.error().kind() == ERROR_KIND_PERMISSION_DENIED);

  const auto no_token = handler.HandleNamed("purge_memory", "");
  assert(no_token.error().kind() == ERROR_KIND_PERMISSION_DENIED);

  // refused writes never spend quota; the one allowed read still runs
  assert(ctx->limiter->Snapshot().current_usage == 0);
  const auto context = handler.HandleNamed("get_context", "");
  assert(context.result_case() == OperationResponse::kGetContext);
  assert(context.get_context().context().at("kept") == "value");

  const auto set_after_quota = handler.HandleNamed("set_context", R"({"key":"a","value":"1"})");
  assert(set_after_quota.error().kind() == ERROR_KIND_PERMISSION_DENIED);
}

void TestOperationNameTable() {
  using projmem::service::OperationFromName;
  using projmem::service::OperationName;

  const auto names = projmem::service::OperationNames();
  assert(names.size() == 11);
  for (auto name : names) {
    const auto op = OperationFromName(name);
    assert(op.has_value());
    assert(OperationName(*op) == name);
  }
  assert(!OperationFromName("RememberDecision").has_value());
  assert(OperationName(OperationRequest::OPERATION_NOT_SET) == "unknown");

  assert(projmem::service::IsRateLimitExempt(OperationRequest::kHealthCheck));
  assert(!projmem::service::IsRateLimitExempt(OperationRequest::kRecallDecisions));
  assert(projmem::service::IsWriteOperation(OperationRequest::kImportMemory));
  assert(!projmem::service::IsWriteOperation(OperationRequest::kExportMemory));

  assert(projmem::service::IsClientError(ERROR_KIND_VALIDATION));
  assert(!projmem::service::IsClientError(ERROR_KIND_STORAGE_INTEGRITY));
  assert(projmem::service::ErrorKindName(ERROR_KIND_POOL_EXHAUSTED) == "pool_exhausted");
}

} // namespace

int main() {
  TestNamedOperationsRoundTrip();
  TestExportImportThroughHandler();
  TestRateLimitAppliesToNonExemptOps();
  TestUnknownOperationsAndArguments();
  TestPurgeAndCapacityErrors();
  TestReadOnlyRefusesWritesBeforeArgumentChecks();
  TestOperationNameTable();

  std::cout << "project_memory_unit_protocol_handler: pass\n";
  return 0;
}
