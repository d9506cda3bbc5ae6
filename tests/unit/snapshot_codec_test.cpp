#include "internal/core/snapshot_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "internal/config/memory_options.hpp"
#include "internal/factory.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"

namespace {

using projmem::config::MemoryOptions;
using projmem::core::SnapshotCodec;

std::shared_ptr<projmem::service::ServiceContext> Open(const std::string& name, const std::function<void(MemoryOptions&)>& tweak = {}) {
  const auto dir = std::filesystem::temp_directory_path() / "project_memory_snapshot_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  std::filesystem::remove(path);

  MemoryOptions opts;
  opts.db_path      = path.string();
  opts.project_name = "snapshot_test";
  opts.pool_size    = 2;
  if (tweak) tweak(opts);
  return projmem::factory::Build(opts);
}

std::string ToJson(const projmem::v1::MemorySnapshot& snapshot) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(snapshot, &json);
  assert(status.ok());
  return json;
}

projmem::v1::MemorySnapshot SnapshotWith(int decisions, int patterns, int context) {
  projmem::v1::MemorySnapshot snapshot;
  snapshot.set_version("1.0.0");
  auto* data = snapshot.mutable_data();
  for (int i = 0; i < decisions; ++i) {
    auto* d = data->add_decisions();
    d->set_timestamp("2026-01-0" + std::to_string(i % 9 + 1) + "T00:00:00.000Z");
    d->set_decision("decision " + std::to_string(i));
    d->set_rationale("because " + std::to_string(i));
  }
  for (int i = 0; i < patterns; ++i) {
    auto* p = data->add_patterns();
    p->set_name("pattern_" + std::to_string(i));
    p->set_description("description " + std::to_string(i));
  }
  for (int i = 0; i < context; ++i) {
    (*data->mutable_context())["key_" + std::to_string(i)] = "value " + std::to_string(i);
  }
  return snapshot;
}

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

void TestExportImportRoundTrip() {
  auto ctx = Open("round_trip");

  ctx->store->RememberDecision("Use SQLite", "embedded", "storage", "postgres");
  ctx->store->RememberDecision("Use protobuf JSON", "one codec", "", "");
  ctx->store->StorePattern("repository", "wrap storage", "SqliteRepository", "always");
  ctx->store->SetContext("tech_stack", "C++20");
  ctx->store->SetContext("owner", "platform team");

  const auto before   = ctx->store->Stats();
  const auto recalled = ctx->store->RecallDecisions("", 0);
  const auto exported = ctx->codec->Export();

  assert(exported.snapshot().version() == "1.1.0");
  assert(exported.snapshot().project() == "snapshot_test");
  assert(exported.snapshot().data().decisions_size() == 2);
  // export lists oldest first
  assert(exported.snapshot().data().decisions(0).decision() == "Use SQLite");
  assert(exported.json().find("\"approximate_size_bytes\"") != std::string::npos);

  auto fresh = Open("round_trip_fresh");
  assert(fresh->store->Stats().decisions() == 0);

  const auto summary = fresh->codec->Import(exported.json());
  assert(summary.decisions_imported() == 2);
  assert(summary.patterns_imported() == 1);
  assert(summary.context_imported() == 2);
  assert(summary.decisions_evicted() == 0);

  const auto after = fresh->store->Stats();
  assert(after.decisions() == before.decisions());
  assert(after.patterns() == before.patterns());
  assert(after.context_keys() == before.context_keys());
  assert(after.approximate_size_bytes() == before.approximate_size_bytes());
  assert(after.limits().max_decisions() == before.limits().max_decisions());

  const auto restored = fresh->store->RecallDecisions("", 0);
  assert(restored.decisions_size() == 2);
  assert(restored.decisions(0).decision() == recalled.decisions(0).decision());
  assert(restored.decisions(0).timestamp() == recalled.decisions(0).timestamp());
  assert(restored.decisions(1).alternatives() == "postgres");
  assert(fresh->store->GetContext().context().at("owner") == "platform team");

  // the source store is untouched by the export
  assert(ctx->store->Stats().decisions() == 2);
}

void TestImportReplacesExistingData() {
  auto ctx = Open("replace");
  ctx->store->SetContext("stale", "old");
  ctx->store->RememberDecision("old decision", "old", "", "");

  ctx->codec->Import(ToJson(SnapshotWith(1, 1, 1)));

  const auto context = ctx->store->GetContext().context();
  assert(context.size() == 1);
  assert(context.count("stale") == 0);
  assert(ctx->store->RecallDecisions("old", 0).decisions_size() == 0);
}

void TestIncompatibleVersionRejected() {
  auto ctx = Open("version");
  ctx->store->SetContext("keep", "me");

  auto snapshot = SnapshotWith(1, 0, 0);
  snapshot.set_version("2.0.0");
  assert(Throws<projmem::util::SchemaVersionMismatch>([&] { ctx->codec->Import(ToJson(snapshot)); }));

  snapshot.set_version("");
  assert(Throws<projmem::util::SchemaVersionMismatch>([&] { ctx->codec->Import(ToJson(snapshot)); }));

  assert(ctx->store->GetContext().context().at("keep") == "me");

  assert(SnapshotCodec::IsCompatibleVersion("1.0.0"));
  assert(SnapshotCodec::IsCompatibleVersion("1.9"));
  assert(!SnapshotCodec::IsCompatibleVersion("10.0.0"));
  assert(!SnapshotCodec::IsCompatibleVersion("v1.0.0"));
}

void TestMalformedAndOversizedInput() {
  auto ctx = Open("malformed", [](MemoryOptions& o) { o.max_import_json_bytes = 4096; });

  assert(Throws<projmem::util::ValidationError>([&] { ctx->codec->Import("{not json"); }));
  assert(Throws<projmem::util::ValidationError>([&] { ctx->codec->Import(std::string(5000, ' ')); }));

  // unknown fields from newer exports are tolerated
  const auto summary = ctx->codec->Import(R"({"version":"1.2.0","future_field":true,"data":{"context":{"k":"v"}}})");
  assert(summary.context_imported() == 1);
}

void TestInvalidRecordsAbortImport() {
  auto ctx = Open("invalid_records");
  ctx->store->SetContext("keep", "me");

  auto snapshot = SnapshotWith(1, 1, 0);
  snapshot.mutable_data()->mutable_patterns(0)->set_name("has space");
  assert(Throws<projmem::util::ValidationError>([&] { ctx->codec->Import(ToJson(snapshot)); }));

  auto empty_rationale = SnapshotWith(1, 0, 0);
  empty_rationale.mutable_data()->mutable_decisions(0)->set_rationale("");
  assert(Throws<projmem::util::ValidationError>([&] { ctx->codec->Import(ToJson(empty_rationale)); }));

  assert(ctx->store->GetContext().context().at("keep") == "me");
}

void TestImportItemGuards() {
  auto ctx = Open("item_guards", [](MemoryOptions& o) { o.max_import_decisions = 2; });

  assert(Throws<projmem::util::ValidationError>([&] { ctx->codec->Import(ToJson(SnapshotWith(3, 0, 0))); }));
  assert(ctx->codec->Import(ToJson(SnapshotWith(2, 0, 0))).decisions_imported() == 2);
}

void TestImportAppliesCapacityRules() {
  auto ctx = Open("capacity", [](MemoryOptions& o) {
    o.max_decisions = 3;
    o.max_patterns  = 2;
  });
  ctx->store->SetContext("keep", "me");

  // surplus decisions evict the oldest imported ones
  const auto summary = ctx->codec->Import(ToJson(SnapshotWith(5, 0, 0)));
  assert(summary.decisions_imported() == 5);
  assert(summary.decisions_evicted() == 2);

  const auto recalled = ctx->store->RecallDecisions("", 0);
  assert(recalled.decisions_size() == 3);
  assert(recalled.decisions(0).decision() == "decision 4");
  assert(recalled.decisions(2).decision() == "decision 2");

  // surplus patterns abort the whole import
  assert(Throws<projmem::util::CapacityExceeded>([&] { ctx->codec->Import(ToJson(SnapshotWith(1, 3, 0))); }));
  assert(ctx->store->Stats().decisions() == 3);
  assert(ctx->store->GetPatterns().patterns_size() == 0);
}

void TestImportRejectedInReadOnlyMode() {
  const auto dir  = std::filesystem::temp_directory_path() / "project_memory_snapshot_tests";
  const auto path = (dir / "read_only.db").string();
  {
    auto ctx = Open("read_only");
    ctx->Shutdown();
  }

  MemoryOptions opts;
  opts.db_path   = path;
  opts.read_only = true;
  auto ctx       = projmem::factory::Build(opts);

  assert(ctx->codec->Export().snapshot().data().decisions_size() == 0);
  assert(Throws<projmem::util::PermissionDenied>([&] { ctx->codec->Import(ToJson(SnapshotWith(1, 0, 0))); }));
}

} // namespace

int main() {
  TestExportImportRoundTrip();
  TestImportReplacesExistingData();
  TestIncompatibleVersionRejected();
  TestMalformedAndOversizedInput();
  TestInvalidRecordsAbortImport();
  TestImportItemGuards();
  TestImportAppliesCapacityRules();
  TestImportRejectedInReadOnlyMode();

  std::cout << "project_memory_unit_snapshot_codec: pass\n";
  return 0;
}
