#include "snapshot_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <stdexcept>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/version.hpp"
#include "validation.hpp"

namespace projmem::core {

using namespace projmem::v1;

namespace {

constexpr std::size_t kMaxTimestampLength = 64;

struct ImportBatch {
  std::vector<db::model::DecisionRecord> decisions;
  std::vector<db::model::PatternRecord>  patterns;
  std::vector<db::model::ContextRecord>  context;
};

void RequireAtMost(std::size_t count, uint64_t max, const char* what) {
  if (count > max) {
    throw util::ValidationError(std::string("import data has too many ") + what + " (" + std::to_string(count) + " > " + std::to_string(max) + ")");
  }
}

ImportBatch ValidateSnapshot(const MemorySnapshot& snapshot, std::size_t max_text_length) {
  ImportBatch batch;
  const auto  now_ms  = util::ToUnixMillis(util::Now());
  const auto& data    = snapshot.data();

  batch.decisions.reserve(data.decisions_size());
  for (const auto& d : data.decisions()) {
    db::model::DecisionRecord r;
    r.timestamp    = SanitizeText(d.timestamp(), kMaxTimestampLength);
    r.decision     = RequireText("decision", d.decision(), max_text_length);
    r.rationale    = RequireText("rationale", d.rationale(), max_text_length);
    r.context      = SanitizeText(d.context(), max_text_length);
    r.alternatives = SanitizeText(d.alternatives(), max_text_length);
    if (r.timestamp.empty()) r.timestamp = util::ToIso8601(util::FromUnixMillis(now_ms));
    batch.decisions.push_back(std::move(r));
  }

  batch.patterns.reserve(data.patterns_size());
  for (const auto& p : data.patterns()) {
    db::model::PatternRecord r;
    r.name          = RequireKey("pattern name", p.name());
    r.description   = RequireText("description", p.description(), max_text_length);
    r.example       = SanitizeText(p.example(), max_text_length);
    r.when_to_use   = SanitizeText(p.when_to_use(), max_text_length);
    r.updated_at_ms = now_ms;
    batch.patterns.push_back(std::move(r));
  }

  batch.context.reserve(data.context_size());
  for (const auto& [key, value] : data.context()) {
    db::model::ContextRecord r;
    r.key           = RequireKey("context key", key);
    r.value         = RequireText("value", value, max_text_length);
    r.updated_at_ms = now_ms;
    batch.context.push_back(std::move(r));
  }
  // protobuf maps are unordered
  std::sort(batch.context.begin(), batch.context.end(), [](const auto& a, const auto& b) {
    return a.key < b.key;
  });

  return batch;
}

} // namespace

SnapshotCodec::SnapshotCodec(std::shared_ptr<MemoryStore> store, SnapshotOptions options) : store_(std::move(store)), options_(std::move(options)) {
}

bool SnapshotCodec::IsCompatibleVersion(const std::string& version) {
  const auto dot   = version.find('.');
  const auto major = version.substr(0, dot);
  if (major.empty() || !std::all_of(major.begin(), major.end(), [](char c) { return c >= '0' && c <= '9'; })) {
    return false;
  }
  return major == std::to_string(util::kServiceMajorVersion);
}

ExportMemoryResult SnapshotCodec::Export() {
  MemorySnapshot snapshot;
  snapshot.set_version(util::kServiceVersion);
  snapshot.set_exported_at(util::ToIso8601(util::Now()));
  snapshot.set_project(options_.project);

  const auto counts = store_->RunInTransaction(db::TxMode::kRead, [&](db::Repository& repo, db::Transaction& tx) {
    auto* data = snapshot.mutable_data();
    for (const auto& r : repo.ListDecisionsAscending(tx)) {
      auto* d = data->add_decisions();
      d->set_id(r.id);
      d->set_timestamp(r.timestamp);
      d->set_decision(r.decision);
      d->set_rationale(r.rationale);
      d->set_context(r.context);
      d->set_alternatives(r.alternatives);
    }
    for (const auto& r : repo.ListPatterns(tx)) {
      auto* p = data->add_patterns();
      p->set_name(r.name);
      p->set_description(r.description);
      p->set_example(r.example);
      p->set_when_to_use(r.when_to_use);
      p->set_updated_at(util::ToIso8601(util::FromUnixMillis(r.updated_at_ms)));
    }
    auto* context = data->mutable_context();
    for (const auto& r : repo.ListContext(tx)) {
      (*context)[r.key] = r.value;
    }
    return repo.Counts(tx);
  });

  auto* stats = snapshot.mutable_stats();
  stats->set_decisions(counts.decisions);
  stats->set_patterns(counts.patterns);
  stats->set_context_keys(counts.context_keys);
  stats->set_approximate_size_bytes(counts.text_bytes);
  *stats->mutable_limits() = store_->Capacity().ToProto();

  google::protobuf::util::JsonPrintOptions print;
  print.add_whitespace                = true;
  print.preserve_proto_field_names    = true;
  print.always_print_primitive_fields = true;

  ExportMemoryResult out;
  auto               status = google::protobuf::util::MessageToJsonString(snapshot, out.mutable_json(), print);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize snapshot: " + std::string(status.message()));
  }
  *out.mutable_snapshot() = std::move(snapshot);

  PROJMEM_LOG_INFO("Memory exported", {observability::IntField("decisions", static_cast<int64_t>(counts.decisions)),
                                       observability::IntField("patterns", static_cast<int64_t>(counts.patterns)),
                                       observability::IntField("context", static_cast<int64_t>(counts.context_keys)),
                                       observability::IntField("bytes", static_cast<int64_t>(out.json().size()))});
  return out;
}

ImportSummary SnapshotCodec::Import(const std::string& json) {
  store_->RequireHealthy();
  store_->RequireWritable();

  if (json.size() > options_.max_json_bytes) {
    throw util::ValidationError("import data too large (" + std::to_string(json.size()) + " > " + std::to_string(options_.max_json_bytes) + " bytes)");
  }

  MemorySnapshot                          snapshot;
  google::protobuf::util::JsonParseOptions parse;
  parse.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &snapshot, parse);
  if (!status.ok()) {
    throw util::ValidationError("malformed import data: " + std::string(status.message()));
  }

  if (!IsCompatibleVersion(snapshot.version())) {
    throw util::SchemaVersionMismatch("incompatible import version '" + snapshot.version() + "'; this service reads " +
                                      std::to_string(util::kServiceMajorVersion) + ".x exports");
  }

  RequireAtMost(static_cast<std::size_t>(snapshot.data().decisions_size()), options_.max_decisions, "decisions");
  RequireAtMost(static_cast<std::size_t>(snapshot.data().patterns_size()), options_.max_patterns, "patterns");
  RequireAtMost(static_cast<std::size_t>(snapshot.data().context_size()), options_.max_context_keys, "context keys");

  auto batch = ValidateSnapshot(snapshot, store_->Options().max_text_length);

  const auto& capacity = store_->Capacity();
  auto summary = store_->RunInTransaction(db::TxMode::kWrite, [&](db::Repository& repo, db::Transaction& tx) {
    ImportSummary out;
    ThrowIfDbError(repo.DeleteAll(tx), "clear before import");

    for (auto& r : batch.decisions) {
      out.set_decisions_evicted(out.decisions_evicted() + capacity.MakeRoomForDecision(repo, tx));
      ThrowIfDbError(repo.InsertDecision(tx, r), "import decision");
      out.set_decisions_imported(out.decisions_imported() + 1);
    }
    for (const auto& r : batch.patterns) {
      capacity.AdmitPattern(repo, tx, r.name);
      ThrowIfDbError(repo.UpsertPattern(tx, r), "import pattern");
      out.set_patterns_imported(out.patterns_imported() + 1);
    }
    for (const auto& r : batch.context) {
      capacity.AdmitContext(repo, tx, r.key);
      ThrowIfDbError(repo.UpsertContext(tx, r), "import context");
      out.set_context_imported(out.context_imported() + 1);
    }
    return out;
  });

  PROJMEM_LOG_INFO("Memory imported", {observability::StringField("from_version", snapshot.version()),
                                       observability::IntField("decisions", static_cast<int64_t>(summary.decisions_imported())),
                                       observability::IntField("patterns", static_cast<int64_t>(summary.patterns_imported())),
                                       observability::IntField("context", static_cast<int64_t>(summary.context_imported())),
                                       observability::IntField("evicted", static_cast<int64_t>(summary.decisions_evicted()))});
  return summary;
}

} // namespace projmem::core
