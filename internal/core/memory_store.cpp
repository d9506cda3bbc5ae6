#include "memory_store.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "validation.hpp"

namespace projmem::core {

using namespace projmem::v1;

namespace {

Decision ToDecision(const db::model::DecisionRecord& r) {
  Decision d;
  d.set_id(r.id);
  d.set_timestamp(r.timestamp);
  d.set_decision(r.decision);
  d.set_rationale(r.rationale);
  d.set_context(r.context);
  d.set_alternatives(r.alternatives);
  return d;
}

Pattern ToPattern(const db::model::PatternRecord& r) {
  Pattern p;
  p.set_name(r.name);
  p.set_description(r.description);
  p.set_example(r.example);
  p.set_when_to_use(r.when_to_use);
  p.set_updated_at(util::ToIso8601(util::FromUnixMillis(r.updated_at_ms)));
  return p;
}

} // namespace

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  auto failed    = result;
  failed.message = result.message.empty() ? context : context + ": " + result.message;
  throw db::DbError(std::move(failed));
}

MemoryStore::MemoryStore(std::shared_ptr<db::Repository> repository, StoreOptions options)
    : repository_(std::move(repository)), options_(options), capacity_(options.limits) {
}

void MemoryStore::RequireHealthy() const {
  if (failed_.load()) {
    throw util::StorageIntegrity("memory store failed an integrity check; restore from an export or reinitialize");
  }
}

void MemoryStore::RequireWritable() const {
  if (options_.read_only) {
    throw util::PermissionDenied("memory store is in read-only mode");
  }
}

void MemoryStore::MarkFailed(const std::string& reason) {
  if (!failed_.exchange(true)) {
    PROJMEM_LOG_ERROR("Storage integrity failure; store disabled", {observability::StringField("error", reason)});
  }
}

void MemoryStore::RaiseStorageError(const db::DbError& error) {
  switch (error.code()) {
    case db::ErrorCode::Corruption:
    case db::ErrorCode::NotADatabase:
      MarkFailed(error.what());
      throw util::StorageIntegrity(error.what());
    case db::ErrorCode::ReadOnly:
      throw util::PermissionDenied(error.what());
    default:
      throw std::runtime_error(std::string("storage error: ") + error.what());
  }
}

// ------------------------------------------------------------------
// Decisions
// ------------------------------------------------------------------

RememberDecisionResult MemoryStore::RememberDecision(const std::string& decision, const std::string& rationale, const std::string& context,
                                                     const std::string& alternatives) {
  RequireHealthy();
  RequireWritable();

  db::model::DecisionRecord record;
  record.timestamp    = util::ToIso8601(util::Now());
  record.decision     = RequireText("decision", decision, options_.max_text_length);
  record.rationale    = RequireText("rationale", rationale, options_.max_text_length);
  record.context      = SanitizeText(context, options_.max_text_length);
  record.alternatives = SanitizeText(alternatives, options_.max_text_length);

  auto result = RunInTransaction(db::TxMode::kWrite, [&](db::Repository& repo, db::Transaction& tx) {
    RememberDecisionResult out;
    out.set_evicted(capacity_.MakeRoomForDecision(repo, tx));
    ThrowIfDbError(repo.InsertDecision(tx, record), "insert decision");
    out.set_id(record.id);
    return out;
  });

  if (result.evicted() > 0) {
    PROJMEM_LOG_INFO("Evicted oldest decisions", {observability::IntField("evicted", static_cast<int64_t>(result.evicted())),
                                                  observability::IntField("max_decisions", static_cast<int64_t>(options_.limits.max_decisions))});
  }
  return result;
}

RecallDecisionsResult MemoryStore::RecallDecisions(const std::string& keyword, uint64_t limit) {
  RequireHealthy();

  const auto pattern = EscapeLike(SanitizeKeyword(keyword));

  return RunInTransaction(db::TxMode::kRead, [&](db::Repository& repo, db::Transaction& tx) {
    RecallDecisionsResult out;
    for (const auto& r : repo.ListDecisions(tx, pattern, limit)) {
      *out.add_decisions() = ToDecision(r);
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Patterns
// ------------------------------------------------------------------

StorePatternResult MemoryStore::StorePattern(const std::string& name, const std::string& description, const std::string& example,
                                             const std::string& when_to_use) {
  RequireHealthy();
  RequireWritable();

  db::model::PatternRecord record;
  record.name          = RequireKey("pattern name", name);
  record.description   = RequireText("description", description, options_.max_text_length);
  record.example       = SanitizeText(example, options_.max_text_length);
  record.when_to_use   = SanitizeText(when_to_use, options_.max_text_length);
  record.updated_at_ms = util::ToUnixMillis(util::Now());

  return RunInTransaction(db::TxMode::kWrite, [&](db::Repository& repo, db::Transaction& tx) {
    StorePatternResult out;
    out.set_replaced(capacity_.AdmitPattern(repo, tx, record.name));
    ThrowIfDbError(repo.UpsertPattern(tx, record), "store pattern");
    out.set_name(record.name);
    return out;
  });
}

GetPatternsResult MemoryStore::GetPatterns() {
  return RunInTransaction(db::TxMode::kRead, [](db::Repository& repo, db::Transaction& tx) {
    GetPatternsResult out;
    for (const auto& r : repo.ListPatterns(tx)) {
      *out.add_patterns() = ToPattern(r);
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Context
// ------------------------------------------------------------------

SetContextResult MemoryStore::SetContext(const std::string& key, const std::string& value) {
  RequireHealthy();
  RequireWritable();

  db::model::ContextRecord record;
  record.key           = RequireKey("context key", key);
  record.value         = RequireText("value", value, options_.max_text_length);
  record.updated_at_ms = util::ToUnixMillis(util::Now());

  return RunInTransaction(db::TxMode::kWrite, [&](db::Repository& repo, db::Transaction& tx) {
    SetContextResult out;
    out.set_replaced(capacity_.AdmitContext(repo, tx, record.key));
    ThrowIfDbError(repo.UpsertContext(tx, record), "set context");
    out.set_key(record.key);
    return out;
  });
}

GetContextResult MemoryStore::GetContext() {
  return RunInTransaction(db::TxMode::kRead, [](db::Repository& repo, db::Transaction& tx) {
    GetContextResult out;
    auto*            context = out.mutable_context();
    for (const auto& r : repo.ListContext(tx)) {
      (*context)[r.key] = r.value;
    }
    return out;
  });
}

// ------------------------------------------------------------------
// Whole store
// ------------------------------------------------------------------

MemoryStats MemoryStore::Stats() {
  const auto counts = RunInTransaction(db::TxMode::kRead, [](db::Repository& repo, db::Transaction& tx) {
    return repo.Counts(tx);
  });

  MemoryStats stats;
  stats.set_decisions(counts.decisions);
  stats.set_patterns(counts.patterns);
  stats.set_context_keys(counts.context_keys);
  stats.set_approximate_size_bytes(counts.text_bytes);
  *stats.mutable_limits() = capacity_.ToProto();
  return stats;
}

PurgeSummary MemoryStore::Purge(const std::string& confirm) {
  RequireHealthy();
  RequireWritable();
  RequirePurgeConfirmation(confirm);

  auto summary = RunInTransaction(db::TxMode::kWrite, [](db::Repository& repo, db::Transaction& tx) {
    const auto   before = repo.Counts(tx);
    PurgeSummary out;
    out.set_decisions_deleted(before.decisions);
    out.set_patterns_deleted(before.patterns);
    out.set_context_deleted(before.context_keys);
    ThrowIfDbError(repo.DeleteAll(tx), "purge");
    return out;
  });

  PROJMEM_LOG_WARN("Memory purged", {observability::IntField("decisions", static_cast<int64_t>(summary.decisions_deleted())),
                                     observability::IntField("patterns", static_cast<int64_t>(summary.patterns_deleted())),
                                     observability::IntField("context", static_cast<int64_t>(summary.context_deleted()))});
  return summary;
}

} // namespace projmem::core
