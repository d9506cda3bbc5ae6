#include "sqlite_repository.hpp"

#include "sqlite_stmt.hpp"

namespace projmem::db::sqlite {

using projmem::db::ErrorCode;
using projmem::db::Result;

namespace {

constexpr const char* kDecisionColumns = "id,timestamp,decision,rationale,context,alternatives";

model::DecisionRecord ReadDecision(const Statement& st) {
  model::DecisionRecord r;
  r.id           = st.ColI64(0);
  r.timestamp    = st.ColText(1);
  r.decision     = st.ColText(2);
  r.rationale    = st.ColText(3);
  r.context      = st.ColText(4);
  r.alternatives = st.ColText(5);
  return r;
}

uint64_t CountRows(sqlite3* db, const char* sql) {
  Statement st(db, sql);
  return st.Step() ? st.ColU64(0) : 0;
}

bool RowExists(sqlite3* db, const char* sql, const std::string& key) {
  Statement st(db, sql);
  st.BindText(1, key);
  return st.Step();
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqlitePool> pool, std::chrono::milliseconds acquire_timeout)
    : pool_(std::move(pool)), acquire_timeout_(acquire_timeout) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode) {
    return Begin(mode, acquire_timeout_);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(TxMode mode, std::chrono::milliseconds acquire_timeout) {
    return std::make_unique<SqliteTransaction>(pool_->Acquire(acquire_timeout), mode);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

// ------------------------------------------------------------------
// Decisions
// ------------------------------------------------------------------

Result SqliteRepository::InsertDecision(Transaction& t, model::DecisionRecord& r) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "INSERT INTO decisions(timestamp,decision,rationale,context,alternatives) "
        "VALUES(?,?,?,?,?);");
    st.BindText(1, r.timestamp)
      .BindText(2, r.decision)
      .BindText(3, r.rationale)
      .BindText(4, r.context)
      .BindText(5, r.alternatives);

    auto res = st.Run();
    if (res) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return res;
}

uint64_t SqliteRepository::CountDecisions(Transaction& t) {
    return CountRows(TX(t).Handle(), "SELECT COUNT(*) FROM decisions;");
}

uint64_t SqliteRepository::DeleteOldestDecisions(Transaction& t, uint64_t count) {
    auto* db = TX(t).Handle();

    Statement st(db,
        "DELETE FROM decisions WHERE id IN "
        "(SELECT id FROM decisions ORDER BY id ASC LIMIT ?);");
    st.BindI64(1, static_cast<int64_t>(count));

    auto res = st.Run();
    if (!res) throw DbError(std::move(res));
    return static_cast<uint64_t>(sqlite3_changes(db));
}

std::vector<model::DecisionRecord>
SqliteRepository::ListDecisions(Transaction& t, const std::string& keyword, uint64_t limit) {
    auto* db = TX(t).Handle();

    // keyword arrives LIKE-escaped; '\' is the escape char
    std::string sql = std::string("SELECT ") + kDecisionColumns + " FROM decisions";
    if (!keyword.empty()) {
        sql += " WHERE decision LIKE ?1 ESCAPE '\\' OR rationale LIKE ?1 ESCAPE '\\'";
    }
    // -1 = no limit in sqlite
    sql += " ORDER BY id DESC LIMIT ?2;";

    Statement st(db, sql.c_str());
    if (!keyword.empty()) st.BindText(1, "%" + keyword + "%");
    st.BindI64(2, limit == 0 ? -1 : static_cast<int64_t>(limit));

    std::vector<model::DecisionRecord> out;
    while (st.Step()) out.push_back(ReadDecision(st));
    return out;
}

std::vector<model::DecisionRecord> SqliteRepository::ListDecisionsAscending(Transaction& t) {
    const std::string sql = std::string("SELECT ") + kDecisionColumns + " FROM decisions ORDER BY id ASC;";
    Statement st(TX(t).Handle(), sql.c_str());

    std::vector<model::DecisionRecord> out;
    while (st.Step()) out.push_back(ReadDecision(st));
    return out;
}

// ------------------------------------------------------------------
// Patterns
// ------------------------------------------------------------------

Result SqliteRepository::UpsertPattern(Transaction& t, const model::PatternRecord& r) {
    Statement st(TX(t).Handle(),
        "INSERT INTO patterns(name,description,example,when_to_use,updated_at_ms) VALUES(?,?,?,?,?) "
        "ON CONFLICT(name) DO UPDATE SET "
        "description=excluded.description, example=excluded.example, "
        "when_to_use=excluded.when_to_use, updated_at_ms=excluded.updated_at_ms;");
    st.BindText(1, r.name)
      .BindText(2, r.description)
      .BindText(3, r.example)
      .BindText(4, r.when_to_use)
      .BindI64(5, static_cast<int64_t>(r.updated_at_ms));
    return st.Run();
}

bool SqliteRepository::PatternExists(Transaction& t, const std::string& name) {
    return RowExists(TX(t).Handle(), "SELECT 1 FROM patterns WHERE name=?;", name);
}

uint64_t SqliteRepository::CountPatterns(Transaction& t) {
    return CountRows(TX(t).Handle(), "SELECT COUNT(*) FROM patterns;");
}

std::vector<model::PatternRecord> SqliteRepository::ListPatterns(Transaction& t) {
    Statement st(TX(t).Handle(),
        "SELECT name,description,example,when_to_use,updated_at_ms FROM patterns ORDER BY name ASC;");

    std::vector<model::PatternRecord> out;
    while (st.Step()) {
        model::PatternRecord r;
        r.name          = st.ColText(0);
        r.description   = st.ColText(1);
        r.example       = st.ColText(2);
        r.when_to_use   = st.ColText(3);
        r.updated_at_ms = st.ColU64(4);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Context
// ------------------------------------------------------------------

Result SqliteRepository::UpsertContext(Transaction& t, const model::ContextRecord& r) {
    Statement st(TX(t).Handle(),
        "INSERT INTO context(key,value,updated_at_ms) VALUES(?,?,?) "
        "ON CONFLICT(key) DO UPDATE SET value=excluded.value, updated_at_ms=excluded.updated_at_ms;");
    st.BindText(1, r.key).BindText(2, r.value).BindI64(3, static_cast<int64_t>(r.updated_at_ms));
    return st.Run();
}

bool SqliteRepository::ContextExists(Transaction& t, const std::string& key) {
    return RowExists(TX(t).Handle(), "SELECT 1 FROM context WHERE key=?;", key);
}

uint64_t SqliteRepository::CountContext(Transaction& t) {
    return CountRows(TX(t).Handle(), "SELECT COUNT(*) FROM context;");
}

std::vector<model::ContextRecord> SqliteRepository::ListContext(Transaction& t) {
    Statement st(TX(t).Handle(), "SELECT key,value,updated_at_ms FROM context ORDER BY key ASC;");

    std::vector<model::ContextRecord> out;
    while (st.Step()) {
        model::ContextRecord r;
        r.key           = st.ColText(0);
        r.value         = st.ColText(1);
        r.updated_at_ms = st.ColU64(2);
        out.push_back(std::move(r));
    }
    return out;
}

// ------------------------------------------------------------------
// Whole store
// ------------------------------------------------------------------

model::TableCounts SqliteRepository::Counts(Transaction& t) {
    // byte lengths: CAST AS BLOB makes LENGTH() count bytes, not characters
    Statement st(TX(t).Handle(),
        "SELECT "
        "(SELECT COUNT(*) FROM decisions), "
        "(SELECT COUNT(*) FROM patterns), "
        "(SELECT COUNT(*) FROM context), "
        "(SELECT COALESCE(SUM(LENGTH(CAST(decision AS BLOB)) + LENGTH(CAST(rationale AS BLOB)) + "
        "LENGTH(CAST(context AS BLOB)) + LENGTH(CAST(alternatives AS BLOB))), 0) FROM decisions) + "
        "(SELECT COALESCE(SUM(LENGTH(CAST(name AS BLOB)) + LENGTH(CAST(description AS BLOB)) + "
        "LENGTH(CAST(example AS BLOB)) + LENGTH(CAST(when_to_use AS BLOB))), 0) FROM patterns) + "
        "(SELECT COALESCE(SUM(LENGTH(CAST(key AS BLOB)) + LENGTH(CAST(value AS BLOB))), 0) FROM context);");

    model::TableCounts c;
    if (st.Step()) {
        c.decisions    = st.ColU64(0);
        c.patterns     = st.ColU64(1);
        c.context_keys = st.ColU64(2);
        c.text_bytes   = st.ColU64(3);
    }
    return c;
}

Result SqliteRepository::DeleteAll(Transaction& t) {
    auto* db = TX(t).Handle();
    for (const char* sql : {"DELETE FROM decisions;", "DELETE FROM patterns;", "DELETE FROM context;"}) {
        Statement st(db, sql);
        auto res = st.Run();
        if (!res) return res;
    }
    return Result::Ok();
}

Result SqliteRepository::Ping(Transaction& t) {
    Statement st(TX(t).Handle(), "SELECT 1;");
    return st.Run();
}

std::string SqliteRepository::IntegrityCheck(Transaction& t) {
    return TX(t).Connection().IntegrityCheck();
}

}
