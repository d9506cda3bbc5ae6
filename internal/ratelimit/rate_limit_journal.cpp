#include "rate_limit_journal.hpp"

#include "internal/db/sqlite/sqlite_stmt.hpp"

namespace projmem::ratelimit {

using db::sqlite::Statement;

RateLimitJournal::RateLimitJournal(const std::string& path) : db_(std::make_unique<db::sqlite::SqliteDB>(path)) {
  db_->Exec("CREATE TABLE IF NOT EXISTS rate_limit_ops (id INTEGER PRIMARY KEY AUTOINCREMENT, ts_ms INTEGER NOT NULL);");
}

std::vector<util::TimePoint> RateLimitJournal::Load(util::TimePoint since) {
  Statement st(db_->Handle(), "SELECT ts_ms FROM rate_limit_ops WHERE ts_ms >= ? ORDER BY ts_ms ASC, id ASC;");
  st.BindI64(1, static_cast<int64_t>(util::ToUnixMillis(since)));

  std::vector<util::TimePoint> out;
  while (st.Step()) out.push_back(util::FromUnixMillis(st.ColU64(0)));
  return out;
}

void RateLimitJournal::Append(const std::vector<util::TimePoint>& timestamps) {
  if (timestamps.empty()) return;

  db_->Exec("BEGIN IMMEDIATE;");
  try {
    for (auto ts : timestamps) {
      Statement st(db_->Handle(), "INSERT INTO rate_limit_ops(ts_ms) VALUES(?);");
      st.BindI64(1, static_cast<int64_t>(util::ToUnixMillis(ts)));
      auto r = st.Run();
      if (!r) throw db::DbError(std::move(r));
    }
    db_->Exec("COMMIT;");
  } catch (const db::DbError&) {
    if (!sqlite3_get_autocommit(db_->Handle())) db_->Exec("ROLLBACK;");
    throw;
  }
}

uint64_t RateLimitJournal::Prune(util::TimePoint cutoff) {
  Statement st(db_->Handle(), "DELETE FROM rate_limit_ops WHERE ts_ms < ?;");
  st.BindI64(1, static_cast<int64_t>(util::ToUnixMillis(cutoff)));
  auto r = st.Run();
  if (!r) throw db::DbError(std::move(r));
  return static_cast<uint64_t>(sqlite3_changes(db_->Handle()));
}

void RateLimitJournal::Clear() {
  db_->Exec("DELETE FROM rate_limit_ops;");
}

} // namespace projmem::ratelimit
