#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace projmem::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> conn, TxMode mode) : conn_(std::move(conn)), mode_(mode) {
  conn_->Exec(mode_ == TxMode::kWrite ? "BEGIN IMMEDIATE;" : "BEGIN DEFERRED;");
}

SqliteTransaction::~SqliteTransaction() {
  // sqlite may already have rolled back on its own (e.g. SQLITE_FULL)
  if (finished_ || sqlite3_get_autocommit(conn_->Handle())) return;

  try {
    conn_->Exec("ROLLBACK;");
  } catch (const DbError& e) {
    PROJMEM_LOG_WARN("Rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  conn_->Exec("COMMIT;");
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  finished_ = true;
  if (!sqlite3_get_autocommit(conn_->Handle())) {
    conn_->Exec("ROLLBACK;");
  }
}

} // namespace projmem::db::sqlite
