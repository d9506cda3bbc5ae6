#include "sqlite_schema.hpp"

#include "internal/db/sql/migrations.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "sqlite_stmt.hpp"
#include "sqlite_tx.hpp"

namespace projmem::db::sqlite {

namespace {

class SqliteMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(SqliteDB& db) : db_(db) {
  }

  void ExecuteSQL(const std::string& sql) override {
    db_.Exec(sql);
  }

  int CurrentVersion() override {
    Statement st(db_.Handle(), "SELECT COALESCE(MAX(version), 0) FROM schema_migrations;");
    return st.Step() ? static_cast<int>(st.ColI64(0)) : 0;
  }

  void RecordVersion(int version) override {
    Statement st(db_.Handle(), "INSERT INTO schema_migrations(version, applied_at_ms) VALUES(?, ?);");
    st.BindI64(1, version).BindI64(2, static_cast<int64_t>(util::ToUnixMillis(util::Now())));
    auto r = st.Run();
    if (!r) throw DbError(std::move(r));
  }

 private:
  SqliteDB& db_;
};

} // namespace

int BootstrapSchema(SqliteDB& db) {
  // non-owning: the transaction must not close the caller's connection
  std::shared_ptr<SqliteDB> conn(&db, [](SqliteDB*) {});
  SqliteTransaction         tx(conn, TxMode::kWrite);

  db.Exec("CREATE TABLE IF NOT EXISTS schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);");

  SqliteMigrationExecutor executor(db);
  const int               applied = sql::RunMigrations(executor, sql::SchemaMigrations());
  const int               version = executor.CurrentVersion();
  tx.Commit();

  if (applied > 0) {
    PROJMEM_LOG_INFO("Schema migrated", {observability::StringField("path", db.Path()), observability::IntField("applied", applied), observability::IntField("version", version)});
  }
  return version;
}

} // namespace projmem::db::sqlite
