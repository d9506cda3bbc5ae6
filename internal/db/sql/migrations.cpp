#include "migrations.hpp"

namespace projmem::db::sql {

const std::vector<Migration>& SchemaMigrations() {
  static const std::vector<Migration> kMigrations = {
      {1,
       "CREATE TABLE IF NOT EXISTS decisions ("
       "id INTEGER PRIMARY KEY AUTOINCREMENT, "
       "timestamp TEXT NOT NULL, "
       "decision TEXT NOT NULL, "
       "rationale TEXT NOT NULL, "
       "context TEXT NOT NULL DEFAULT '', "
       "alternatives TEXT NOT NULL DEFAULT '');"
       "CREATE TABLE IF NOT EXISTS patterns ("
       "id INTEGER PRIMARY KEY AUTOINCREMENT, "
       "name TEXT NOT NULL UNIQUE, "
       "description TEXT NOT NULL, "
       "example TEXT NOT NULL DEFAULT '', "
       "when_to_use TEXT NOT NULL DEFAULT '', "
       "updated_at_ms INTEGER NOT NULL);"
       "CREATE TABLE IF NOT EXISTS context ("
       "key TEXT PRIMARY KEY, "
       "value TEXT NOT NULL, "
       "updated_at_ms INTEGER NOT NULL);"
       "CREATE INDEX IF NOT EXISTS idx_decisions_timestamp ON decisions(timestamp);"},

      {2,
       "CREATE TABLE IF NOT EXISTS rate_limit_ops ("
       "id INTEGER PRIMARY KEY AUTOINCREMENT, "
       "ts_ms INTEGER NOT NULL);"
       "CREATE INDEX IF NOT EXISTS idx_rate_limit_ops_ts ON rate_limit_ops(ts_ms);"},
  };
  return kMigrations;
}

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered) {
  const int current = executor.CurrentVersion();

  int applied = 0;
  for (const auto& m : ordered) {
    if (m.version <= current) continue;
    executor.ExecuteSQL(m.sql);
    executor.RecordVersion(m.version);
    ++applied;
  }
  return applied;
}

} // namespace projmem::db::sql
