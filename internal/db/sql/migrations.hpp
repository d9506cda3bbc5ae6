#pragma once

#include <string>
#include <vector>

namespace projmem::db::sql {

struct Migration {
  int         version;
  std::string sql;
};

/*
  Backend-agnostic migration execution.

  Each backend implements the three primitives; RunMigrations() does the
  ordering and bookkeeping.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;

  // Highest applied version, 0 for a fresh database.
  virtual int CurrentVersion() = 0;

  virtual void RecordVersion(int version) = 0;
};

// Ordered schema history of the memory store.
const std::vector<Migration>& SchemaMigrations();

/*
  Applies every migration newer than CurrentVersion(), in order.
  Returns the number applied. Callers wrap this in one transaction.
*/

int RunMigrations(MigrationExecutor& executor, const std::vector<Migration>& ordered);

} // namespace projmem::db::sql
