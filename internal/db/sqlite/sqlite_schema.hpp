#pragma once

#include "sqlite_db.hpp"

namespace projmem::db::sqlite {

/*
  Creates schema_migrations and applies pending migrations inside one
  BEGIN IMMEDIATE transaction. Safe to call on every start.
  Returns the schema version after bootstrap.
*/
int BootstrapSchema(SqliteDB& db);

} // namespace projmem::db::sqlite
