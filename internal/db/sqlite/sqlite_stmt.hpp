#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

#include "internal/db/api/result.hpp"

namespace projmem::db::sqlite {

/*
  Prepared statement owned for one call.

  Step() returns true on SQLITE_ROW, false on SQLITE_DONE and throws
  DbError for everything else. Run() is for statements whose error is
  reported as a Result instead.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  Statement& BindText(int idx, const std::string& s);
  Statement& BindI64(int idx, int64_t v);

  bool Step();

  // Steps to completion; translates the outcome.
  Result Run();

  std::string ColText(int col) const;
  int64_t     ColI64(int col) const;
  uint64_t    ColU64(int col) const;

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

} // namespace projmem::db::sqlite
