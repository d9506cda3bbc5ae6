#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "internal/db/api/result.hpp"

namespace projmem::db::sqlite {

enum class OpenMode {
  kReadWrite, // creates the file when missing
  kReadOnly,
};

/*
  Thin RAII wrapper around sqlite3*.

  One SqliteDB is one connection; it is never shared by two threads at
  the same time (the pool hands it to a single transaction).
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, OpenMode mode = OpenMode::kReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  OpenMode Mode() const {
    return mode_;
  }

  // Execute a SQL string (pragmas, migrations, BEGIN/COMMIT). Throws DbError.
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize). Throws DbError.
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, foreign keys, busy timeout).
  void Configure();

  // "ok" or the first line reported by PRAGMA integrity_check.
  std::string IntegrityCheck();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
};

// Maps an sqlite result code onto the portable db::ErrorCode.
ErrorCode TranslateCode(int rc);

// Builds a Result from rc using the connection's last error message.
Result Translate(sqlite3* db, int rc);

} // namespace projmem::db::sqlite
