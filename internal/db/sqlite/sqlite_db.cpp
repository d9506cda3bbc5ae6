#include "sqlite_db.hpp"

namespace projmem::db::sqlite {

ErrorCode TranslateCode(int rc) {
  switch (rc & 0xff) {
    case SQLITE_OK:
    case SQLITE_DONE:
    case SQLITE_ROW:
      return ErrorCode::OK;
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return ErrorCode::Busy;
    case SQLITE_CONSTRAINT:
      return ErrorCode::ConstraintViolation;
    case SQLITE_READONLY:
      return ErrorCode::ReadOnly;
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
    case SQLITE_FULL:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
      return ErrorCode::Corruption;
    case SQLITE_NOTADB:
      return ErrorCode::NotADatabase;
    default:
      return ErrorCode::InternalError;
  }
}

Result Translate(sqlite3* db, int rc) {
  const ErrorCode code = TranslateCode(rc);
  if (code == ErrorCode::OK) return Result::Ok();
  return Result::Err(code, db ? sqlite3_errmsg(db) : sqlite3_errstr(rc));
}

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    auto r    = Translate(db, rc);
    r.message = std::string(what) + ": " + r.message;
    throw DbError(std::move(r));
  }
}

SqliteDB::SqliteDB(std::string path, OpenMode mode) : path_(std::move(path)), mode_(mode) {
  const int flags = mode_ == OpenMode::kReadOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;

  int rc = sqlite3_open_v2(path_.c_str(), &db_, flags | SQLITE_OPEN_NOMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    auto r = Translate(db_, rc);
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    r.message = "sqlite open " + path_ + ": " + r.message;
    throw DbError(std::move(r));
  }

  try {
    Configure();
  } catch (const DbError&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw DbError(Result::Err(TranslateCode(rc), msg));
  }
}

sqlite3_stmt* SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  ThrowIf(rc, db_, "sqlite prepare");
  return stmt;
}

void SqliteDB::Configure() {
  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  // a file that is not a database fails here, before any data access
  Exec("SELECT count(*) FROM sqlite_master;");

  if (mode_ == OpenMode::kReadWrite) {
    // IMPORTANT: WAL lets readers proceed while the single writer holds its lock
    Exec("PRAGMA journal_mode=WAL;");
    Exec("PRAGMA synchronous=NORMAL;");
  }

  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");
}

std::string SqliteDB::IntegrityCheck() {
  sqlite3_stmt* st = Prepare("PRAGMA integrity_check;");

  std::string out;
  int         rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) {
    const unsigned char* t = sqlite3_column_text(st, 0);
    out                    = t ? reinterpret_cast<const char*>(t) : "";
  } else if (rc != SQLITE_DONE) {
    auto r = Translate(db_, rc);
    sqlite3_finalize(st);
    throw DbError(std::move(r));
  }
  sqlite3_finalize(st);

  return out.empty() ? "integrity_check returned no rows" : out;
}

} // namespace projmem::db::sqlite
