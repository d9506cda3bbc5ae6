#include "sqlite_stmt.hpp"

#include "sqlite_db.hpp"

namespace projmem::db::sqlite {

Statement::Statement(sqlite3* db, const char* sql) : db_(db) {
  int rc = sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr);
  if (rc != SQLITE_OK) {
    auto r = Translate(db_, rc);
    sqlite3_finalize(st_);
    st_ = nullptr;
    throw DbError(std::move(r));
  }
}

Statement::~Statement() {
  sqlite3_finalize(st_);
}

Statement& Statement::BindText(int idx, const std::string& s) {
  sqlite3_bind_text(st_, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
  return *this;
}

Statement& Statement::BindI64(int idx, int64_t v) {
  sqlite3_bind_int64(st_, idx, static_cast<sqlite3_int64>(v));
  return *this;
}

bool Statement::Step() {
  int rc = sqlite3_step(st_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw DbError(Translate(db_, rc));
}

Result Statement::Run() {
  int rc;
  do {
    rc = sqlite3_step(st_);
  } while (rc == SQLITE_ROW);
  return Translate(db_, rc);
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(st_, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st_, col)));
}

int64_t Statement::ColI64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(st_, col));
}

uint64_t Statement::ColU64(int col) const {
  return static_cast<uint64_t>(sqlite3_column_int64(st_, col));
}

} // namespace projmem::db::sqlite
