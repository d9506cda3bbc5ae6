#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace projmem::db::sqlite {

/*
  SQLite transaction wrapper.

  Holds one pooled connection until destroyed.

  kRead  -> BEGIN DEFERRED  (snapshot taken at first read)
  kWrite -> BEGIN IMMEDIATE (grabs the write lock early so two writers
                             never deadlock upgrading from shared)
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> conn, TxMode mode);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return conn_->Handle(); }
  SqliteDB& Connection() const { return *conn_; }

  void Commit() override;
  void Rollback() override;
  bool IsFinished() const override { return finished_; }
  TxMode Mode() const override { return mode_; }

private:
  std::shared_ptr<SqliteDB> conn_;
  TxMode mode_;
  bool finished_ = false;
};

}
