#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace ledger::db::sqlite {

/*
  SQLite transaction wrapper.

  Writes use BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Reads use BEGIN DEFERRED and only ever take a shared lock.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, bool read_only);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  bool ReadOnly() const { return read_only_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool                         read_only_;
  bool                         committed_ = false;
  bool                         finished_  = false;
};

}
