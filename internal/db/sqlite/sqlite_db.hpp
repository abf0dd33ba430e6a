#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"

namespace ledger::db::sqlite {

// maps a (possibly extended) sqlite result code to the portable code
ErrorCode ToErrorCode(int rc);

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction; the connection mutex is
  held by a transaction for its whole lifetime so statements from
  different threads never interleave inside one BEGIN/COMMIT.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, int busy_timeout_ms = 5000);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::unique_lock<std::mutex> Lock() {
    return std::unique_lock<std::mutex>(mutex_);
  }

  // Execute a SQL string (pragmas, schema, BEGIN/COMMIT); throws db::Error
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

  // Create tables and indexes if missing
  void ApplySchema();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  int         busy_timeout_ms_;
  std::mutex  mutex_;
};

} // namespace ledger::db::sqlite
