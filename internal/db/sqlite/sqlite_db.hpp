#pragma once

#include <sqlite3.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/result.hpp"

namespace flowlock::db::sqlite {

/*
  Thin RAII wrapper around one sqlite3* connection.

  The connection is shared by every transaction and by the SQL lock store,
  so statements from different threads are serialized through
  AcquireWriter(): a connection can only carry one transaction at a time.
  Other processes on the same file are held off by BEGIN IMMEDIATE and
  busy_timeout.
*/
class SqliteDB {
 public:
  SqliteDB(std::string path, std::chrono::milliseconds busy_timeout, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control).
  // Throws DbException with the translated code.
  void Exec(const std::string& sql);

  // Exclusive use of the connection, waiting at most busy_timeout.
  // Throws DbException(Busy) on timeout.
  std::unique_lock<std::timed_mutex> AcquireWriter();

 private:
  void Configure(bool wal_mode);

  sqlite3*                  db_ = nullptr;
  std::string               path_;
  std::chrono::milliseconds busy_timeout_;
  std::timed_mutex          writer_;
};

ErrorCode TranslateCode(int rc);

/*
  Prepared statement owned for one call.
*/
class Statement {
 public:
  Statement(sqlite3* db, const char* sql);
  ~Statement();

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return stmt_;
  }

  void BindText(int idx, const std::string& s);
  void BindI64(int idx, int64_t v);
  void BindU64(int idx, uint64_t v);

  std::string ColText(int col) const;
  int64_t     ColI64(int col) const;
  uint64_t    ColU64(int col) const;

  // SQLITE_ROW / SQLITE_DONE / error code
  int Step();

 private:
  sqlite3_stmt* stmt_ = nullptr;
};

} // namespace flowlock::db::sqlite
