#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace flowlock::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs the database write lock early, which subsumes row locks
    - avoids deadlock-y lock upgrades later
  Holds the connection's writer lock from construction until
  Commit()/Rollback().
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

 private:
  std::shared_ptr<SqliteDB>          db_;
  std::unique_lock<std::timed_mutex> writer_;
  bool                               finished_ = false;
};

} // namespace flowlock::db::sqlite
