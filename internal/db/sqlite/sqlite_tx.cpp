#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"

namespace flowlock::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), writer_(db_->AcquireWriter()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    db_->Exec("ROLLBACK;");
  } catch (const DbException& e) {
    FLOWLOCK_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  try {
    db_->Exec("COMMIT;");
  } catch (const DbException& commit_error) {
    finished_ = true;
    try {
      db_->Exec("ROLLBACK;");
    } catch (const DbException& e) {
      FLOWLOCK_LOG_ERROR("sqlite rollback after failed commit failed",
                         {observability::StringField("commit_error", commit_error.what()), observability::StringField("error", e.what())});
    }
    writer_.unlock();
    throw;
  }
  finished_ = true;
  writer_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  db_->Exec("ROLLBACK;");
  writer_.unlock();
}

} // namespace flowlock::db::sqlite
