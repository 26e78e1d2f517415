#include "sqlite_db.hpp"

namespace flowlock::db::sqlite {

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
    case SQLITE_IOERR:
    case SQLITE_CANTOPEN:
      return ErrorCode::IOError;
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return ErrorCode::Corruption;
    default:
      return ErrorCode::InternalError;
  }
}

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw DbException(TranslateCode(rc), std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, std::chrono::milliseconds busy_timeout, bool wal_mode)
    : path_(std::move(path)), busy_timeout_(busy_timeout) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw DbException(ErrorCode::IOError, msg);
  }

  try {
    Configure(wal_mode);
  } catch (...) {
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
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw DbException(TranslateCode(rc), msg);
  }
}

std::unique_lock<std::timed_mutex> SqliteDB::AcquireWriter() {
  std::unique_lock<std::timed_mutex> lock(writer_, std::defer_lock);
  if (!lock.try_lock_for(busy_timeout_)) {
    throw DbException(ErrorCode::Busy, "sqlite connection busy");
  }
  return lock;
}

void SqliteDB::Configure(bool wal_mode) {
  // WAL lets readers in other processes proceed while a writer holds the lock
  if (wal_mode) {
    Exec("PRAGMA journal_mode=WAL;");
  }

  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA foreign_keys=ON;");

  // row lock wait bound for BEGIN IMMEDIATE across processes
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_.count())), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
}

Statement::Statement(sqlite3* db, const char* sql) {
  ThrowIf(sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr), db, "sqlite prepare");
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::BindText(int idx, const std::string& s) {
  sqlite3_bind_text(stmt_, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void Statement::BindI64(int idx, int64_t v) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
}

void Statement::BindU64(int idx, uint64_t v) {
  sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
}

std::string Statement::ColText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t Statement::ColI64(int col) const {
  return static_cast<int64_t>(sqlite3_column_int64(stmt_, col));
}

uint64_t Statement::ColU64(int col) const {
  return static_cast<uint64_t>(sqlite3_column_int64(stmt_, col));
}

int Statement::Step() {
  return sqlite3_step(stmt_);
}

} // namespace flowlock::db::sqlite
