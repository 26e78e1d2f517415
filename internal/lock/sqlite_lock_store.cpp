#include "internal/lock/sql_lock_store.hpp"

#if FLOWLOCK_DB_SQLITE

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowlock::lock {

namespace {

// Runs one autocommit statement; returns sqlite3_changes().
template <typename Bind>
int ExecChanges(db::sqlite::SqliteDB& db, const char* sql, Bind&& bind) {
  try {
    auto                  writer = db.AcquireWriter();
    db::sqlite::Statement st(db.Handle(), sql);
    bind(st);
    const int rc = st.Step();
    if (rc != SQLITE_DONE) {
      throw db::DbException(db::sqlite::TranslateCode(rc), sqlite3_errmsg(db.Handle()));
    }
    return sqlite3_changes(db.Handle());
  } catch (const db::DbException& e) {
    throw util::TransientConnectionError(std::string("lock store unavailable: ") + e.what());
  }
}

} // namespace

SqliteLockStore::SqliteLockStore(std::shared_ptr<db::sqlite::SqliteDB> db) : db_(std::move(db)) {
}

bool SqliteLockStore::SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  const auto now = util::NowUnixMillis();
  return ExecChanges(*db_,
                     "INSERT INTO workflow_lock(key,token,expires_at_ms) VALUES(?,?,?) "
                     "ON CONFLICT(key) DO UPDATE SET token=excluded.token, expires_at_ms=excluded.expires_at_ms "
                     "WHERE workflow_lock.expires_at_ms <= ?;",
                     [&](db::sqlite::Statement& st) {
                       st.BindText(1, key);
                       st.BindText(2, token);
                       st.BindU64(3, now + static_cast<uint64_t>(ttl.count()));
                       st.BindU64(4, now);
                     }) > 0;
}

bool SqliteLockStore::CompareAndDelete(const std::string& key, const std::string& token) {
  const auto now = util::NowUnixMillis();
  return ExecChanges(*db_, "DELETE FROM workflow_lock WHERE key=? AND token=? AND expires_at_ms > ?;",
                     [&](db::sqlite::Statement& st) {
                       st.BindText(1, key);
                       st.BindText(2, token);
                       st.BindU64(3, now);
                     }) > 0;
}

bool SqliteLockStore::CompareAndExpire(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  const auto now = util::NowUnixMillis();
  return ExecChanges(*db_, "UPDATE workflow_lock SET expires_at_ms=? WHERE key=? AND token=? AND expires_at_ms > ?;",
                     [&](db::sqlite::Statement& st) {
                       st.BindU64(1, now + static_cast<uint64_t>(ttl.count()));
                       st.BindText(2, key);
                       st.BindText(3, token);
                       st.BindU64(4, now);
                     }) > 0;
}

std::optional<std::string> SqliteLockStore::Holder(const std::string& key) {
  try {
    auto                  writer = db_->AcquireWriter();
    db::sqlite::Statement st(db_->Handle(), "SELECT token FROM workflow_lock WHERE key=? AND expires_at_ms > ?;");
    st.BindText(1, key);
    st.BindU64(2, util::NowUnixMillis());

    const int rc = st.Step();
    if (rc == SQLITE_ROW) return st.ColText(0);
    if (rc != SQLITE_DONE) {
      throw db::DbException(db::sqlite::TranslateCode(rc), sqlite3_errmsg(db_->Handle()));
    }
    return std::nullopt;
  } catch (const db::DbException& e) {
    throw util::TransientConnectionError(std::string("lock store unavailable: ") + e.what());
  }
}

} // namespace flowlock::lock

#endif
