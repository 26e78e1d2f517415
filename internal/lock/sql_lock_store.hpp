#pragma once

#include <memory>

#include "internal/lock/lock_store.hpp"

#if FLOWLOCK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#endif
#if FLOWLOCK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#endif

namespace flowlock::lock {

/*
  Lock stores on the workflow_lock table:

    workflow_lock(key PRIMARY KEY, token, expires_at_ms)

  Expiry is wall-clock millis so that every process sharing the table
  agrees on it. Set-if-absent is a single upsert that only overwrites an
  expired row.
*/

#if FLOWLOCK_DB_SQLITE
class SqliteLockStore final : public LockStore {
 public:
  explicit SqliteLockStore(std::shared_ptr<db::sqlite::SqliteDB> db);

  bool SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  bool CompareAndDelete(const std::string& key, const std::string& token) override;
  bool CompareAndExpire(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  std::optional<std::string> Holder(const std::string& key) override;

 private:
  std::shared_ptr<db::sqlite::SqliteDB> db_;
};
#endif

#if FLOWLOCK_DB_POSTGRES
class PgLockStore final : public LockStore {
 public:
  explicit PgLockStore(std::shared_ptr<db::postgres::PgPool> pool);

  bool SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  bool CompareAndDelete(const std::string& key, const std::string& token) override;
  bool CompareAndExpire(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  std::optional<std::string> Holder(const std::string& key) override;

 private:
  std::shared_ptr<db::postgres::PgPool> pool_;
};
#endif

} // namespace flowlock::lock
