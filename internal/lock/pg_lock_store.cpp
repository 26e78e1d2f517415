#include "internal/lock/sql_lock_store.hpp"

#if FLOWLOCK_DB_POSTGRES

#include <pqxx/pqxx>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowlock::lock {

namespace {

template <typename... Args>
pqxx::result ExecPrepared(db::postgres::PgPool& pool, const char* statement, Args&&... args) {
  try {
    auto       conn = pool.Acquire();
    pqxx::work tx(*conn);
    auto       res = tx.exec_prepared(statement, std::forward<Args>(args)...);
    tx.commit();
    return res;
  } catch (const std::exception& e) {
    throw util::TransientConnectionError(std::string("lock store unavailable: ") + e.what());
  }
}

} // namespace

PgLockStore::PgLockStore(std::shared_ptr<db::postgres::PgPool> pool) : pool_(std::move(pool)) {
}

bool PgLockStore::SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  const auto now = util::NowUnixMillis();
  return ExecPrepared(*pool_, "lock_set_if_absent", key, token, now + static_cast<uint64_t>(ttl.count()), now).affected_rows() > 0;
}

bool PgLockStore::CompareAndDelete(const std::string& key, const std::string& token) {
  return ExecPrepared(*pool_, "lock_compare_and_delete", key, token, util::NowUnixMillis()).affected_rows() > 0;
}

bool PgLockStore::CompareAndExpire(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  const auto now = util::NowUnixMillis();
  return ExecPrepared(*pool_, "lock_compare_and_expire", key, token, now + static_cast<uint64_t>(ttl.count()), now).affected_rows() > 0;
}

std::optional<std::string> PgLockStore::Holder(const std::string& key) {
  auto res = ExecPrepared(*pool_, "lock_holder", key, util::NowUnixMillis());
  if (res.empty()) return std::nullopt;
  return std::string(res[0][0].c_str());
}

} // namespace flowlock::lock

#endif
