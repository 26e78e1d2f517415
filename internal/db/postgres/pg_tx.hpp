#pragma once

#include <chrono>
#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace flowlock::db::postgres {

/*
  pqxx::work on a pooled connection.

  lock_timeout is set per transaction (SET LOCAL) so FOR UPDATE waits are
  bounded by the configured row lock wait.
*/
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_wait);
  ~PgTransaction();

  pqxx::work& Work() {
    return *tx_;
  }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

 private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       tx_;
  bool                              finished_ = false;
};

// Maps a libpqxx exception onto a portable code.
ErrorCode TranslateException(const std::exception& e);

} // namespace flowlock::db::postgres
