#include "pg_tx.hpp"

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"

namespace flowlock::db::postgres {

ErrorCode TranslateException(const std::exception& e) {
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return ErrorCode::IOError;
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) != nullptr || dynamic_cast<const pqxx::deadlock_detected*>(&e) != nullptr) {
    return ErrorCode::SerializationFailure;
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e) != nullptr) {
    return ErrorCode::AlreadyExists;
  }
  if (const auto* sql = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const auto& state = sql->sqlstate();
    // lock_not_available / query_canceled: lock_timeout expired
    if (state == "55P03" || state == "57014") {
      return ErrorCode::Busy;
    }
    if (state.rfind("23", 0) == 0) {
      return ErrorCode::ConstraintViolation;
    }
    if (state.rfind("08", 0) == 0) {
      return ErrorCode::IOError;
    }
  }
  return ErrorCode::InternalError;
}

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_wait) {
  try {
    conn_ = pool->Acquire();
    tx_   = std::make_unique<pqxx::work>(*conn_);
    tx_->exec("SET LOCAL lock_timeout = '" + std::to_string(lock_wait.count()) + "ms'");
  } catch (const std::exception& e) {
    throw DbException(TranslateException(e), e.what());
  }
}

PgTransaction::~PgTransaction() {
  if (finished_ || !tx_) return;
  try {
    tx_->abort();
  } catch (const std::exception& e) {
    FLOWLOCK_LOG_ERROR("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  finished_ = true;
  try {
    tx_->commit();
  } catch (const std::exception& e) {
    throw DbException(TranslateException(e), e.what());
  }
}

void PgTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  tx_->abort();
}

} // namespace flowlock::db::postgres
