#include "pg_pool.hpp"

namespace flowlock::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (...) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kResourceColumns =
      "id,kind,state,version,parent_id,level,assignee,started_at_ms,completed_at_ms,updated_at_ms,other_info::text,history::text";

  conn.prepare("get_resource", std::string("SELECT ") + kResourceColumns + " FROM workflow_resource WHERE id=$1");

  conn.prepare("lock_resource", std::string("SELECT ") + kResourceColumns + " FROM workflow_resource WHERE id=$1 FOR UPDATE");

  conn.prepare("list_children", std::string("SELECT ") + kResourceColumns + " FROM workflow_resource WHERE parent_id=$1 ORDER BY id");

  conn.prepare("insert_resource",
               "INSERT INTO workflow_resource(id,kind,state,version,parent_id,level,assignee,started_at_ms,completed_at_ms,"
               "updated_at_ms,other_info,history) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11::jsonb,$12::jsonb)");

  conn.prepare("update_resource",
               "UPDATE workflow_resource SET kind=$2,state=$3,version=$4,parent_id=$5,level=$6,assignee=$7,started_at_ms=$8,"
               "completed_at_ms=$9,updated_at_ms=$10,other_info=$11::jsonb,history=$12::jsonb WHERE id=$1 AND version=$13");

  conn.prepare("update_other_info",
               "UPDATE workflow_resource SET other_info=$2::jsonb,version=version+1,updated_at_ms=$3 WHERE id=$1");

  conn.prepare("update_history", "UPDATE workflow_resource SET history=$2::jsonb,version=version+1,updated_at_ms=$3 WHERE id=$1");

  conn.prepare("append_audit",
               "INSERT INTO workflow_audit(resource_id,entity_type,operation_type,outcome,old_value,new_value,actor,lock_wait_ms,"
               "tx_duration_ms,correlation_id,timestamp_ms) VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11)");

  conn.prepare("query_audit",
               "SELECT seq,resource_id,entity_type,operation_type,outcome,old_value,new_value,actor,lock_wait_ms,tx_duration_ms,"
               "correlation_id,timestamp_ms FROM workflow_audit WHERE resource_id=$1 AND timestamp_ms>=$2 AND seq>$3 "
               "ORDER BY seq LIMIT $4");

  conn.prepare("lock_set_if_absent",
               "INSERT INTO workflow_lock(key,token,expires_at_ms) VALUES($1,$2,$3) "
               "ON CONFLICT(key) DO UPDATE SET token=excluded.token, expires_at_ms=excluded.expires_at_ms "
               "WHERE workflow_lock.expires_at_ms <= $4");

  conn.prepare("lock_compare_and_delete", "DELETE FROM workflow_lock WHERE key=$1 AND token=$2 AND expires_at_ms > $3");

  conn.prepare("lock_compare_and_expire",
               "UPDATE workflow_lock SET expires_at_ms=$3 WHERE key=$1 AND token=$2 AND expires_at_ms > $4");

  conn.prepare("lock_holder", "SELECT token FROM workflow_lock WHERE key=$1 AND expires_at_ms > $2");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      --live_connections_;
      delete conn;
    }
  }
  cv_.notify_one();
}

} // namespace flowlock::db::postgres
