#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/workflow/state_machine.hpp"
#if FLOWLOCK_DB_SQLITE || FLOWLOCK_DB_POSTGRES
#include "internal/lock/sql_lock_store.hpp"
#endif
#if FLOWLOCK_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if FLOWLOCK_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace flowlock::factory {

namespace {

#if FLOWLOCK_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS workflow_resource (id INTEGER PRIMARY KEY, kind TEXT NOT NULL, state TEXT NOT NULL, version INTEGER NOT NULL DEFAULT 0, parent_id INTEGER NOT NULL DEFAULT 0, level INTEGER NOT NULL DEFAULT 0, assignee TEXT NOT NULL DEFAULT '', started_at_ms INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0, updated_at_ms INTEGER NOT NULL, other_info TEXT NOT NULL DEFAULT '{}', history TEXT NOT NULL DEFAULT '{}');",
      "CREATE INDEX IF NOT EXISTS workflow_resource_parent ON workflow_resource(parent_id);",
      "CREATE TABLE IF NOT EXISTS workflow_audit (seq INTEGER PRIMARY KEY AUTOINCREMENT, resource_id INTEGER NOT NULL, entity_type TEXT NOT NULL, operation_type TEXT NOT NULL, outcome TEXT NOT NULL, old_value TEXT NOT NULL DEFAULT '', new_value TEXT NOT NULL DEFAULT '', actor TEXT NOT NULL DEFAULT '', lock_wait_ms INTEGER NOT NULL DEFAULT 0, tx_duration_ms INTEGER NOT NULL DEFAULT 0, correlation_id TEXT NOT NULL DEFAULT '', timestamp_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS workflow_audit_resource ON workflow_audit(resource_id, seq);",
      "CREATE TABLE IF NOT EXISTS workflow_lock (key TEXT PRIMARY KEY, token TEXT NOT NULL, expires_at_ms INTEGER NOT NULL);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,kind,state,version,parent_id,level,assignee,updated_at_ms,other_info,history FROM workflow_resource LIMIT 1;");
  sqlite_db->Exec("SELECT seq,resource_id,outcome,correlation_id,timestamp_ms FROM workflow_audit LIMIT 1;");
  sqlite_db->Exec("SELECT key,token,expires_at_ms FROM workflow_lock LIMIT 1;");
}
#endif

#if FLOWLOCK_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS workflow_resource (id BIGINT PRIMARY KEY, kind TEXT NOT NULL, state TEXT NOT NULL, version BIGINT NOT NULL DEFAULT 0, parent_id BIGINT NOT NULL DEFAULT 0, level BIGINT NOT NULL DEFAULT 0, assignee TEXT NOT NULL DEFAULT '', started_at_ms BIGINT NOT NULL DEFAULT 0, completed_at_ms BIGINT NOT NULL DEFAULT 0, updated_at_ms BIGINT NOT NULL, other_info JSONB NOT NULL DEFAULT '{}'::jsonb, history JSONB NOT NULL DEFAULT '{}'::jsonb);");
  tx.exec("CREATE INDEX IF NOT EXISTS workflow_resource_parent ON workflow_resource(parent_id);");
  tx.exec("CREATE TABLE IF NOT EXISTS workflow_audit (seq BIGSERIAL PRIMARY KEY, resource_id BIGINT NOT NULL, entity_type TEXT NOT NULL, operation_type TEXT NOT NULL, outcome TEXT NOT NULL, old_value TEXT NOT NULL DEFAULT '', new_value TEXT NOT NULL DEFAULT '', actor TEXT NOT NULL DEFAULT '', lock_wait_ms BIGINT NOT NULL DEFAULT 0, tx_duration_ms BIGINT NOT NULL DEFAULT 0, correlation_id TEXT NOT NULL DEFAULT '', timestamp_ms BIGINT NOT NULL);");
  tx.exec("CREATE INDEX IF NOT EXISTS workflow_audit_resource ON workflow_audit(resource_id, seq);");
  tx.exec("CREATE TABLE IF NOT EXISTS workflow_lock (key TEXT PRIMARY KEY, token TEXT NOT NULL, expires_at_ms BIGINT NOT NULL);");

  tx.exec("SELECT id,kind,state,version,parent_id,level,assignee,updated_at_ms,other_info,history FROM workflow_resource LIMIT 1;");
  tx.exec("SELECT seq,resource_id,outcome,correlation_id,timestamp_ms FROM workflow_audit LIMIT 1;");
  tx.exec("SELECT key,token,expires_at_ms FROM workflow_lock LIMIT 1;");
  tx.commit();
}
#endif

lock::MutexOptions BuildMutexOptions(const config::RuntimeConfig& config) {
  const auto&        locks = config.locks();
  lock::MutexOptions options;
  options.default_ttl      = util::FromProto(locks.default_ttl());
  options.blocking_timeout = util::FromProto(locks.blocking_timeout());
  options.poll_interval    = util::FromProto(locks.poll_interval());
  options.key_prefix       = locks.key_prefix();
  return options;
}

} // namespace

workflow::TransitionService& Engine::ServiceFor(std::string_view entity_type) const {
  if (entity_type == jobs->EntityType()) return *jobs;
  if (entity_type == tickets->EntityType()) return *tickets;
  throw util::ValidationError("unknown entity type '" + std::string(entity_type) + "'");
}

fields::FieldUpdater& Engine::FieldsFor(std::string_view entity_type) const {
  if (entity_type == jobs->EntityType()) return *job_fields;
  if (entity_type == tickets->EntityType()) return *ticket_fields;
  throw util::ValidationError("unknown entity type '" + std::string(entity_type) + "'");
}

Engine AssembleEngine(const config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                      std::unique_ptr<lock::LockStore> lock_store) {
  Engine engine;
  engine.repository = std::move(repository);
  engine.lock_store = std::move(lock_store);
  engine.mutex      = std::make_unique<lock::DistributedMutex>(*engine.lock_store, BuildMutexOptions(config));
  engine.audit      = std::make_unique<audit::AuditLog>(engine.repository, config.audit().page_size() == 0 ? 100 : config.audit().page_size());
  engine.retry      = std::make_unique<retry::RetryExecutor>();

  auto job_machine    = std::make_shared<const workflow::JobStateMachine>();
  auto ticket_machine = std::make_shared<const workflow::TicketStateMachine>();

  engine.job_fields = std::make_unique<fields::FieldUpdater>(std::string(job_machine->EntityType()), engine.repository, *engine.mutex,
                                                             *engine.audit, *engine.retry);
  engine.ticket_fields = std::make_unique<fields::FieldUpdater>(std::string(ticket_machine->EntityType()), engine.repository, *engine.mutex,
                                                                *engine.audit, *engine.retry);

  engine.jobs    = std::make_unique<workflow::TransitionService>(job_machine, engine.repository, *engine.mutex, *engine.audit, *engine.retry);
  engine.tickets = std::make_unique<workflow::TransitionService>(ticket_machine, engine.repository, *engine.mutex, *engine.audit, *engine.retry);

  engine.job_workflow    = std::make_unique<workflow::JobWorkflow>(*engine.jobs, *engine.job_fields);
  engine.ticket_workflow = std::make_unique<workflow::TicketWorkflow>(*engine.tickets, *engine.ticket_fields);
  return engine;
}

Engine BuildEngine(const config::RuntimeConfig& config) {
  const auto& database  = config.database();
  const auto  lock_wait = util::FromProto(database.lock_wait_timeout());

  if (database.has_sqlite()) {
#if FLOWLOCK_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), lock_wait, database.sqlite().wal_mode());
    BootstrapSqliteSchema(sqlite_db);
    FLOWLOCK_LOG_INFO("engine using sqlite backend",
                      {observability::StringField("path", database.sqlite().path()), observability::BoolField("wal_mode", database.sqlite().wal_mode())});
    return AssembleEngine(config, std::make_shared<db::sqlite::SqliteRepository>(sqlite_db),
                          std::make_unique<lock::SqliteLockStore>(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if FLOWLOCK_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    BootstrapPostgresSchema(pool);
    FLOWLOCK_LOG_INFO("engine using postgres backend",
                      {observability::UIntField("max_connections", database.postgres().max_connections())});
    return AssembleEngine(config, std::make_shared<db::postgres::PgRepository>(pool, lock_wait), std::make_unique<lock::PgLockStore>(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  FLOWLOCK_LOG_INFO("engine using in-memory backend");
  return AssembleEngine(config, std::make_shared<db::memory::MemoryRepository>(lock_wait), std::make_unique<lock::MemoryLockStore>());
}

} // namespace flowlock::factory
