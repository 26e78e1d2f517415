#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace flowlock::db::sqlite {

namespace {

constexpr const char* kResourceColumns =
    "id,kind,state,version,parent_id,level,assignee,started_at_ms,completed_at_ms,updated_at_ms,other_info,history";

model::ResourceRecord ReadResource(const Statement& st) {
  model::ResourceRecord r;
  r.id              = st.ColI64(0);
  r.kind            = st.ColText(1);
  r.state           = st.ColText(2);
  r.version         = st.ColU64(3);
  r.parent_id       = st.ColI64(4);
  r.level           = st.ColI64(5);
  r.assignee        = st.ColText(6);
  r.started_at_ms   = st.ColU64(7);
  r.completed_at_ms = st.ColU64(8);
  r.updated_at_ms   = st.ColU64(9);
  r.other_info      = st.ColText(10);
  r.history         = st.ColText(11);
  return r;
}

model::AuditRecord ReadAudit(const Statement& st) {
  model::AuditRecord a;
  a.seq            = st.ColU64(0);
  a.resource_id    = st.ColI64(1);
  a.entity_type    = st.ColText(2);
  a.operation_type = st.ColText(3);
  a.outcome        = st.ColText(4);
  a.old_value      = st.ColText(5);
  a.new_value      = st.ColText(6);
  a.actor          = st.ColText(7);
  a.lock_wait_ms   = st.ColU64(8);
  a.tx_duration_ms = st.ColU64(9);
  a.correlation_id = st.ColText(10);
  a.timestamp_ms   = st.ColU64(11);
  return a;
}

std::optional<model::ResourceRecord> SelectResource(sqlite3* db, int64_t id) {
  const std::string sql = std::string("SELECT ") + kResourceColumns + " FROM workflow_resource WHERE id=?;";
  Statement         st(db, sql.c_str());
  st.BindI64(1, id);

  const int rc = st.Step();
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw DbException(TranslateCode(rc), sqlite3_errmsg(db));
  }
  return ReadResource(st);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  const auto code = TranslateCode(rc);
  if (code == ErrorCode::OK) return Result::Ok();
  return Result::Err(code, sqlite3_errmsg(db));
}

// ------------------------------------------------------------------
// Resources
// ------------------------------------------------------------------

Result SqliteRepository::InsertResource(Transaction& t, const model::ResourceRecord& r) {
  auto* db = TX(t).Handle();

  try {
    Statement st(db,
                 "INSERT INTO workflow_resource(id,kind,state,version,parent_id,level,assignee,started_at_ms,completed_at_ms,"
                 "updated_at_ms,other_info,history) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);");
    st.BindI64(1, r.id);
    st.BindText(2, r.kind);
    st.BindText(3, r.state);
    st.BindU64(4, r.version);
    st.BindI64(5, r.parent_id);
    st.BindI64(6, r.level);
    st.BindText(7, r.assignee);
    st.BindU64(8, r.started_at_ms);
    st.BindU64(9, r.completed_at_ms);
    st.BindU64(10, r.updated_at_ms);
    st.BindText(11, r.other_info);
    st.BindText(12, r.history);

    const int rc = st.Step();
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    }
    return Translate(db, rc);
  } catch (const DbException& e) {
    return Result::Err(e.code(), e.what());
  }
}

std::optional<model::ResourceRecord> SqliteRepository::GetResource(Transaction& t, int64_t id) {
  return SelectResource(TX(t).Handle(), id);
}

Result SqliteRepository::LockForUpdate(Transaction& t, int64_t id, model::ResourceRecord* out) {
  // BEGIN IMMEDIATE already holds the database write lock for this transaction.
  try {
    auto record = SelectResource(TX(t).Handle(), id);
    if (!record) {
      return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(id) + " not found");
    }
    if (out) *out = std::move(*record);
    return Result::Ok();
  } catch (const DbException& e) {
    return Result::Err(e.code(), e.what());
  }
}

Result SqliteRepository::UpdateResource(Transaction& t, const model::ResourceRecord& r, uint64_t expected_version) {
  auto* db = TX(t).Handle();

  try {
    Statement st(db,
                 "UPDATE workflow_resource SET kind=?,state=?,version=?,parent_id=?,level=?,assignee=?,started_at_ms=?,"
                 "completed_at_ms=?,updated_at_ms=?,other_info=?,history=? WHERE id=? AND version=?;");
    st.BindText(1, r.kind);
    st.BindText(2, r.state);
    st.BindU64(3, expected_version + 1);
    st.BindI64(4, r.parent_id);
    st.BindI64(5, r.level);
    st.BindText(6, r.assignee);
    st.BindU64(7, r.started_at_ms);
    st.BindU64(8, r.completed_at_ms);
    st.BindU64(9, r.updated_at_ms);
    st.BindText(10, r.other_info);
    st.BindText(11, r.history);
    st.BindI64(12, r.id);
    st.BindU64(13, expected_version);

    const int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);

    if (sqlite3_changes(db) == 0) {
      if (!SelectResource(db, r.id)) {
        return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(r.id) + " not found");
      }
      return Result::Err(ErrorCode::Conflict, "version mismatch on resource " + std::to_string(r.id));
    }
    return Result::Ok();
  } catch (const DbException& e) {
    return Result::Err(e.code(), e.what());
  }
}

Result SqliteRepository::UpdateField(Transaction& t, int64_t id, model::StructuredField field, const std::string& json,
                                     uint64_t updated_at_ms) {
  auto* db = TX(t).Handle();

  try {
    const std::string sql = std::string("UPDATE workflow_resource SET ") + model::ColumnName(field) +
                            "=?,version=version+1,updated_at_ms=? WHERE id=?;";
    Statement st(db, sql.c_str());
    st.BindText(1, json);
    st.BindU64(2, updated_at_ms);
    st.BindI64(3, id);

    const int rc = st.Step();
    if (rc != SQLITE_DONE) return Translate(db, rc);
    if (sqlite3_changes(db) == 0) {
      return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(id) + " not found");
    }
    return Result::Ok();
  } catch (const DbException& e) {
    return Result::Err(e.code(), e.what());
  }
}

std::vector<model::ResourceRecord> SqliteRepository::ListChildren(Transaction& t, int64_t parent_id) {
  auto*             db  = TX(t).Handle();
  const std::string sql = std::string("SELECT ") + kResourceColumns + " FROM workflow_resource WHERE parent_id=? ORDER BY id;";
  Statement         st(db, sql.c_str());
  st.BindI64(1, parent_id);

  std::vector<model::ResourceRecord> out;
  for (;;) {
    const int rc = st.Step();
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) throw DbException(TranslateCode(rc), sqlite3_errmsg(db));
    out.push_back(ReadResource(st));
  }
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::AppendAudit(Transaction& t, const model::AuditRecord& a) {
  auto* db = TX(t).Handle();

  try {
    Statement st(db,
                 "INSERT INTO workflow_audit(resource_id,entity_type,operation_type,outcome,old_value,new_value,actor,"
                 "lock_wait_ms,tx_duration_ms,correlation_id,timestamp_ms) VALUES(?,?,?,?,?,?,?,?,?,?,?);");
    st.BindI64(1, a.resource_id);
    st.BindText(2, a.entity_type);
    st.BindText(3, a.operation_type);
    st.BindText(4, a.outcome);
    st.BindText(5, a.old_value);
    st.BindText(6, a.new_value);
    st.BindText(7, a.actor);
    st.BindU64(8, a.lock_wait_ms);
    st.BindU64(9, a.tx_duration_ms);
    st.BindText(10, a.correlation_id);
    st.BindU64(11, a.timestamp_ms);
    return Translate(db, st.Step());
  } catch (const DbException& e) {
    return Result::Err(e.code(), e.what());
  }
}

std::vector<model::AuditRecord> SqliteRepository::QueryAudit(Transaction& t, int64_t resource_id, uint64_t since_ms, uint64_t after_seq,
                                                             std::size_t limit) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT seq,resource_id,entity_type,operation_type,outcome,old_value,new_value,actor,lock_wait_ms,tx_duration_ms,"
               "correlation_id,timestamp_ms FROM workflow_audit WHERE resource_id=? AND timestamp_ms>=? AND seq>? "
               "ORDER BY seq LIMIT ?;");
  st.BindI64(1, resource_id);
  st.BindU64(2, since_ms);
  st.BindU64(3, after_seq);
  st.BindU64(4, limit);

  std::vector<model::AuditRecord> out;
  for (;;) {
    const int rc = st.Step();
    if (rc == SQLITE_DONE) break;
    if (rc != SQLITE_ROW) throw DbException(TranslateCode(rc), sqlite3_errmsg(db));
    out.push_back(ReadAudit(st));
  }
  return out;
}

} // namespace flowlock::db::sqlite
