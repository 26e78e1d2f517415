#include "pg_repository.hpp"

namespace flowlock::db::postgres {

namespace {

model::ResourceRecord ReadResource(const pqxx::row& row) {
  model::ResourceRecord r;
  r.id              = row[0].as<int64_t>();
  r.kind            = row[1].c_str();
  r.state           = row[2].c_str();
  r.version         = row[3].as<uint64_t>();
  r.parent_id       = row[4].as<int64_t>();
  r.level           = row[5].as<int64_t>();
  r.assignee        = row[6].c_str();
  r.started_at_ms   = row[7].as<uint64_t>();
  r.completed_at_ms = row[8].as<uint64_t>();
  r.updated_at_ms   = row[9].as<uint64_t>();
  r.other_info      = row[10].c_str();
  r.history         = row[11].c_str();
  return r;
}

model::AuditRecord ReadAudit(const pqxx::row& row) {
  model::AuditRecord a;
  a.seq            = row[0].as<uint64_t>();
  a.resource_id    = row[1].as<int64_t>();
  a.entity_type    = row[2].c_str();
  a.operation_type = row[3].c_str();
  a.outcome        = row[4].c_str();
  a.old_value      = row[5].c_str();
  a.new_value      = row[6].c_str();
  a.actor          = row[7].c_str();
  a.lock_wait_ms   = row[8].as<uint64_t>();
  a.tx_duration_ms = row[9].as<uint64_t>();
  a.correlation_id = row[10].c_str();
  a.timestamp_ms   = row[11].as<uint64_t>();
  return a;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_wait)
    : pool_(std::move(pool)), lock_wait_(lock_wait) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_, lock_wait_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  return Result::Err(TranslateException(e), e.what());
}

Result PgRepository::InsertResource(Transaction& t, const model::ResourceRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_resource", r.id, r.kind, r.state, r.version, r.parent_id, r.level, r.assignee, r.started_at_ms,
                               r.completed_at_ms, r.updated_at_ms, r.other_info, r.history);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ResourceRecord> PgRepository::GetResource(Transaction& t, int64_t id) {
  try {
    auto res = TX(t).Work().exec_prepared("get_resource", id);
    if (res.empty()) return std::nullopt;
    return ReadResource(res[0]);
  } catch (const std::exception& e) {
    throw DbException(TranslateException(e), e.what());
  }
}

Result PgRepository::LockForUpdate(Transaction& t, int64_t id, model::ResourceRecord* out) {
  try {
    auto res = TX(t).Work().exec_prepared("lock_resource", id);
    if (res.empty()) {
      return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(id) + " not found");
    }
    if (out) *out = ReadResource(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateResource(Transaction& t, const model::ResourceRecord& r, uint64_t expected_version) {
  try {
    auto& work = TX(t).Work();
    auto  res  = work.exec_prepared("update_resource", r.id, r.kind, r.state, expected_version + 1, r.parent_id, r.level, r.assignee,
                                    r.started_at_ms, r.completed_at_ms, r.updated_at_ms, r.other_info, r.history, expected_version);
    if (res.affected_rows() == 0) {
      if (work.exec_prepared("get_resource", r.id).empty()) {
        return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(r.id) + " not found");
      }
      return Result::Err(ErrorCode::Conflict, "version mismatch on resource " + std::to_string(r.id));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateField(Transaction& t, int64_t id, model::StructuredField field, const std::string& json, uint64_t updated_at_ms) {
  try {
    const char* statement = field == model::StructuredField::kHistory ? "update_history" : "update_other_info";
    auto        res       = TX(t).Work().exec_prepared(statement, id, json, updated_at_ms);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(id) + " not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ResourceRecord> PgRepository::ListChildren(Transaction& t, int64_t parent_id) {
  try {
    auto                               res = TX(t).Work().exec_prepared("list_children", parent_id);
    std::vector<model::ResourceRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadResource(row));
    }
    return out;
  } catch (const std::exception& e) {
    throw DbException(TranslateException(e), e.what());
  }
}

Result PgRepository::AppendAudit(Transaction& t, const model::AuditRecord& a) {
  try {
    TX(t).Work().exec_prepared("append_audit", a.resource_id, a.entity_type, a.operation_type, a.outcome, a.old_value, a.new_value, a.actor,
                               a.lock_wait_ms, a.tx_duration_ms, a.correlation_id, a.timestamp_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AuditRecord> PgRepository::QueryAudit(Transaction& t, int64_t resource_id, uint64_t since_ms, uint64_t after_seq,
                                                         std::size_t limit) {
  try {
    auto res = TX(t).Work().exec_prepared("query_audit", resource_id, since_ms, after_seq, static_cast<int64_t>(limit));
    std::vector<model::AuditRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadAudit(row));
    }
    return out;
  } catch (const std::exception& e) {
    throw DbException(TranslateException(e), e.what());
  }
}

} // namespace flowlock::db::postgres
