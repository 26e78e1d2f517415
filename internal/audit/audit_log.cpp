#include "audit_log.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace flowlock::audit {

AuditCursor::AuditCursor(std::shared_ptr<db::Repository> repo, int64_t resource_id, uint64_t since_ms, std::size_t page_size)
    : repo_(std::move(repo)), resource_id_(resource_id), since_ms_(since_ms), page_size_(page_size == 0 ? 1 : page_size) {
}

std::optional<AuditEntry> AuditCursor::Next() {
  if (buffer_.empty() && !exhausted_) {
    FetchPage();
  }
  if (buffer_.empty()) {
    return std::nullopt;
  }

  auto entry = std::move(buffer_.front());
  buffer_.pop_front();
  return entry;
}

void AuditCursor::FetchPage() {
  auto tx   = repo_->Begin();
  auto page = repo_->QueryAudit(*tx, resource_id_, since_ms_, after_seq_, page_size_);
  tx->Commit();

  if (page.size() < page_size_) {
    exhausted_ = true;
  }
  if (!page.empty()) {
    after_seq_ = page.back().seq;
  }
  for (auto& entry : page) {
    buffer_.push_back(std::move(entry));
  }
}

AuditLog::AuditLog(std::shared_ptr<db::Repository> repo, std::size_t page_size)
    : repo_(std::move(repo)), page_size_(page_size == 0 ? 100 : page_size) {
}

void AuditLog::Append(AuditEntry entry) {
  if (entry.timestamp_ms == 0) {
    entry.timestamp_ms = util::NowUnixMillis();
  }

  try {
    auto tx     = repo_->Begin();
    auto result = repo_->AppendAudit(*tx, entry);
    if (!result) {
      throw db::DbException(result.code, result.message);
    }
    tx->Commit();
  } catch (const std::exception& e) {
    failed_appends_.fetch_add(1);
    observability::Metrics::Instance().RecordAuditWriteFailure();
    FLOWLOCK_LOG_ERROR("audit append failed",
                       {observability::StringField("correlation_id", entry.correlation_id), observability::IntField("resource_id", entry.resource_id),
                        observability::StringField("operation", entry.operation_type), observability::StringField("outcome", entry.outcome),
                        observability::StringField("error", e.what())});
  }
}

AuditCursor AuditLog::Query(int64_t resource_id, uint64_t since_ms, std::size_t page_size) const {
  return AuditCursor(repo_, resource_id, since_ms, page_size == 0 ? page_size_ : page_size);
}

std::vector<AuditEntry> AuditLog::History(int64_t resource_id) const {
  std::vector<AuditEntry> out;
  auto                    cursor = Query(resource_id);
  while (auto entry = cursor.Next()) {
    out.push_back(std::move(*entry));
  }
  return out;
}

} // namespace flowlock::audit
