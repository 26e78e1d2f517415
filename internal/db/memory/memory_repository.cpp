#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace flowlock::db::memory {

MemoryRepository::MemoryRepository(std::chrono::milliseconds lock_wait) : lock_wait_(lock_wait) {
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::AcquireRow(std::unique_lock<std::mutex>& lock, MemoryTransaction& tx, int64_t id) {
  if (tx.finished_) {
    return Result::Err(ErrorCode::InternalError, "transaction already finished");
  }

  const bool acquired = cv_.wait_for(lock, lock_wait_, [&] {
    auto it = row_owner_.find(id);
    return it == row_owner_.end() || it->second == &tx;
  });
  if (!acquired) {
    return Result::Err(ErrorCode::Busy, "row lock wait timeout on resource " + std::to_string(id));
  }

  row_owner_[id] = &tx;
  tx.owned_rows_.insert(id);
  return Result::Ok();
}

const model::ResourceRecord* MemoryRepository::View(const MemoryTransaction& tx, int64_t id) const {
  if (auto it = tx.staged_.find(id); it != tx.staged_.end()) {
    return &it->second;
  }
  if (auto it = committed_.resources.find(id); it != committed_.resources.end()) {
    return &it->second;
  }
  return nullptr;
}

Result MemoryRepository::InsertResource(Transaction& t, const model::ResourceRecord& r) {
  auto&            tx = TX(t);
  std::unique_lock lock(mutex_);

  if (auto owner = row_owner_.find(r.id); owner != row_owner_.end() && owner->second != &tx) {
    return Result::Err(ErrorCode::AlreadyExists, "resource " + std::to_string(r.id) + " is being created");
  }
  if (View(tx, r.id) != nullptr) {
    return Result::Err(ErrorCode::AlreadyExists, "resource " + std::to_string(r.id) + " already exists");
  }

  row_owner_[r.id] = &tx;
  tx.owned_rows_.insert(r.id);
  tx.staged_[r.id] = r;
  return Result::Ok();
}

std::optional<model::ResourceRecord> MemoryRepository::GetResource(Transaction& t, int64_t id) {
  std::scoped_lock lock(mutex_);
  const auto*      record = View(TX(t), id);
  if (!record) return std::nullopt;
  return *record;
}

Result MemoryRepository::LockForUpdate(Transaction& t, int64_t id, model::ResourceRecord* out) {
  auto&            tx = TX(t);
  std::unique_lock lock(mutex_);

  if (auto r = AcquireRow(lock, tx, id); !r) {
    return r;
  }

  const auto* record = View(tx, id);
  if (!record) {
    return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(id) + " not found");
  }
  if (out) *out = *record;
  return Result::Ok();
}

Result MemoryRepository::UpdateResource(Transaction& t, const model::ResourceRecord& record, uint64_t expected_version) {
  auto&            tx = TX(t);
  std::unique_lock lock(mutex_);

  if (auto r = AcquireRow(lock, tx, record.id); !r) {
    return r;
  }

  const auto* current = View(tx, record.id);
  if (!current) {
    return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(record.id) + " not found");
  }
  if (current->version != expected_version) {
    return Result::Err(ErrorCode::Conflict, "version mismatch on resource " + std::to_string(record.id));
  }

  auto next             = record;
  next.version          = expected_version + 1;
  tx.staged_[record.id] = std::move(next);
  return Result::Ok();
}

Result MemoryRepository::UpdateField(Transaction& t, int64_t id, model::StructuredField field, const std::string& json,
                                     uint64_t updated_at_ms) {
  auto&            tx = TX(t);
  std::unique_lock lock(mutex_);

  if (auto r = AcquireRow(lock, tx, id); !r) {
    return r;
  }

  const auto* current = View(tx, id);
  if (!current) {
    return Result::Err(ErrorCode::NotFound, "resource " + std::to_string(id) + " not found");
  }

  auto next = *current;
  if (field == model::StructuredField::kHistory) {
    next.history = json;
  } else {
    next.other_info = json;
  }
  next.version += 1;
  next.updated_at_ms = updated_at_ms;
  tx.staged_[id]     = std::move(next);
  return Result::Ok();
}

std::vector<model::ResourceRecord> MemoryRepository::ListChildren(Transaction& t, int64_t parent_id) {
  auto&            tx = TX(t);
  std::scoped_lock lock(mutex_);

  std::map<int64_t, model::ResourceRecord> merged;
  for (const auto& [id, record] : committed_.resources) {
    if (record.parent_id == parent_id) merged[id] = record;
  }
  for (const auto& [id, record] : tx.staged_) {
    if (record.parent_id == parent_id) {
      merged[id] = record;
    } else {
      merged.erase(id);
    }
  }

  std::vector<model::ResourceRecord> out;
  out.reserve(merged.size());
  for (auto& [_, record] : merged) {
    out.push_back(std::move(record));
  }
  return out;
}

Result MemoryRepository::AppendAudit(Transaction& t, const model::AuditRecord& r) {
  TX(t).staged_audit_.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::QueryAudit(Transaction&, int64_t resource_id, uint64_t since_ms, uint64_t after_seq,
                                                             std::size_t limit) {
  std::scoped_lock lock(mutex_);

  std::vector<model::AuditRecord> out;
  for (const auto& entry : committed_.audit) {
    if (out.size() >= limit) break;
    if (entry.resource_id != resource_id || entry.seq <= after_seq || entry.timestamp_ms < since_ms) continue;
    out.push_back(entry);
  }
  return out;
}

} // namespace flowlock::db::memory
