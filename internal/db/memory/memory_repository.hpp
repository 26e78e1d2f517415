#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flowlock::db::memory {

class MemoryTransaction;

/*
  In-process repository.

  Committed rows live in one map guarded by mutex_. A transaction stages its
  writes privately and owns every row it locked or wrote in row_owner_.
  Another transaction touching an owned row waits on cv_ until the owner
  commits or rolls back, or until lock_wait expires (Busy).
*/
class MemoryRepository final : public db::Repository {
 public:
  explicit MemoryRepository(std::chrono::milliseconds lock_wait = std::chrono::seconds(5));

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertResource(Transaction&, const model::ResourceRecord&) override;
  std::optional<model::ResourceRecord> GetResource(Transaction&, int64_t id) override;
  Result                               LockForUpdate(Transaction&, int64_t id, model::ResourceRecord* out) override;
  Result UpdateResource(Transaction&, const model::ResourceRecord& record, uint64_t expected_version) override;
  Result UpdateField(Transaction&, int64_t id, model::StructuredField field, const std::string& json, uint64_t updated_at_ms) override;
  std::vector<model::ResourceRecord> ListChildren(Transaction&, int64_t parent_id) override;

  Result                          AppendAudit(Transaction&, const model::AuditRecord&) override;
  std::vector<model::AuditRecord> QueryAudit(Transaction&, int64_t resource_id, uint64_t since_ms, uint64_t after_seq,
                                             std::size_t limit) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<int64_t, model::ResourceRecord> resources;
    std::vector<model::AuditRecord>                    audit;
    uint64_t                                           next_audit_seq = 1;
  };

  // Caller holds mutex_ through lock.
  Result AcquireRow(std::unique_lock<std::mutex>& lock, MemoryTransaction& tx, int64_t id);

  // Staged row of tx, else committed row. Caller holds mutex_.
  const model::ResourceRecord* View(const MemoryTransaction& tx, int64_t id) const;

  std::chrono::milliseconds lock_wait_;

  std::mutex                                            mutex_;
  std::condition_variable                               cv_;
  State                                                 committed_;
  std::unordered_map<int64_t, const MemoryTransaction*> row_owner_;
};

} // namespace flowlock::db::memory
