#include "memory_tx.hpp"

#include <mutex>

namespace flowlock::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

void MemoryTransaction::Commit() {
  {
    std::scoped_lock lock(repo_.mutex_);
    auto&            state = repo_.committed_;
    for (auto& [id, record] : staged_) {
      state.resources[id] = std::move(record);
    }
    for (auto& entry : staged_audit_) {
      entry.seq = state.next_audit_seq++;
      state.audit.push_back(std::move(entry));
    }
    ReleaseRowsLocked();
  }
  staged_.clear();
  staged_audit_.clear();
  finished_ = true;
  repo_.cv_.notify_all();
}

void MemoryTransaction::Rollback() {
  {
    std::scoped_lock lock(repo_.mutex_);
    ReleaseRowsLocked();
  }
  staged_.clear();
  staged_audit_.clear();
  finished_ = true;
  repo_.cv_.notify_all();
}

void MemoryTransaction::ReleaseRowsLocked() {
  for (auto id : owned_rows_) {
    auto it = repo_.row_owner_.find(id);
    if (it != repo_.row_owner_.end() && it->second == this) {
      repo_.row_owner_.erase(it);
    }
  }
  owned_rows_.clear();
}

} // namespace flowlock::db::memory
