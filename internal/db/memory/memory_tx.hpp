#pragma once

#include <cstdint>
#include <map>
#include <unordered_set>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace flowlock::db::memory {

/*
  Transaction = write set + owned rows
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return finished_;
  }

 private:
  friend class MemoryRepository;

  // Caller holds repo_.mutex_.
  void ReleaseRowsLocked();

  MemoryRepository&                        repo_;
  std::map<int64_t, model::ResourceRecord> staged_;
  std::vector<model::AuditRecord>          staged_audit_;
  std::unordered_set<int64_t>              owned_rows_;
  bool                                     finished_ = false;
};

} // namespace flowlock::db::memory
