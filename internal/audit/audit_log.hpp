#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flowlock::audit {

using AuditEntry = db::model::AuditRecord;

inline constexpr std::string_view kOutcomeApplied  = "applied";
inline constexpr std::string_view kOutcomeRejected = "rejected";
inline constexpr std::string_view kOutcomeFailed   = "failed";

/*
  Lazy, read-only walk over one resource's audit rows in seq order.
  Each page is fetched in its own short transaction when the buffer runs dry.
*/
class AuditCursor {
 public:
  AuditCursor(std::shared_ptr<db::Repository> repo, int64_t resource_id, uint64_t since_ms, std::size_t page_size);

  std::optional<AuditEntry> Next();

 private:
  void FetchPage();

  std::shared_ptr<db::Repository> repo_;
  int64_t                         resource_id_;
  uint64_t                        since_ms_;
  std::size_t                     page_size_;
  uint64_t                        after_seq_ = 0;
  std::deque<AuditEntry>          buffer_;
  bool                            exhausted_ = false;
};

/*
  AuditLog

  Append-only trail of every transition attempt. Append runs in its own
  transaction after the business transaction has finished: a failure is
  logged with the correlation id and counted, never thrown, and never undoes
  the change it describes.
*/
class AuditLog {
 public:
  AuditLog(std::shared_ptr<db::Repository> repo, std::size_t page_size = 100);

  // Stamps timestamp_ms when unset.
  void Append(AuditEntry entry);

  AuditCursor Query(int64_t resource_id, uint64_t since_ms = 0, std::size_t page_size = 0) const;

  std::vector<AuditEntry> History(int64_t resource_id) const;

  uint64_t FailedAppends() const {
    return failed_appends_.load();
  }

 private:
  std::shared_ptr<db::Repository> repo_;
  std::size_t                     page_size_;
  std::atomic<uint64_t>           failed_appends_{0};
};

} // namespace flowlock::audit
