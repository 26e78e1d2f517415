#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/resource_record.hpp"

namespace flowlock::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - LockForUpdate holds the row until commit/rollback, bounded by the
    configured lock-wait timeout (Busy on timeout)
  - UpdateResource is a compare-and-set on version; zero affected rows
    is Conflict, never a silent success
  - Audit rows are append-only

  The DB is the source of truth for:
    resource state and version
    structured fields
    audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  // Throws DbException (Busy / IOError) when a transaction cannot be opened.
  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Resources
  // ---------------------------------------------------------------------

  virtual Result InsertResource(Transaction&, const model::ResourceRecord&) = 0;

  virtual std::optional<model::ResourceRecord> GetResource(Transaction&, int64_t id) = 0;

  // Exclusive row lock. NotFound when the row is missing, Busy on lock-wait timeout.
  virtual Result LockForUpdate(Transaction&, int64_t id, model::ResourceRecord* out) = 0;

  // Writes every column of record and sets version = expected_version + 1
  // where version still equals expected_version.
  virtual Result UpdateResource(Transaction&, const model::ResourceRecord& record, uint64_t expected_version) = 0;

  // Rewrites one structured field, bumps version by one and stamps updated_at_ms.
  virtual Result UpdateField(Transaction&, int64_t id, model::StructuredField field, const std::string& json, uint64_t updated_at_ms) = 0;

  // Children of parent_id ordered by ascending id.
  virtual std::vector<model::ResourceRecord> ListChildren(Transaction&, int64_t parent_id) = 0;

  // ---------------------------------------------------------------------
  // Audit
  // ---------------------------------------------------------------------

  virtual Result AppendAudit(Transaction&, const model::AuditRecord&) = 0;

  // Rows for resource_id with timestamp_ms >= since_ms and seq > after_seq,
  // ordered by seq, at most limit rows.
  virtual std::vector<model::AuditRecord> QueryAudit(Transaction&, int64_t resource_id, uint64_t since_ms, uint64_t after_seq,
                                                     std::size_t limit) = 0;
};

} // namespace flowlock::db
