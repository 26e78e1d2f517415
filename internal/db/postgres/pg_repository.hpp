#pragma once

#include <chrono>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace flowlock::db::postgres {

class PgRepository final : public db::Repository {
 public:
  PgRepository(std::shared_ptr<PgPool> pool, std::chrono::milliseconds lock_wait);

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
  std::shared_ptr<PgPool>   pool_;
  std::chrono::milliseconds lock_wait_;

  static PgTransaction& TX(Transaction& t);
  static Result         Translate(const std::exception& e);
};

} // namespace flowlock::db::postgres
