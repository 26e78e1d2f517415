#include <atomic>
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/audit/audit_log.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/lock/memory_lock_store.hpp"

namespace {

using flowlock::audit::AuditEntry;
using flowlock::audit::AuditLog;
using flowlock::db::ErrorCode;
using flowlock::db::Repository;
using flowlock::db::Result;
using flowlock::db::Transaction;
using flowlock::db::model::AuditRecord;
using flowlock::db::model::ResourceRecord;
using flowlock::db::model::StructuredField;

// Memory repository whose audit table can be switched off.
class BrokenAuditRepository : public Repository {
 public:
  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertResource(Transaction& tx, const ResourceRecord& record) override {
    return inner_.InsertResource(tx, record);
  }

  std::optional<ResourceRecord> GetResource(Transaction& tx, int64_t id) override {
    return inner_.GetResource(tx, id);
  }

  Result LockForUpdate(Transaction& tx, int64_t id, ResourceRecord* out) override {
    return inner_.LockForUpdate(tx, id, out);
  }

  Result UpdateResource(Transaction& tx, const ResourceRecord& record, uint64_t expected_version) override {
    return inner_.UpdateResource(tx, record, expected_version);
  }

  Result UpdateField(Transaction& tx, int64_t id, StructuredField field, const std::string& json, uint64_t updated_at_ms) override {
    return inner_.UpdateField(tx, id, field, json, updated_at_ms);
  }

  std::vector<ResourceRecord> ListChildren(Transaction& tx, int64_t parent_id) override {
    return inner_.ListChildren(tx, parent_id);
  }

  Result AppendAudit(Transaction& tx, const AuditRecord& record) override {
    if (broken_.load()) {
      return Result::Err(ErrorCode::IOError, "audit table unavailable");
    }
    return inner_.AppendAudit(tx, record);
  }

  std::vector<AuditRecord> QueryAudit(Transaction& tx, int64_t resource_id, uint64_t since_ms, uint64_t after_seq, std::size_t limit) override {
    return inner_.QueryAudit(tx, resource_id, since_ms, after_seq, limit);
  }

  void Break(bool broken) {
    broken_ = broken;
  }

 private:
  flowlock::db::memory::MemoryRepository inner_;
  std::atomic<bool>                      broken_{false};
};

AuditEntry Entry(int64_t resource_id, const std::string& operation, uint64_t timestamp_ms) {
  AuditEntry entry;
  entry.resource_id    = resource_id;
  entry.entity_type    = "job";
  entry.operation_type = operation;
  entry.outcome        = "applied";
  entry.actor          = "tester";
  entry.correlation_id = "corr-" + operation;
  entry.timestamp_ms   = timestamp_ms;
  return entry;
}

void TestCursorPagesInSeqOrder() {
  auto     repo = std::make_shared<flowlock::db::memory::MemoryRepository>();
  AuditLog log(repo, 3);

  for (int i = 0; i < 10; ++i) {
    log.Append(Entry(1, "op" + std::to_string(i), 1000 + i));
    log.Append(Entry(2, "other" + std::to_string(i), 1000 + i));
  }
  assert(log.FailedAppends() == 0);

  auto     cursor   = log.Query(1);
  uint64_t last_seq = 0;
  int      seen     = 0;
  while (auto row = cursor.Next()) {
    assert(row->resource_id == 1);
    assert(row->seq > last_seq);
    assert(row->operation_type == "op" + std::to_string(seen));
    last_seq = row->seq;
    ++seen;
  }
  assert(seen == 10);
  assert(!cursor.Next());

  // page size equal to the row count still terminates
  auto exact = log.Query(2, 0, 10);
  seen       = 0;
  while (exact.Next()) {
    ++seen;
  }
  assert(seen == 10);
}

void TestSinceFilter() {
  auto     repo = std::make_shared<flowlock::db::memory::MemoryRepository>();
  AuditLog log(repo);

  log.Append(Entry(5, "early", 100));
  log.Append(Entry(5, "middle", 200));
  log.Append(Entry(5, "late", 300));

  auto cursor = log.Query(5, 200);
  auto first  = cursor.Next();
  auto second = cursor.Next();
  assert(first && first->operation_type == "middle");
  assert(second && second->operation_type == "late");
  assert(!cursor.Next());

  assert(log.History(6).empty());
}

void TestAppendStampsTimestamp() {
  auto     repo = std::make_shared<flowlock::db::memory::MemoryRepository>();
  AuditLog log(repo);

  log.Append(Entry(7, "stamped", 0));
  auto rows = log.History(7);
  assert(rows.size() == 1);
  assert(rows[0].timestamp_ms > 0);
  assert(rows[0].correlation_id == "corr-stamped");
}

void TestAppendFailureIsCountedNotThrown() {
  auto     repo = std::make_shared<BrokenAuditRepository>();
  AuditLog log(repo);

  repo->Break(true);
  log.Append(Entry(8, "lost", 100));
  assert(log.FailedAppends() == 1);

  repo->Break(false);
  log.Append(Entry(8, "kept", 200));
  assert(log.FailedAppends() == 1);

  auto rows = log.History(8);
  assert(rows.size() == 1);
  assert(rows[0].operation_type == "kept");
}

void TestBrokenAuditNeverUndoesTheChange() {
  auto repo   = std::make_shared<BrokenAuditRepository>();
  auto config = flowlock::config::ConfigLoader::Defaults();
  auto engine = flowlock::factory::AssembleEngine(config, repo, std::make_unique<flowlock::lock::MemoryLockStore>());

  ResourceRecord ticket;
  ticket.id    = 9;
  ticket.state = "NEW";
  engine.tickets->Create(ticket, "seed");

  repo->Break(true);
  flowlock::workflow::TransitionRequest request;
  request.resource_id = 9;
  request.to_state    = "OPEN";
  request.actor       = "agent";
  auto opened         = engine.tickets->Transition(request);
  assert(opened.state == "OPEN");
  assert(engine.audit->FailedAppends() == 1);

  repo->Break(false);
  assert(engine.tickets->Get(9).version == 1);
  auto rows = engine.audit->History(9);
  assert(rows.size() == 1);
  assert(rows[0].operation_type == "create");
}

} // namespace

int main() {
  TestCursorPagesInSeqOrder();
  TestSinceFilter();
  TestAppendStampsTimestamp();
  TestAppendFailureIsCountedNotThrown();
  TestBrokenAuditNeverUndoesTheChange();

  std::cout << "flowlock_unit_audit_log: pass\n";
  return 0;
}
