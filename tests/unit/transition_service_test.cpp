#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/lock/memory_lock_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowlock::db::Repository;
using flowlock::db::Result;
using flowlock::db::Transaction;
using flowlock::db::model::AuditRecord;
using flowlock::db::model::ResourceRecord;
using flowlock::db::model::StructuredField;
using flowlock::factory::Engine;
using flowlock::workflow::LockMode;
using flowlock::workflow::TransitionOptions;
using flowlock::workflow::TransitionRequest;

flowlock::config::RuntimeConfig TestConfig() {
  auto config = flowlock::config::ConfigLoader::Defaults();
  config.mutable_locks()->mutable_poll_interval()->set_seconds(0);
  config.mutable_locks()->mutable_poll_interval()->set_nanos(2000000);
  return config;
}

Engine MakeEngine() {
  return flowlock::factory::BuildEngine(TestConfig());
}

/*
  Memory repository whose audit appends stall for one actor, so a second
  writer gets a chance to overtake the first one's audit row.
*/
class SlowAuditRepository : public Repository {
 public:
  explicit SlowAuditRepository(std::string slow_actor) : slow_actor_(std::move(slow_actor)) {
  }

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
    if (record.actor == slow_actor_) {
      stalled_ = true;
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return inner_.AppendAudit(tx, record);
  }

  std::vector<AuditRecord> QueryAudit(Transaction& tx, int64_t resource_id, uint64_t since_ms, uint64_t after_seq, std::size_t limit) override {
    return inner_.QueryAudit(tx, resource_id, since_ms, after_seq, limit);
  }

  bool stalled() const {
    return stalled_.load();
  }

 private:
  flowlock::db::memory::MemoryRepository inner_;
  std::string                            slow_actor_;
  std::atomic<bool>                      stalled_{false};
};

uint64_t VersionIn(const std::string& described) {
  const auto pos = described.find("\"version\":");
  assert(pos != std::string::npos);
  return std::stoull(described.substr(pos + 10));
}

ResourceRecord SeedTicket(Engine& engine, int64_t id, const std::string& state, const std::string& assignee = "") {
  ResourceRecord record;
  record.id       = id;
  record.state    = state;
  record.assignee = assignee;
  return engine.tickets->Create(record, "seed");
}

TransitionRequest Request(int64_t id, const std::string& to, const std::string& actor = "tester") {
  TransitionRequest request;
  request.resource_id = id;
  request.to_state    = to;
  request.actor       = actor;
  return request;
}

void TestTransitionAdvancesVersionAndAudits() {
  auto engine  = MakeEngine();
  auto created = SeedTicket(engine, 1, "NEW");
  assert(created.version == 0);
  assert(created.kind == "ticket");

  auto opened = engine.tickets->Transition(Request(1, "OPEN"));
  assert(opened.state == "OPEN");
  assert(opened.version == 1);
  assert(opened.updated_at_ms >= created.updated_at_ms);

  auto held = engine.tickets->Transition(Request(1, "ONHOLD"));
  assert(held.version == 2);

  auto rows = engine.audit->History(1);
  assert(rows.size() == 3);
  assert(rows[0].operation_type == "create");
  assert(rows[1].operation_type == "transition");
  assert(rows[1].outcome == "applied");
  assert(rows[1].actor == "tester");
  assert(!rows[1].correlation_id.empty());
  assert(rows[1].old_value.find("NEW") != std::string::npos);
  assert(rows[1].new_value.find("OPEN") != std::string::npos);
  assert(rows[1].seq < rows[2].seq);
}

void TestInvalidTransitionIsRejectedAndAudited() {
  auto engine = MakeEngine();
  SeedTicket(engine, 2, "NEW");

  auto request           = Request(2, "CLOSED");
  request.correlation_id = "corr-invalid";

  bool threw = false;
  try {
    engine.tickets->Transition(request);
  } catch (const flowlock::util::InvalidTransitionError& e) {
    threw = true;
    assert(e.correlation_id() == "corr-invalid");
  }
  assert(threw);

  auto ticket = engine.tickets->Get(2);
  assert(ticket.state == "NEW");
  assert(ticket.version == 0);

  auto rows = engine.audit->History(2);
  assert(rows.size() == 2);
  assert(rows[1].outcome == "rejected");
  assert(rows[1].new_value == "CLOSED");
  assert(rows[1].correlation_id == "corr-invalid");

  // unknown state is a validation error, even without table validation
  TransitionOptions lax;
  lax.validate = false;
  threw        = false;
  try {
    engine.tickets->Transition(Request(2, "ARCHIVED"), lax);
  } catch (const flowlock::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  // validate=false skips the table check
  auto forced = engine.tickets->Transition(Request(2, "CLOSED"), lax);
  assert(forced.state == "CLOSED");
  assert(forced.version == 1);
}

void TestFromStateMismatch() {
  auto engine = MakeEngine();
  SeedTicket(engine, 3, "NEW");

  auto request       = Request(3, "CANCELLED");
  request.from_state = "OPEN";

  bool threw = false;
  try {
    engine.tickets->Transition(request);
  } catch (const flowlock::util::InvalidTransitionError&) {
    threw = true;
  }
  assert(threw);
  assert(engine.tickets->Get(3).state == "NEW");

  request.from_state = "NEW";
  assert(engine.tickets->Transition(request).state == "CANCELLED");
}

void TestResolutionPreconditionThroughService() {
  auto engine = MakeEngine();
  SeedTicket(engine, 4, "OPEN");

  bool threw = false;
  try {
    engine.tickets->Transition(Request(4, "RESOLVED"));
  } catch (const flowlock::util::InvalidTransitionError&) {
    threw = true;
  }
  assert(threw);

  engine.ticket_workflow->Assign(4, "agent-9", "lead");
  auto resolved = engine.tickets->Transition(Request(4, "RESOLVED"));
  assert(resolved.state == "RESOLVED");
  assert(resolved.assignee == "agent-9");
  assert(resolved.version == 2);
}

void TestMissingAndWrongKind() {
  auto engine = MakeEngine();

  bool threw = false;
  try {
    engine.tickets->Transition(Request(404, "OPEN"));
  } catch (const flowlock::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);

  ResourceRecord job;
  job.id    = 5;
  job.state = "ASSIGNED";
  engine.jobs->Create(job, "seed");

  threw = false;
  try {
    engine.tickets->Get(5);
  } catch (const flowlock::util::NotFoundError&) {
    threw = true;
  }
  assert(threw);

  // duplicate create
  threw = false;
  try {
    engine.jobs->Create(job, "seed");
  } catch (const flowlock::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestOptimisticWriteDetectsConcurrentChange() {
  auto engine = MakeEngine();
  SeedTicket(engine, 6, "NEW");

  TransitionOptions optimistic;
  optimistic.lock_mode = LockMode::kOptimistic;

  // first attempt loses a race against a pessimistic writer; the retry wins
  int  calls  = 0;
  auto result = engine.tickets->Mutate(
      6, "bump", "optimist",
      [&](ResourceRecord& ticket) {
        if (++calls == 1) {
          engine.tickets->Mutate(6, "bump", "rival", [](ResourceRecord& t) { t.level += 10; });
        }
        ticket.level += 1;
      },
      optimistic);

  assert(calls == 2);
  assert(result.level == 11);
  assert(result.version == 2);

  // with a single attempt the stale write surfaces as exhaustion
  optimistic.policy = flowlock::retry::RetryPolicy{"single", 1, std::chrono::milliseconds(1), std::chrono::milliseconds(1),
                                                   std::chrono::milliseconds(1)};
  bool threw        = false;
  try {
    engine.tickets->Mutate(
        6, "bump", "optimist",
        [&](ResourceRecord& ticket) {
          engine.tickets->Mutate(6, "bump", "rival", [](ResourceRecord& t) { t.level += 1; });
          ticket.level += 1;
        },
        optimistic);
  } catch (const flowlock::util::ServiceUnavailableError& e) {
    threw = true;
    assert(e.last_cause() == flowlock::util::ErrorKind::kStaleObject);
  }
  assert(threw);

  auto ticket = engine.tickets->Get(6);
  assert(ticket.level == 12);
  assert(ticket.version == 3);
}

void TestVersionIsMonotonicUnderConcurrentTransitions() {
  auto engine = MakeEngine();
  SeedTicket(engine, 7, "NEW");

  constexpr int            kThreads = 50;
  std::atomic<int>         inside{0};
  std::atomic<bool>        overlapped{false};
  std::vector<std::thread> threads;

  TransitionOptions options;
  options.policy = flowlock::retry::Policies::kHighContention;

  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&, i] {
      engine.tickets->Mutate(
          7, "count", "worker-" + std::to_string(i),
          [&](ResourceRecord& ticket) {
            if (++inside > 1) overlapped = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ticket.level += 1;
            --inside;
          },
          options);
    });
  }
  for (auto& t : threads) t.join();

  auto ticket = engine.tickets->Get(7);
  assert(!overlapped.load());
  assert(ticket.level == kThreads);
  assert(ticket.version == kThreads);

  // versions observed in the audit trail strictly increase
  uint64_t last = 0;
  for (const auto& row : engine.audit->History(7)) {
    if (row.operation_type != "count") continue;
    assert(row.outcome == "applied");
    const auto version = VersionIn(row.new_value);
    assert(version > last);
    last = version;
  }
  assert(last == kThreads);
}

void TestAuditRowIsWrittenBeforeTheMutexIsReleased() {
  auto repo   = std::make_shared<SlowAuditRepository>("slow");
  auto engine = flowlock::factory::AssembleEngine(TestConfig(), repo, std::make_unique<flowlock::lock::MemoryLockStore>());
  SeedTicket(engine, 8, "OPEN");

  std::thread slow([&] { engine.ticket_workflow->Escalate(8, std::nullopt, "slow"); });
  while (!repo->stalled()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  // slow has committed version 1 and is still writing its audit row
  std::thread fast([&] { engine.ticket_workflow->Escalate(8, std::nullopt, "fast"); });
  slow.join();
  fast.join();

  std::vector<flowlock::audit::AuditEntry> escalations;
  for (const auto& row : engine.audit->History(8)) {
    if (row.operation_type == "escalate") escalations.push_back(row);
  }
  assert(escalations.size() == 2);
  assert(escalations[0].actor == "slow");
  assert(VersionIn(escalations[0].new_value) == 1);
  assert(escalations[1].actor == "fast");
  assert(VersionIn(escalations[1].new_value) == 2);
  assert(escalations[0].seq < escalations[1].seq);
}

void TestArgumentErrorsAreAuditedAsRejected() {
  auto engine = MakeEngine();
  SeedTicket(engine, 9, "NEW");

  auto request           = Request(9, "");
  request.correlation_id = "corr-empty";
  bool threw             = false;
  try {
    engine.tickets->Transition(request);
  } catch (const flowlock::util::ValidationError& e) {
    threw = true;
    assert(e.correlation_id() == "corr-empty");
  }
  assert(threw);
  auto rows = engine.audit->History(9);
  assert(rows.back().operation_type == "transition");
  assert(rows.back().outcome == "rejected");
  assert(rows.back().correlation_id == "corr-empty");

  ResourceRecord tour;
  tour.id    = 10;
  tour.state = "INPROGRESS";
  engine.jobs->Create(tour, "seed");
  ResourceRecord checkpoint;
  checkpoint.id        = 11;
  checkpoint.state     = "ASSIGNED";
  checkpoint.parent_id = 10;
  engine.jobs->Create(checkpoint, "seed");

  threw = false;
  try {
    engine.jobs->UpdateCoupledParentChild(10, {}, 10, "guard");
  } catch (const flowlock::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  rows = engine.audit->History(10);
  assert(rows.back().operation_type == "update_parent_child");
  assert(rows.back().outcome == "rejected");

  threw = false;
  try {
    engine.jobs->BulkTransition(10, {}, "dispatcher");
  } catch (const flowlock::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    engine.jobs->BulkTransition(10, {{11, std::string("INPROGRESS"), {}}, {11, std::string("STANDBY"), {}}}, "dispatcher");
  } catch (const flowlock::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  int rejected_bulk = 0;
  for (const auto& row : engine.audit->History(10)) {
    if (row.operation_type == "bulk_transition" && row.outcome == "rejected") ++rejected_bulk;
  }
  assert(rejected_bulk == 2);
  assert(engine.jobs->Get(10).version == 0);
  assert(engine.jobs->Get(11).version == 0);
}

} // namespace

int main() {
  TestTransitionAdvancesVersionAndAudits();
  TestInvalidTransitionIsRejectedAndAudited();
  TestFromStateMismatch();
  TestResolutionPreconditionThroughService();
  TestMissingAndWrongKind();
  TestOptimisticWriteDetectsConcurrentChange();
  TestVersionIsMonotonicUnderConcurrentTransitions();
  TestAuditRowIsWrittenBeforeTheMutexIsReleased();
  TestArgumentErrorsAreAuditedAsRejected();

  std::cout << "flowlock_unit_transition_service: pass\n";
  return 0;
}
