#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/concurrency/row_lock.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"

namespace {

using flowlock::db::ErrorCode;
using flowlock::db::Repository;
using flowlock::db::model::AuditRecord;
using flowlock::db::model::ResourceRecord;
using flowlock::db::model::StructuredField;
using flowlock::factory::Engine;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string             name;
  std::function<Engine()> make_engine;
  bool                    supports_restart = false;
  std::function<void()>   cleanup;
};

flowlock::config::RuntimeConfig BaseConfig() {
  auto config = flowlock::config::ConfigLoader::Defaults();
  config.mutable_locks()->mutable_poll_interval()->set_seconds(0);
  config.mutable_locks()->mutable_poll_interval()->set_nanos(2000000);
  return config;
}

ResourceRecord Job(int64_t id, const std::string& state, int64_t parent_id = 0) {
  ResourceRecord r;
  r.id            = id;
  r.kind          = "job";
  r.state         = state;
  r.parent_id     = parent_id;
  r.updated_at_ms = NowMs();
  return r;
}

void VerifyInsertGetAndDuplicate(Repository& repo, int64_t id) {
  {
    auto tx        = repo.Begin();
    auto rec       = Job(id, "ASSIGNED");
    rec.assignee   = "alice";
    rec.other_info = R"({"zone":"north"})";
    assert(repo.InsertResource(*tx, rec));

    // visible to the writing transaction before commit
    auto inside = repo.GetResource(*tx, id);
    assert(inside.has_value());
    assert(inside->assignee == "alice");
    assert(!tx->IsCommitted());
    tx->Commit();
    assert(tx->IsCommitted());
  }

  {
    auto tx  = repo.Begin();
    auto got = repo.GetResource(*tx, id);
    assert(got.has_value());
    assert(got->kind == "job");
    assert(got->state == "ASSIGNED");
    assert(got->version == 0);
    assert(got->parent_id == 0);
    assert(got->other_info.find("north") != std::string::npos);
    assert(!repo.GetResource(*tx, id + 999).has_value());
    tx->Commit();
  }

  // own transaction: a failed statement poisons a postgres transaction
  auto tx  = repo.Begin();
  auto dup = repo.InsertResource(*tx, Job(id, "ASSIGNED"));
  assert(!dup);
  assert(dup.code == ErrorCode::AlreadyExists);
  tx->Rollback();
}

void VerifyVersionedWrite(Repository& repo, int64_t id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertResource(*tx, Job(id, "ASSIGNED")));
    tx->Commit();
  }

  {
    auto           tx = repo.Begin();
    ResourceRecord locked;
    assert(repo.LockForUpdate(*tx, id, &locked));
    assert(locked.version == 0);
    locked.state = "INPROGRESS";
    assert(repo.UpdateResource(*tx, locked, 0));
    tx->Commit();
  }

  {
    auto           tx = repo.Begin();
    ResourceRecord locked;
    assert(repo.LockForUpdate(*tx, id, &locked));
    assert(locked.version == 1);
    assert(locked.state == "INPROGRESS");

    // stale expectation never writes
    auto stale = repo.UpdateResource(*tx, locked, 0);
    assert(!stale);
    assert(stale.code == ErrorCode::Conflict);

    assert(flowlock::concurrency::CheckVersion(repo, *tx, id, 1));
    assert(!flowlock::concurrency::CheckVersion(repo, *tx, id, 0));

    bool threw = false;
    try {
      flowlock::concurrency::WriteVersioned(repo, *tx, locked, 7);
    } catch (const flowlock::util::StaleObjectError&) {
      threw = true;
    }
    assert(threw);
    tx->Rollback();
  }

  auto           tx = repo.Begin();
  ResourceRecord missing;
  auto           res = repo.LockForUpdate(*tx, id + 999, &missing);
  assert(!res);
  assert(res.code == ErrorCode::NotFound);
  tx->Rollback();
}

void VerifyRollbackDiscards(Repository& repo, int64_t id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertResource(*tx, Job(id, "ASSIGNED")));
    tx->Commit();
  }

  {
    auto           tx = repo.Begin();
    ResourceRecord locked;
    assert(repo.LockForUpdate(*tx, id, &locked));
    locked.state = "STANDBY";
    assert(repo.UpdateResource(*tx, locked, locked.version));
    tx->Rollback();
  }

  {
    // destructor rolls back too
    auto           tx = repo.Begin();
    ResourceRecord locked;
    assert(repo.LockForUpdate(*tx, id, &locked));
    assert(repo.UpdateField(*tx, id, StructuredField::kOtherInfo, R"({"lost":true})", NowMs()));
  }

  auto tx  = repo.Begin();
  auto got = repo.GetResource(*tx, id);
  assert(got.has_value());
  assert(got->state == "ASSIGNED");
  assert(got->version == 0);
  assert(got->other_info.find("lost") == std::string::npos);
  tx->Commit();
}

void VerifyChildrenAndFields(Repository& repo, int64_t parent) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertResource(*tx, Job(parent, "INPROGRESS")));
    for (int64_t child : {parent + 3, parent + 1, parent + 2}) {
      assert(repo.InsertResource(*tx, Job(child, "ASSIGNED", parent)));
    }
    tx->Commit();
  }

  auto tx       = repo.Begin();
  auto children = repo.ListChildren(*tx, parent);
  assert(children.size() == 3);
  assert(children[0].id == parent + 1);
  assert(children[1].id == parent + 2);
  assert(children[2].id == parent + 3);
  assert(repo.ListChildren(*tx, parent + 1).empty());

  assert(repo.UpdateField(*tx, parent + 1, StructuredField::kHistory, R"({"job_history":[1,2]})", 4242));
  auto child = repo.GetResource(*tx, parent + 1);
  assert(child->version == 1);
  assert(child->updated_at_ms == 4242);
  assert(child->history.find("job_history") != std::string::npos);
  assert(child->other_info == "{}");
  tx->Commit();
}

void VerifyAuditQuery(Repository& repo, int64_t id) {
  {
    auto tx = repo.Begin();
    for (int i = 0; i < 5; ++i) {
      AuditRecord row;
      row.resource_id    = id;
      row.entity_type    = "job";
      row.operation_type = "op" + std::to_string(i);
      row.outcome        = "applied";
      row.actor          = "tester";
      row.correlation_id = "corr";
      row.timestamp_ms   = 1000 + i * 100;
      assert(repo.AppendAudit(*tx, row));
    }
    tx->Commit();
  }

  auto tx  = repo.Begin();
  auto all = repo.QueryAudit(*tx, id, 0, 0, 100);
  assert(all.size() == 5);
  for (std::size_t i = 1; i < all.size(); ++i) {
    assert(all[i].seq > all[i - 1].seq);
  }

  auto recent = repo.QueryAudit(*tx, id, 1200, 0, 100);
  assert(recent.size() == 3);
  assert(recent[0].operation_type == "op2");

  auto page = repo.QueryAudit(*tx, id, 0, all[1].seq, 2);
  assert(page.size() == 2);
  assert(page[0].operation_type == "op2");
  assert(page[1].operation_type == "op3");
  tx->Commit();
}

void VerifyLockStore(Engine& engine, int64_t id) {
  const auto key    = engine.mutex->ResourceKey("job", id);
  auto       handle = engine.mutex->Acquire(key);
  assert(engine.mutex->Holder(key) == handle.token);

  bool threw = false;
  try {
    engine.mutex->Acquire(key, std::chrono::seconds(5), std::chrono::milliseconds(30));
  } catch (const flowlock::util::LockAcquisitionError&) {
    threw = true;
  }
  assert(threw);

  assert(engine.mutex->Release(handle));
  assert(!engine.mutex->Holder(key).has_value());
  assert(!engine.mutex->Release(handle));
}

void VerifyEngineContention(Engine& engine, int64_t id) {
  ResourceRecord ticket;
  ticket.id    = id;
  ticket.state = "OPEN";
  engine.tickets->Create(ticket, "seed");

  constexpr int            kWorkers = 6;
  std::vector<std::thread> threads;
  for (int i = 0; i < kWorkers; ++i) {
    threads.emplace_back([&engine, id] { engine.ticket_workflow->Escalate(id, std::nullopt, "worker"); });
  }
  for (auto& t : threads) t.join();

  auto after = engine.tickets->Get(id);
  assert(after.level == kWorkers);
  assert(after.version == static_cast<uint64_t>(kWorkers));
  assert(engine.audit->History(id).size() == kWorkers + 1);
}

void VerifyRestartDurability(BackendFactory& backend, int64_t id) {
  if (!backend.supports_restart) {
    return;
  }

  {
    auto engine = backend.make_engine();
    auto job    = Job(id, "ASSIGNED");
    engine.jobs->Create(job, "seed");
    engine.job_workflow->Start(id, "guard");
  }

  auto engine = backend.make_engine();
  auto job    = engine.jobs->Get(id);
  assert(job.state == "INPROGRESS");
  assert(job.version == 1);
  assert(job.started_at_ms > 0);

  auto rows = engine.audit->History(id);
  assert(rows.size() == 2);
  assert(rows[0].operation_type == "create");
  assert(rows[1].operation_type == "transition");
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_engine      = []() { return flowlock::factory::BuildEngine(BaseConfig()); },
      .supports_restart = false,
      .cleanup          = []() {},
  };
}

#if FLOWLOCK_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("flowlock_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  return BackendFactory{
      .name = "sqlite",
      .make_engine =
          [db_path]() {
            auto config  = BaseConfig();
            auto* sqlite = config.mutable_database()->mutable_sqlite();
            sqlite->set_path(db_path);
            sqlite->set_wal_mode(true);
            return flowlock::factory::BuildEngine(config);
          },
      .supports_restart = true,
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
  };
}
#endif

#if FLOWLOCK_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FLOWLOCK_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FLOWLOCK_TEST_POSTGRES_URI is not set");
  }

  auto conninfo = std::string(uri);
  return BackendFactory{
      .name = "postgres",
      .make_engine =
          [conninfo]() {
            auto  config   = BaseConfig();
            auto* postgres = config.mutable_database()->mutable_postgres();
            postgres->set_connection_uri(conninfo);
            postgres->set_max_connections(8);
            return flowlock::factory::BuildEngine(config);
          },
      .supports_restart = true,
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";

  // ids unique per run so a persistent postgres database can be reused
  const int64_t base = static_cast<int64_t>(NowMs() % 1000000000) * 1000;

  {
    auto  engine = backend.make_engine();
    auto& repo   = *engine.repository;

    VerifyInsertGetAndDuplicate(repo, base + 1);
    VerifyVersionedWrite(repo, base + 10);
    VerifyRollbackDiscards(repo, base + 20);
    VerifyChildrenAndFields(repo, base + 30);
    VerifyAuditQuery(repo, base + 40);
    VerifyLockStore(engine, base + 50);
    VerifyEngineContention(engine, base + 60);
  }

  VerifyRestartDurability(backend, base + 70);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if FLOWLOCK_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if FLOWLOCK_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "flowlock_integration_repository_parity: pass\n";
  return 0;
}
