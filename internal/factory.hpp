#pragma once

#include <memory>
#include <string_view>

#include "internal/audit/audit_log.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fields/field_updater.hpp"
#include "internal/lock/distributed_mutex.hpp"
#include "internal/lock/lock_store.hpp"
#include "internal/retry/retry_executor.hpp"
#include "internal/workflow/job_workflow.hpp"
#include "internal/workflow/ticket_workflow.hpp"
#include "internal/workflow/transition_service.hpp"

namespace flowlock::factory {

/*
  Engine

  Owns every long-lived object of one engine instance. Components hold
  references into each other, so members are declared leaves first and
  torn down in reverse.
*/
struct Engine {
  std::shared_ptr<db::Repository>         repository;
  std::unique_ptr<lock::LockStore>        lock_store;
  std::unique_ptr<lock::DistributedMutex> mutex;
  std::unique_ptr<audit::AuditLog>        audit;
  std::unique_ptr<retry::RetryExecutor>   retry;

  std::unique_ptr<fields::FieldUpdater> job_fields;
  std::unique_ptr<fields::FieldUpdater> ticket_fields;

  std::unique_ptr<workflow::TransitionService> jobs;
  std::unique_ptr<workflow::TransitionService> tickets;

  std::unique_ptr<workflow::JobWorkflow>    job_workflow;
  std::unique_ptr<workflow::TicketWorkflow> ticket_workflow;

  // "job" | "ticket"; anything else is a ValidationError.
  workflow::TransitionService& ServiceFor(std::string_view entity_type) const;
  fields::FieldUpdater&        FieldsFor(std::string_view entity_type) const;
};

/*
  BuildEngine

  Composition root. Picks the database backend from config, bootstraps its
  schema, and wires the lock store, mutex, audit log and both workflows on
  top of it. This is the only place that knows concrete backend types.
*/
Engine BuildEngine(const config::RuntimeConfig& config);

// Wires an engine over an already constructed repository and lock store.
Engine AssembleEngine(const config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                      std::unique_ptr<lock::LockStore> lock_store);

} // namespace flowlock::factory
