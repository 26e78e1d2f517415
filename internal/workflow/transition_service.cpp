#include "transition_service.hpp"

#include <algorithm>
#include <set>

#include "internal/concurrency/critical_section.hpp"
#include "internal/fields/structured_field.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace flowlock::workflow {

namespace {

std::string_view OutcomeFor(util::ErrorKind kind) {
  switch (kind) {
    case util::ErrorKind::kValidation:
    case util::ErrorKind::kInvalidTransition:
    case util::ErrorKind::kNotFound:
    case util::ErrorKind::kSecurity:
      return audit::kOutcomeRejected;
    default:
      return audit::kOutcomeFailed;
  }
}

bool SameRow(const ResourceRecord& a, const ResourceRecord& b) {
  return a.state == b.state && a.level == b.level && a.assignee == b.assignee && a.started_at_ms == b.started_at_ms &&
         a.completed_at_ms == b.completed_at_ms && a.other_info == b.other_info && a.history == b.history;
}

} // namespace

std::string Describe(const ResourceRecord& record) {
  google::protobuf::Struct summary;
  auto&                    fields = *summary.mutable_fields();
  fields["state"].set_string_value(record.state);
  fields["version"].set_number_value(static_cast<double>(record.version));
  fields["level"].set_number_value(static_cast<double>(record.level));
  fields["assignee"].set_string_value(record.assignee);
  return fields::SerializeField(summary);
}

TransitionService::TransitionService(std::shared_ptr<const StateMachine> machine, std::shared_ptr<db::Repository> repo,
                                     lock::DistributedMutex& mutex, audit::AuditLog& audit, retry::RetryExecutor& retry)
    : machine_(std::move(machine)), repo_(std::move(repo)), mutex_(mutex), audit_(audit), retry_(retry) {
}

ResourceRecord TransitionService::Read(db::Transaction& tx, int64_t resource_id, bool lock_row) {
  ResourceRecord record;
  if (lock_row) {
    record = concurrency::LockForUpdate(*repo_, tx, resource_id);
  } else {
    auto found = repo_->GetResource(tx, resource_id);
    if (!found) {
      throw util::NotFoundError(std::string(EntityType()) + " " + std::to_string(resource_id) + " not found");
    }
    record = std::move(*found);
  }

  if (record.kind != EntityType()) {
    throw util::NotFoundError(std::string(EntityType()) + " " + std::to_string(resource_id) + " not found");
  }
  return record;
}

void TransitionService::ValidateChange(const ResourceRecord& before, ResourceRecord& after, bool validate) const {
  if (after.id != before.id || after.kind != before.kind) {
    throw util::ValidationError("resource identity cannot change");
  }
  if (after.state == before.state) {
    return;
  }
  if (!machine_->IsKnownState(after.state)) {
    throw util::ValidationError("unknown " + std::string(EntityType()) + " state '" + after.state + "'");
  }
  if (validate && !machine_->CanTransition(before.state, after.state)) {
    throw util::InvalidTransitionError("illegal " + std::string(EntityType()) + " transition " + before.state + " -> " + after.state);
  }
  machine_->ApplyPreconditions(before, after, validate);
}

std::vector<ResourceRecord> TransitionService::Run(int64_t key_resource, std::string_view operation, const std::string& actor,
                                                   const std::string& requested, const TransitionOptions& options, const Body& body) {
  const auto correlation_id = options.correlation_id.empty() ? util::NewCorrelationId() : options.correlation_id;
  const bool pessimistic    = options.lock_mode == LockMode::kPessimistic;

  observability::SpanScope span("flowlock.workflow." + std::string(operation));
  span.SetAttribute("entity_type", EntityType());
  span.SetAttribute("resource_id", static_cast<std::int64_t>(key_resource));
  span.SetAttribute("correlation_id", correlation_id);

  concurrency::SectionOptions section;
  if (pessimistic) {
    section.mutex_key = mutex_.ResourceKey(EntityType(), key_resource);
  }
  section.correlation_id = correlation_id;
  section.deadline       = options.deadline;

  const retry::RetryContext retry_ctx{std::string(EntityType()) + "." + std::string(operation), correlation_id, options.deadline};

  std::vector<ResourceRecord> before;
  concurrency::SectionTiming  timing;

  // appended after commit, before the mutex is released, so audit order follows version order
  const auto append_applied = [&](const std::vector<ResourceRecord>& stored) {
    for (std::size_t i = 0; i < stored.size(); ++i) {
      audit::AuditEntry entry;
      entry.resource_id    = stored[i].id;
      entry.entity_type    = std::string(EntityType());
      entry.operation_type = std::string(operation);
      entry.outcome        = std::string(audit::kOutcomeApplied);
      entry.old_value      = Describe(before[i]);
      entry.new_value      = Describe(stored[i]);
      entry.actor          = actor;
      entry.lock_wait_ms   = timing.lock_wait_ms;
      entry.tx_duration_ms = timing.tx_duration_ms;
      entry.correlation_id = correlation_id;
      audit_.Append(std::move(entry));
    }
  };

  try {
    auto stored = retry_.Execute(
        [&] {
          return concurrency::RunCriticalSection(
              *repo_, mutex_, section, timing,
              [&](db::Transaction& tx) {
                auto staged = body(tx, pessimistic);
                before.clear();

                const auto                  now = util::NowUnixMillis();
                std::vector<ResourceRecord> out;
                out.reserve(staged.size());
                for (auto& change : staged) {
                  before.push_back(change.before);
                  ValidateChange(change.before, change.after, options.validate);
                  change.after.updated_at_ms = now;
                  out.push_back(concurrency::WriteVersioned(*repo_, tx, change.after, change.before.version));
                }
                return out;
              },
              append_applied);
        },
        options.policy, retry_ctx);

    auto& metrics = observability::Metrics::Instance();
    metrics.RecordTransition(EntityType(), audit::kOutcomeApplied);
    metrics.ObserveLockWaitMs(EntityType(), static_cast<double>(timing.lock_wait_ms));
    metrics.ObserveTransactionMs(EntityType(), static_cast<double>(timing.tx_duration_ms));

    FLOWLOCK_LOG_DEBUG("workflow mutation applied", {observability::StringField("correlation_id", correlation_id),
                                                     observability::StringField("operation", operation),
                                                     observability::IntField("resource_id", key_resource),
                                                     observability::UIntField("rows", stored.size())});
    return stored;
  } catch (util::WorkflowError& e) {
    if (e.correlation_id().empty()) {
      e.set_correlation_id(correlation_id);
    }

    audit::AuditEntry entry;
    entry.resource_id    = key_resource;
    entry.entity_type    = std::string(EntityType());
    entry.operation_type = std::string(operation);
    entry.outcome        = std::string(OutcomeFor(e.kind()));
    entry.old_value      = before.empty() ? std::string() : Describe(before.front());
    entry.new_value      = requested;
    entry.actor          = actor;
    entry.lock_wait_ms   = timing.lock_wait_ms;
    entry.correlation_id = correlation_id;
    audit_.Append(std::move(entry));

    observability::Metrics::Instance().RecordTransition(EntityType(), OutcomeFor(e.kind()));
    span.RecordException(util::KindName(e.kind()));

    const auto level = e.kind() == util::ErrorKind::kInternal ? spdlog::level::err : spdlog::level::warn;
    observability::Log(level, "workflow mutation not applied",
                       {observability::StringField("correlation_id", correlation_id), observability::StringField("entity_type", EntityType()),
                        observability::IntField("resource_id", key_resource), observability::StringField("operation", operation),
                        observability::StringField("error_kind", util::KindName(e.kind())), observability::StringField("error", e.what())});
    throw;
  } catch (const std::exception& e) {
    audit::AuditEntry entry;
    entry.resource_id    = key_resource;
    entry.entity_type    = std::string(EntityType());
    entry.operation_type = std::string(operation);
    entry.outcome        = std::string(audit::kOutcomeFailed);
    entry.new_value      = requested;
    entry.actor          = actor;
    entry.correlation_id = correlation_id;
    audit_.Append(std::move(entry));

    observability::Metrics::Instance().RecordTransition(EntityType(), audit::kOutcomeFailed);
    FLOWLOCK_LOG_ERROR("workflow mutation raised an unexpected error",
                       {observability::StringField("correlation_id", correlation_id), observability::StringField("entity_type", EntityType()),
                        observability::IntField("resource_id", key_resource), observability::StringField("operation", operation),
                        observability::StringField("error", e.what())});
    throw util::InternalError(std::string(operation) + " failed", correlation_id);
  }
}

ResourceRecord TransitionService::Transition(const TransitionRequest& request, const TransitionOptions& options) {
  auto effective = options;
  if (!request.correlation_id.empty()) {
    effective.correlation_id = request.correlation_id;
  }

  auto stored = Run(request.resource_id, "transition", request.actor, request.to_state, effective, [&](db::Transaction& tx, bool lock_rows) {
    if (request.to_state.empty()) {
      throw util::ValidationError("target state is required");
    }
    auto current = Read(tx, request.resource_id, lock_rows);
    if (request.from_state && *request.from_state != current.state) {
      throw util::InvalidTransitionError(std::string(EntityType()) + " " + std::to_string(request.resource_id) + " is " + current.state +
                                         ", expected " + *request.from_state);
    }
    auto next  = current;
    next.state = request.to_state;
    return std::vector<Staged>{{std::move(current), std::move(next)}};
  });
  return stored.front();
}

ResourceRecord TransitionService::Mutate(int64_t resource_id, std::string_view operation, const std::string& actor, const Mutator& mutator,
                                         const TransitionOptions& options) {
  auto stored = Run(resource_id, operation, actor, std::string(operation), options, [&](db::Transaction& tx, bool lock_rows) {
    auto current = Read(tx, resource_id, lock_rows);
    auto next    = current;
    mutator(next);
    return std::vector<Staged>{{std::move(current), std::move(next)}};
  });
  return stored.front();
}

std::pair<ResourceRecord, ResourceRecord> TransitionService::UpdateCoupledParentChild(int64_t child_id, const Mutator& child_updates,
                                                                                      int64_t parent_id, const std::string& actor,
                                                                                      const TransitionOptions& options,
                                                                                      const Mutator& parent_updates) {
  auto stored = Run(parent_id, "update_parent_child", actor, "child " + std::to_string(child_id), options,
                    [&](db::Transaction& tx, bool lock_rows) {
                      if (child_id == parent_id) {
                        throw util::ValidationError("a resource cannot be its own parent");
                      }
                      auto parent = Read(tx, parent_id, lock_rows);
                      auto child  = Read(tx, child_id, lock_rows);
                      if (child.parent_id != parent_id) {
                        throw util::ValidationError(std::string(EntityType()) + " " + std::to_string(child_id) + " does not belong to " +
                                                    std::to_string(parent_id));
                      }

                      auto next_child = child;
                      if (child_updates) child_updates(next_child);
                      auto next_parent = parent;
                      if (parent_updates) parent_updates(next_parent);

                      std::vector<Staged> staged;
                      staged.push_back({std::move(parent), std::move(next_parent)});
                      staged.push_back({std::move(child), std::move(next_child)});
                      return staged;
                    });
  return {stored[1], stored[0]};
}

std::vector<ResourceRecord> TransitionService::BulkTransition(int64_t parent_id, const std::vector<ChildUpdate>& updates,
                                                              const std::string& actor, const TransitionOptions& options) {
  return Run(parent_id, "bulk_transition", actor, std::to_string(updates.size()) + " children", options, [&](db::Transaction& tx, bool lock_rows) {
    if (updates.empty()) {
      throw util::ValidationError("bulk transition needs at least one child");
    }

    std::vector<const ChildUpdate*> ordered;
    std::set<int64_t>               seen;
    for (const auto& update : updates) {
      if (!seen.insert(update.child_id).second) {
        throw util::ValidationError("child " + std::to_string(update.child_id) + " listed twice");
      }
      ordered.push_back(&update);
    }
    std::sort(ordered.begin(), ordered.end(), [](const ChildUpdate* a, const ChildUpdate* b) { return a->child_id < b->child_id; });

    // parent row first: fixes the lock order against coupled updates
    Read(tx, parent_id, lock_rows);

    std::vector<Staged> staged;
    for (const auto* update : ordered) {
      auto child = Read(tx, update->child_id, lock_rows);
      if (child.parent_id != parent_id) {
        throw util::ValidationError(std::string(EntityType()) + " " + std::to_string(update->child_id) + " does not belong to " +
                                    std::to_string(parent_id));
      }
      auto next = child;
      if (update->to_state) next.state = *update->to_state;
      if (update->mutator) update->mutator(next);
      staged.push_back({std::move(child), std::move(next)});
    }
    return staged;
  });
}

std::vector<ResourceRecord> TransitionService::MutateFamily(int64_t parent_id, std::string_view operation, const std::string& actor,
                                                            const FamilyMutator& mutator, const TransitionOptions& options) {
  return Run(parent_id, operation, actor, std::string(operation), options, [&](db::Transaction& tx, bool lock_rows) {
    auto parent = Read(tx, parent_id, lock_rows);

    std::vector<ResourceRecord> children;
    for (const auto& listed : repo_->ListChildren(tx, parent_id)) {
      if (listed.kind != EntityType()) continue;
      children.push_back(Read(tx, listed.id, lock_rows));
    }

    auto next_parent   = parent;
    auto next_children = children;
    mutator(next_parent, next_children);
    if (next_children.size() != children.size()) {
      throw util::ValidationError("family mutation cannot add or remove children");
    }

    std::vector<Staged> staged;
    staged.push_back({std::move(parent), std::move(next_parent)});
    for (std::size_t i = 0; i < children.size(); ++i) {
      if (SameRow(children[i], next_children[i])) continue;
      staged.push_back({std::move(children[i]), std::move(next_children[i])});
    }
    return staged;
  });
}

ResourceRecord TransitionService::Create(ResourceRecord record, const std::string& actor) {
  const auto correlation_id = util::NewCorrelationId();

  if (record.id <= 0) {
    throw util::ValidationError("resource id must be positive", correlation_id);
  }
  if (!machine_->IsKnownState(record.state)) {
    throw util::ValidationError("unknown " + std::string(EntityType()) + " state '" + record.state + "'", correlation_id);
  }
  for (auto* json : {&record.other_info, &record.history}) {
    if (json->empty()) {
      *json = "{}";
      continue;
    }
    try {
      fields::ParseField(*json);
    } catch (const util::InternalError&) {
      throw util::ValidationError("structured fields must be JSON objects", correlation_id);
    }
  }

  record.kind          = std::string(EntityType());
  record.version       = 0;
  record.updated_at_ms = util::NowUnixMillis();

  try {
    auto tx = repo_->Begin();
    if (record.parent_id != 0 && !repo_->GetResource(*tx, record.parent_id)) {
      throw util::NotFoundError("parent " + std::to_string(record.parent_id) + " not found", correlation_id);
    }
    concurrency::ThrowIfDbError(repo_->InsertResource(*tx, record), "create " + std::string(EntityType()) + " " + std::to_string(record.id));
    tx->Commit();
  } catch (const db::DbException& e) {
    concurrency::ThrowDbException(e, "create " + std::string(EntityType()));
  }

  audit::AuditEntry entry;
  entry.resource_id    = record.id;
  entry.entity_type    = record.kind;
  entry.operation_type = "create";
  entry.outcome        = std::string(audit::kOutcomeApplied);
  entry.new_value      = Describe(record);
  entry.actor          = actor;
  entry.correlation_id = correlation_id;
  audit_.Append(std::move(entry));
  return record;
}

ResourceRecord TransitionService::Get(int64_t resource_id) {
  try {
    auto tx     = repo_->Begin();
    auto record = Read(*tx, resource_id, false);
    tx->Commit();
    return record;
  } catch (const db::DbException& e) {
    concurrency::ThrowDbException(e, "get " + std::string(EntityType()));
  }
}

} // namespace flowlock::workflow
