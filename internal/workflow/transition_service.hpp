#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/audit/audit_log.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lock/distributed_mutex.hpp"
#include "internal/retry/retry_executor.hpp"
#include "internal/workflow/state_machine.hpp"

namespace flowlock::workflow {

using db::model::ResourceRecord;

enum class LockMode {
  // distributed mutex + row lock + version check
  kPessimistic,
  // version check only; concurrent writers surface as StaleObjectError
  kOptimistic,
};

struct TransitionOptions {
  bool                                 validate  = true;
  LockMode                             lock_mode = LockMode::kPessimistic;
  retry::RetryPolicy                   policy    = retry::Policies::kDefault;
  std::optional<util::SteadyTimePoint> deadline;
  std::string                          correlation_id;
};

struct TransitionRequest {
  int64_t                    resource_id = 0;
  std::optional<std::string> from_state;
  std::string                to_state;
  std::string                actor;
  std::string                correlation_id;
};

struct ChildUpdate {
  int64_t                                    child_id = 0;
  std::optional<std::string>                 to_state;
  std::function<void(ResourceRecord& child)> mutator;
};

/*
  WorkflowTransitionService

  Every mutation runs as:

    retry( mutex(key) -> begin -> row locks -> read -> mutate ->
           validate state change -> versioned write(s) -> commit ->
           audit -> release )

  Family operations (parent + children) take the parent's mutex and lock
  the parent row first, then children in ascending id order, and write
  everything in one transaction. Every operation leaves exactly one audit
  row per written resource on success, or one row on the addressed
  resource when it is rejected or fails, argument checks included.
*/
class TransitionService {
 public:
  using Mutator       = std::function<void(ResourceRecord&)>;
  using FamilyMutator = std::function<void(ResourceRecord& parent, std::vector<ResourceRecord>& children)>;

  TransitionService(std::shared_ptr<const StateMachine> machine, std::shared_ptr<db::Repository> repo, lock::DistributedMutex& mutex,
                    audit::AuditLog& audit, retry::RetryExecutor& retry);

  ResourceRecord Transition(const TransitionRequest& request, const TransitionOptions& options = {});

  // Locked read-modify-write of one resource. A state change made by
  // mutator goes through the same validation as Transition.
  ResourceRecord Mutate(int64_t resource_id, std::string_view operation, const std::string& actor, const Mutator& mutator,
                        const TransitionOptions& options = {});

  // Child and parent in one transaction under the parent's mutex. The
  // parent's updated_at_ms and version always advance.
  std::pair<ResourceRecord, ResourceRecord> UpdateCoupledParentChild(int64_t child_id, const Mutator& child_updates, int64_t parent_id,
                                                                     const std::string& actor, const TransitionOptions& options = {},
                                                                     const Mutator& parent_updates = {});

  // All-or-nothing update of several children of parent_id. Returns the
  // written children in ascending id order.
  std::vector<ResourceRecord> BulkTransition(int64_t parent_id, const std::vector<ChildUpdate>& updates, const std::string& actor,
                                             const TransitionOptions& options = {});

  // Parent plus all of its children. Returns parent first, then the children
  // that changed.
  std::vector<ResourceRecord> MutateFamily(int64_t parent_id, std::string_view operation, const std::string& actor,
                                           const FamilyMutator& mutator, const TransitionOptions& options = {});

  // Inserts at version 0. kind is forced to this service's entity type.
  ResourceRecord Create(ResourceRecord record, const std::string& actor);

  ResourceRecord Get(int64_t resource_id);

  const StateMachine& machine() const {
    return *machine_;
  }

  std::string_view EntityType() const {
    return machine_->EntityType();
  }

 private:
  struct Staged {
    ResourceRecord before;
    ResourceRecord after;
  };

  // Loads, mutates and returns the rows to write; called inside the critical section.
  using Body = std::function<std::vector<Staged>(db::Transaction& tx, bool lock_rows)>;

  std::vector<ResourceRecord> Run(int64_t key_resource, std::string_view operation, const std::string& actor, const std::string& requested,
                                  const TransitionOptions& options, const Body& body);

  ResourceRecord Read(db::Transaction& tx, int64_t resource_id, bool lock_row);

  void ValidateChange(const ResourceRecord& before, ResourceRecord& after, bool validate) const;

  std::shared_ptr<const StateMachine> machine_;
  std::shared_ptr<db::Repository>     repo_;
  lock::DistributedMutex&             mutex_;
  audit::AuditLog&                    audit_;
  retry::RetryExecutor&               retry_;
};

// Compact JSON summary used as audit old/new value.
std::string Describe(const ResourceRecord& record);

} // namespace flowlock::workflow
