#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/audit/audit_log.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fields/structured_field.hpp"
#include "internal/lock/distributed_mutex.hpp"
#include "internal/retry/retry_executor.hpp"

namespace flowlock::fields {

struct UpdateContext {
  std::string                          actor;
  std::string                          correlation_id;
  std::optional<util::SteadyTimePoint> deadline;
};

/*
  AtomicStructuredFieldUpdater

  Read-merge-write of one map-valued column under the resource's mutex, a
  row lock and a single transaction. The current value is re-read after
  the locks are held, so concurrent writers never lose each other's keys.
  Only the touched column is rewritten; version advances by one.

  Calls retry on contention (high-contention policy) and append one audit
  row with the final outcome, rejected arguments included. The applied row
  is written before the mutex is released.
*/
class FieldUpdater {
 public:
  using Transform = std::function<void(google::protobuf::Struct&)>;
  using Check     = std::function<void()>;

  FieldUpdater(std::string entity_type, std::shared_ptr<db::Repository> repo, lock::DistributedMutex& mutex, audit::AuditLog& audit,
               retry::RetryExecutor& retry);

  google::protobuf::Struct MergeField(int64_t resource_id, std::string_view field_name, const google::protobuf::Struct& updates,
                                      const UpdateContext& ctx = {});

  google::protobuf::Struct AppendToArray(int64_t resource_id, std::string_view field_name, const std::string& array_key,
                                         const google::protobuf::Value& item, std::optional<std::size_t> max_length = std::nullopt,
                                         const UpdateContext& ctx = {});

  // fn edits a private copy; it is committed when fn returns and discarded when fn throws.
  google::protobuf::Struct WithField(int64_t resource_id, std::string_view field_name, const Transform& fn, const UpdateContext& ctx = {});

 private:
  // check runs before any lock is taken; its ValidationError is audited as rejected.
  google::protobuf::Struct Apply(int64_t resource_id, std::string_view field_name, std::string_view operation, const Check& check,
                                 const Transform& fn, const UpdateContext& ctx);

  std::string                     entity_type_;
  std::shared_ptr<db::Repository> repo_;
  lock::DistributedMutex&         mutex_;
  audit::AuditLog&                audit_;
  retry::RetryExecutor&           retry_;
};

} // namespace flowlock::fields
