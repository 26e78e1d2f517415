#include "field_updater.hpp"

#include "internal/concurrency/critical_section.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace flowlock::fields {

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

} // namespace

FieldUpdater::FieldUpdater(std::string entity_type, std::shared_ptr<db::Repository> repo, lock::DistributedMutex& mutex, audit::AuditLog& audit,
                           retry::RetryExecutor& retry)
    : entity_type_(std::move(entity_type)), repo_(std::move(repo)), mutex_(mutex), audit_(audit), retry_(retry) {
}

google::protobuf::Struct FieldUpdater::MergeField(int64_t resource_id, std::string_view field_name, const google::protobuf::Struct& updates,
                                                  const UpdateContext& ctx) {
  return Apply(
      resource_id, field_name, "merge_field", [&updates] { ValidateUpdates(updates); },
      [&updates](google::protobuf::Struct& value) { DeepMerge(value, updates); }, ctx);
}

google::protobuf::Struct FieldUpdater::AppendToArray(int64_t resource_id, std::string_view field_name, const std::string& array_key,
                                                     const google::protobuf::Value& item, std::optional<std::size_t> max_length,
                                                     const UpdateContext& ctx) {
  const auto check = [&] {
    if (array_key.empty()) {
      throw util::ValidationError("array key must not be empty");
    }
    if (max_length && *max_length == 0) {
      throw util::ValidationError("max_length must be positive");
    }
  };
  const auto bound = max_length.value_or(0);
  return Apply(
      resource_id, field_name, "append_to_array", check,
      [&](google::protobuf::Struct& value) { AppendBounded(value, array_key, item, bound); }, ctx);
}

google::protobuf::Struct FieldUpdater::WithField(int64_t resource_id, std::string_view field_name, const Transform& fn,
                                                 const UpdateContext& ctx) {
  return Apply(resource_id, field_name, "with_field", {}, fn, ctx);
}

google::protobuf::Struct FieldUpdater::Apply(int64_t resource_id, std::string_view field_name, std::string_view operation, const Check& check,
                                             const Transform& fn, const UpdateContext& ctx) {
  const auto correlation_id = ctx.correlation_id.empty() ? util::NewCorrelationId() : ctx.correlation_id;

  observability::SpanScope span("flowlock.field." + std::string(operation));
  span.SetAttribute("entity_type", entity_type_);
  span.SetAttribute("resource_id", static_cast<std::int64_t>(resource_id));
  span.SetAttribute("field", field_name);

  audit::AuditEntry entry;
  entry.resource_id    = resource_id;
  entry.entity_type    = entity_type_;
  entry.operation_type = std::string(operation);
  entry.actor          = ctx.actor;
  entry.correlation_id = correlation_id;

  concurrency::SectionOptions section;
  section.mutex_key      = mutex_.ResourceKey(entity_type_, resource_id);
  section.correlation_id = correlation_id;
  section.deadline       = ctx.deadline;

  const retry::RetryContext retry_ctx{std::string(operation), correlation_id, ctx.deadline};

  try {
    // argument errors are rejected here so they still leave an audit row
    const auto field = ParseFieldName(field_name);
    if (check) check();

    auto result = retry_.Execute(
        [&] {
          concurrency::SectionTiming timing;
          return concurrency::RunCriticalSection(
              *repo_, mutex_, section, timing,
              [&](db::Transaction& tx) {
                auto record = concurrency::LockForUpdate(*repo_, tx, resource_id);
                if (record.kind != entity_type_) {
                  throw util::NotFoundError(entity_type_ + " " + std::to_string(resource_id) + " not found");
                }
                entry.old_value = FieldJson(record, field);

                auto current = ParseField(entry.old_value);
                fn(current);
                entry.new_value = SerializeField(current);

                concurrency::ThrowIfDbError(repo_->UpdateField(tx, resource_id, field, entry.new_value, util::NowUnixMillis()),
                                            "update field of resource " + std::to_string(resource_id));
                return current;
              },
              [&](const google::protobuf::Struct&) {
                entry.outcome        = std::string(audit::kOutcomeApplied);
                entry.lock_wait_ms   = timing.lock_wait_ms;
                entry.tx_duration_ms = timing.tx_duration_ms;
                audit_.Append(entry);
              });
        },
        retry::Policies::kHighContention, retry_ctx);

    observability::Metrics::Instance().RecordTransition(entity_type_, audit::kOutcomeApplied);
    observability::Metrics::Instance().ObserveLockWaitMs(entity_type_, static_cast<double>(entry.lock_wait_ms));
    observability::Metrics::Instance().ObserveTransactionMs(entity_type_, static_cast<double>(entry.tx_duration_ms));
    return result;
  } catch (util::WorkflowError& e) {
    if (e.correlation_id().empty()) {
      e.set_correlation_id(correlation_id);
    }
    entry.outcome   = std::string(OutcomeFor(e.kind()));
    entry.new_value = e.what();
    audit_.Append(entry);
    observability::Metrics::Instance().RecordTransition(entity_type_, entry.outcome);
    span.RecordException(util::KindName(e.kind()));
    FLOWLOCK_LOG_WARN("structured field update failed",
                      {observability::StringField("correlation_id", correlation_id), observability::StringField("entity_type", entity_type_),
                       observability::IntField("resource_id", resource_id), observability::StringField("operation", operation),
                       observability::StringField("error_kind", util::KindName(e.kind()))});
    throw;
  } catch (const std::exception& e) {
    entry.outcome   = std::string(audit::kOutcomeFailed);
    entry.new_value = e.what();
    audit_.Append(entry);
    observability::Metrics::Instance().RecordTransition(entity_type_, audit::kOutcomeFailed);
    span.RecordException(util::KindName(util::ErrorKind::kInternal));
    FLOWLOCK_LOG_ERROR("structured field transform raised an unexpected error",
                       {observability::StringField("correlation_id", correlation_id), observability::IntField("resource_id", resource_id),
                        observability::StringField("operation", operation), observability::StringField("error", e.what())});
    throw util::InternalError(std::string(operation) + " failed: " + e.what(), correlation_id);
  }
}

} // namespace flowlock::fields
