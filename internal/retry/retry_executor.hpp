#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/retry/retry_policy.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace flowlock::retry {

struct RetryContext {
  std::string                          operation;
  std::string                          correlation_id;
  std::optional<util::SteadyTimePoint> deadline;
};

/*
  RetryExecutor

  Runs an operation, retrying WorkflowErrors whose kind the policy accepts
  with exponential backoff plus jitter:

    delay = min(base * 2^attempt + uniform(0, base), max)

  where base is the policy's base delay for the kind of the last failure.

  Non-retryable errors propagate on the first throw. Running out of attempts
  (or of time before the caller's deadline) raises ServiceUnavailableError
  carrying the correlation id and the last underlying kind.
*/
class RetryExecutor {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  RetryExecutor();
  explicit RetryExecutor(SleepFn sleep_fn);

  template <typename Fn>
  auto Execute(Fn&& operation, const RetryPolicy& policy, const RetryContext& ctx) -> decltype(operation()) {
    util::ErrorKind last_kind = util::ErrorKind::kInternal;
    std::string     last_message;
    int             attempt = 0;

    for (;;) {
      try {
        return operation();
      } catch (util::WorkflowError& e) {
        if (e.correlation_id().empty()) {
          e.set_correlation_id(ctx.correlation_id);
        }
        if (!policy.Retries(e.kind())) {
          throw;
        }
        last_kind    = e.kind();
        last_message = e.what();
      }

      ++attempt;
      if (attempt >= policy.max_attempts) {
        break;
      }

      const auto delay = BackoffDelay(policy, attempt - 1, last_kind);
      if (ctx.deadline && util::SteadyNow() + delay > *ctx.deadline) {
        FLOWLOCK_LOG_WARN("retry abandoned: deadline would pass", {observability::StringField("operation", ctx.operation),
                                                                   observability::StringField("correlation_id", ctx.correlation_id)});
        break;
      }

      observability::Metrics::Instance().RecordRetry(ctx.operation, util::KindName(last_kind));
      FLOWLOCK_LOG_DEBUG("retrying operation",
                         {observability::StringField("operation", ctx.operation), observability::StringField("correlation_id", ctx.correlation_id),
                          observability::StringField("error_kind", util::KindName(last_kind)), observability::IntField("attempt", attempt),
                          observability::IntField("delay_ms", delay.count())});
      sleep_fn_(delay);
    }

    FLOWLOCK_LOG_ERROR("retries exhausted",
                       {observability::StringField("operation", ctx.operation), observability::StringField("correlation_id", ctx.correlation_id),
                        observability::StringField("policy", policy.name), observability::StringField("last_error_kind", util::KindName(last_kind)),
                        observability::StringField("last_error", last_message)});
    throw util::ServiceUnavailableError(ctx.operation + " unavailable after " + std::to_string(attempt) + " attempts", ctx.correlation_id,
                                        last_kind);
  }

  // Sleep before retry number attempt + 1 (attempt counts from 0).
  static std::chrono::milliseconds BackoffDelay(const RetryPolicy& policy, int attempt, util::ErrorKind kind);

 private:
  SleepFn sleep_fn_;
};

} // namespace flowlock::retry
