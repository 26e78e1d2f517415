#include "retry_executor.hpp"

#include <algorithm>
#include <random>
#include <thread>

#include "internal/util/uuid.hpp"

namespace flowlock::retry {

RetryExecutor::RetryExecutor() : RetryExecutor([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
}

RetryExecutor::RetryExecutor(SleepFn sleep_fn) : sleep_fn_(std::move(sleep_fn)) {
}

std::chrono::milliseconds RetryExecutor::BackoffDelay(const RetryPolicy& policy, int attempt, util::ErrorKind kind) {
  const auto base = policy.BaseDelayFor(kind).count();
  const auto cap  = policy.max_delay.count();

  // bounded shift keeps base << shift inside int64
  const int  shift       = std::clamp(attempt, 0, 30);
  const auto exponential = std::min<std::int64_t>(base << shift, cap);

  std::uniform_int_distribution<std::int64_t> jitter(0, std::max<std::int64_t>(base, 0));
  return std::chrono::milliseconds(std::min<std::int64_t>(exponential + jitter(util::ThreadRng()), cap));
}

} // namespace flowlock::retry
