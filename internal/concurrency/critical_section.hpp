#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

#include "internal/concurrency/row_lock.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lock/distributed_mutex.hpp"
#include "internal/util/time.hpp"

namespace flowlock::concurrency {

struct SectionTiming {
  uint64_t lock_wait_ms   = 0;
  uint64_t tx_duration_ms = 0;
};

struct SectionOptions {
  // Empty key: no distributed mutex (optimistic mode).
  std::string                          mutex_key;
  std::string                          correlation_id;
  std::optional<util::SteadyTimePoint> deadline;
};

/*
  One attempt of a locked read-modify-write:

    mutex (optional) -> begin -> body(tx) -> commit -> after_commit -> release mutex

  body takes the row locks it needs and does the writes. A throw from body
  rolls the transaction back before the mutex is released. after_commit
  receives body's result (nothing for a void body) once the transaction
  is closed, while the mutex is still held; the write is durable by then,
  so after_commit must not throw. Backend exceptions surface as
  WorkflowErrors.
*/
template <typename Body, typename AfterCommit>
auto RunCriticalSection(db::Repository& repo, lock::DistributedMutex& mutex, const SectionOptions& options, SectionTiming& timing,
                        Body&& body, AfterCommit&& after_commit) -> decltype(body(std::declval<db::Transaction&>())) {
  using Result     = decltype(body(std::declval<db::Transaction&>()));
  const auto start = util::SteadyNow();

  std::optional<lock::ScopedMutex> guard;
  if (!options.mutex_key.empty()) {
    const auto& mopts = mutex.options();
    guard.emplace(mutex, mutex.Acquire(options.mutex_key, mopts.default_ttl, mopts.blocking_timeout, options.deadline),
                  options.correlation_id);
  }

  // tx is destroyed before after_commit runs
  auto attempt = [&]() -> Result {
    auto       tx       = repo.Begin();
    const auto tx_start = util::SteadyNow();
    timing.lock_wait_ms = util::ElapsedMillis(start);

    if constexpr (std::is_void_v<Result>) {
      body(*tx);
      tx->Commit();
      timing.tx_duration_ms = util::ElapsedMillis(tx_start);
    } else {
      auto result = body(*tx);
      tx->Commit();
      timing.tx_duration_ms = util::ElapsedMillis(tx_start);
      return result;
    }
  };

  try {
    if constexpr (std::is_void_v<Result>) {
      attempt();
      after_commit();
    } else {
      auto result = attempt();
      after_commit(static_cast<const Result&>(result));
      return result;
    }
  } catch (const db::DbException& e) {
    ThrowDbException(e, "critical section");
  }
}

} // namespace flowlock::concurrency
