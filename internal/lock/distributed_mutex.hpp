#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "internal/lock/lock_store.hpp"
#include "internal/util/time.hpp"

namespace flowlock::lock {

struct LockHandle {
  std::string     key;
  std::string     token;
  util::TimePoint expires_at;
};

struct MutexOptions {
  std::chrono::milliseconds default_ttl      = std::chrono::seconds(15);
  std::chrono::milliseconds blocking_timeout = std::chrono::seconds(10);
  std::chrono::milliseconds poll_interval    = std::chrono::milliseconds(50);
  std::string               key_prefix       = "workflow";
};

// "<prefix>:<entity_type>:<id>", e.g. "workflow:job:482".
std::string ResourceKey(std::string_view prefix, std::string_view entity_type, int64_t id);

/*
  DistributedMutex

  Named, TTL-bounded lock over a shared LockStore. A holder is identified by
  a random token; only the token holder can release or extend. A crashed
  holder's lock lapses after its TTL.

  Acquire polls the store with jittered sleeps (50%..150% of the poll
  interval) until the blocking timeout or caller deadline, whichever comes
  first, then throws LockAcquisitionError.
*/
class DistributedMutex {
 public:
  using SleepFn = std::function<void(std::chrono::milliseconds)>;

  DistributedMutex(LockStore& store, MutexOptions options);

  LockHandle Acquire(const std::string& key);
  LockHandle Acquire(const std::string& key, std::chrono::milliseconds ttl, std::chrono::milliseconds blocking_timeout,
                     std::optional<util::SteadyTimePoint> deadline = std::nullopt);

  // False when the lock expired and is now held by someone else (or nobody).
  bool Release(const LockHandle& handle);

  bool Extend(LockHandle& handle, std::chrono::milliseconds ttl);

  std::optional<std::string> Holder(const std::string& key);

  std::string ResourceKey(std::string_view entity_type, int64_t id) const;

  const MutexOptions& options() const {
    return options_;
  }

  void SetSleepFunction(SleepFn sleep_fn) {
    sleep_fn_ = std::move(sleep_fn);
  }

 private:
  std::chrono::milliseconds JitteredPoll() const;

  LockStore&   store_;
  MutexOptions options_;
  SleepFn      sleep_fn_;
};

/*
  RAII guard. Releases on scope exit; a token mismatch at that point is
  logged as an invariant violation and never thrown.
*/
class ScopedMutex {
 public:
  ScopedMutex(DistributedMutex& mutex, LockHandle handle, std::string correlation_id = {});
  ~ScopedMutex();

  ScopedMutex(const ScopedMutex&)            = delete;
  ScopedMutex& operator=(const ScopedMutex&) = delete;

  const LockHandle& handle() const {
    return handle_;
  }

  bool Extend(std::chrono::milliseconds ttl) {
    return mutex_.Extend(handle_, ttl);
  }

 private:
  DistributedMutex& mutex_;
  LockHandle        handle_;
  std::string       correlation_id_;
};

} // namespace flowlock::lock
