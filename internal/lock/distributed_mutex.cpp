#include "distributed_mutex.hpp"

#include <algorithm>
#include <random>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace flowlock::lock {

std::string ResourceKey(std::string_view prefix, std::string_view entity_type, int64_t id) {
  std::string key;
  key.reserve(prefix.size() + entity_type.size() + 24);
  key.append(prefix).append(":").append(entity_type).append(":").append(std::to_string(id));
  return key;
}

DistributedMutex::DistributedMutex(LockStore& store, MutexOptions options)
    : store_(store), options_(std::move(options)), sleep_fn_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
}

std::string DistributedMutex::ResourceKey(std::string_view entity_type, int64_t id) const {
  return lock::ResourceKey(options_.key_prefix, entity_type, id);
}

std::chrono::milliseconds DistributedMutex::JitteredPoll() const {
  const auto base = std::max<std::int64_t>(options_.poll_interval.count(), 1);
  std::uniform_int_distribution<std::int64_t> dist(base / 2, base + base / 2);
  return std::chrono::milliseconds(std::max<std::int64_t>(dist(util::ThreadRng()), 1));
}

LockHandle DistributedMutex::Acquire(const std::string& key) {
  return Acquire(key, options_.default_ttl, options_.blocking_timeout);
}

LockHandle DistributedMutex::Acquire(const std::string& key, std::chrono::milliseconds ttl, std::chrono::milliseconds blocking_timeout,
                                     std::optional<util::SteadyTimePoint> deadline) {
  const auto start = util::SteadyNow();
  auto       limit = start + blocking_timeout;
  if (deadline && *deadline < limit) {
    limit = *deadline;
  }

  LockHandle handle;
  handle.key   = key;
  handle.token = util::NewCorrelationId();

  for (;;) {
    if (store_.SetIfAbsent(key, handle.token, ttl)) {
      handle.expires_at = util::Now() + ttl;
      FLOWLOCK_LOG_DEBUG("mutex acquired", {observability::StringField("key", key), observability::UIntField("wait_ms", util::ElapsedMillis(start))});
      return handle;
    }

    const auto now = util::SteadyNow();
    if (now >= limit) {
      break;
    }
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(limit - now);
    sleep_fn_(std::min(JitteredPoll(), std::max(remaining, std::chrono::milliseconds(1))));
  }

  FLOWLOCK_LOG_DEBUG("mutex acquisition timed out", {observability::StringField("key", key),
                                                     observability::UIntField("waited_ms", util::ElapsedMillis(start))});
  throw util::LockAcquisitionError("could not acquire lock " + key + " within " + std::to_string(blocking_timeout.count()) + "ms");
}

bool DistributedMutex::Release(const LockHandle& handle) {
  if (store_.CompareAndDelete(handle.key, handle.token)) {
    return true;
  }
  FLOWLOCK_LOG_WARN("mutex release skipped: token no longer holds the lock", {observability::StringField("key", handle.key)});
  return false;
}

bool DistributedMutex::Extend(LockHandle& handle, std::chrono::milliseconds ttl) {
  if (!store_.CompareAndExpire(handle.key, handle.token, ttl)) {
    return false;
  }
  handle.expires_at = util::Now() + ttl;
  return true;
}

std::optional<std::string> DistributedMutex::Holder(const std::string& key) {
  return store_.Holder(key);
}

ScopedMutex::ScopedMutex(DistributedMutex& mutex, LockHandle handle, std::string correlation_id)
    : mutex_(mutex), handle_(std::move(handle)), correlation_id_(std::move(correlation_id)) {
}

ScopedMutex::~ScopedMutex() {
  try {
    if (!mutex_.Release(handle_)) {
      FLOWLOCK_LOG_ERROR("invariant violation: mutex expired before the critical section finished",
                         {observability::StringField("key", handle_.key), observability::StringField("correlation_id", correlation_id_)});
    }
  } catch (const util::WorkflowError& e) {
    FLOWLOCK_LOG_ERROR("mutex release failed; lock will lapse after its ttl",
                       {observability::StringField("key", handle_.key), observability::StringField("correlation_id", correlation_id_),
                        observability::StringField("error", e.what())});
  }
}

} // namespace flowlock::lock
