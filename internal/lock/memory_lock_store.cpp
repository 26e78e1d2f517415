#include "memory_lock_store.hpp"

namespace flowlock::lock {

bool MemoryLockStore::IsExpired(const Entry& entry, util::SteadyTimePoint now) {
  return entry.expires_at <= now;
}

MemoryLockStore::Entry* MemoryLockStore::FindLive(const std::string& key, util::SteadyTimePoint now) {
  auto it = entries_.find(key);
  if (it == entries_.end()) return nullptr;
  if (IsExpired(it->second, now)) {
    entries_.erase(it);
    return nullptr;
  }
  return &it->second;
}

bool MemoryLockStore::SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now = util::SteadyNow();
  if (FindLive(key, now) != nullptr) {
    return false;
  }
  entries_[key] = Entry{token, now + ttl};
  return true;
}

bool MemoryLockStore::CompareAndDelete(const std::string& key, const std::string& token) {
  std::lock_guard lock(mutex_);

  auto* entry = FindLive(key, util::SteadyNow());
  if (entry == nullptr || entry->token != token) {
    return false;
  }
  entries_.erase(key);
  return true;
}

bool MemoryLockStore::CompareAndExpire(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) {
  std::lock_guard lock(mutex_);

  const auto now   = util::SteadyNow();
  auto*      entry = FindLive(key, now);
  if (entry == nullptr || entry->token != token) {
    return false;
  }
  entry->expires_at = now + ttl;
  return true;
}

std::optional<std::string> MemoryLockStore::Holder(const std::string& key) {
  std::lock_guard lock(mutex_);

  auto* entry = FindLive(key, util::SteadyNow());
  if (entry == nullptr) return std::nullopt;
  return entry->token;
}

} // namespace flowlock::lock
