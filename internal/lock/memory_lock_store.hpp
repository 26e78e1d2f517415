#pragma once

#include <mutex>
#include <unordered_map>

#include "internal/lock/lock_store.hpp"
#include "internal/util/time.hpp"

namespace flowlock::lock {

/*
  In-process lock table. Expiry is measured on the steady clock and expired
  entries are swept lazily on access.
*/
class MemoryLockStore final : public LockStore {
 public:
  bool SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  bool CompareAndDelete(const std::string& key, const std::string& token) override;
  bool CompareAndExpire(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) override;
  std::optional<std::string> Holder(const std::string& key) override;

 private:
  struct Entry {
    std::string           token;
    util::SteadyTimePoint expires_at;
  };

  static bool IsExpired(const Entry& entry, util::SteadyTimePoint now);

  // Live entry for key, erasing it first when expired. Caller holds mutex_.
  Entry* FindLive(const std::string& key, util::SteadyTimePoint now);

  std::mutex                             mutex_;
  std::unordered_map<std::string, Entry> entries_;
};

} // namespace flowlock::lock
