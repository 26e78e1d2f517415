#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace flowlock::lock {

/*
  Shared key-value store backing DistributedMutex.

  Every call is atomic with respect to every other caller, in this process
  or any other process using the same store. An entry whose expiry has
  passed is treated as absent.

  Store failures are raised as util::TransientConnectionError.
*/
class LockStore {
 public:
  virtual ~LockStore() = default;

  // Sets key -> token with expiry now + ttl unless a live entry exists.
  virtual bool SetIfAbsent(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) = 0;

  // Deletes key only while it still maps to token.
  virtual bool CompareAndDelete(const std::string& key, const std::string& token) = 0;

  // Moves expiry to now + ttl only while key still maps to a live token.
  virtual bool CompareAndExpire(const std::string& key, const std::string& token, std::chrono::milliseconds ttl) = 0;

  // Token of the live holder, if any.
  virtual std::optional<std::string> Holder(const std::string& key) = 0;
};

} // namespace flowlock::lock
