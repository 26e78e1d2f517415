#pragma once

#include <algorithm>
#include <chrono>
#include <string_view>

#include "internal/util/errors.hpp"

namespace flowlock::retry {

/*
  Named retry policies.

  Every policy retries the retryable kinds. Contention kinds (lock
  acquisition, stale object, serialization conflict) back off from
  base_delay; infrastructure kinds (transient connection) back off from
  the larger of base_delay and infrastructure_delay, so an outage is not
  hammered at contention speed.
*/
struct RetryPolicy {
  std::string_view          name;
  int                       max_attempts;
  std::chrono::milliseconds base_delay;
  std::chrono::milliseconds max_delay;
  std::chrono::milliseconds infrastructure_delay;

  constexpr bool Retries(util::ErrorKind kind) const {
    return util::IsRetryable(kind);
  }

  constexpr std::chrono::milliseconds BaseDelayFor(util::ErrorKind kind) const {
    if (util::IsContention(kind)) return base_delay;
    return std::max(base_delay, infrastructure_delay);
  }
};

struct Policies {
  static constexpr RetryPolicy kDefault{"default", 3, std::chrono::milliseconds(50), std::chrono::milliseconds(2000),
                                        std::chrono::milliseconds(100)};
  static constexpr RetryPolicy kHighContention{"high_contention", 12, std::chrono::milliseconds(10), std::chrono::milliseconds(250),
                                               std::chrono::milliseconds(50)};
  static constexpr RetryPolicy kConservative{"conservative", 3, std::chrono::milliseconds(200), std::chrono::milliseconds(5000),
                                             std::chrono::milliseconds(200)};
  static constexpr RetryPolicy kDatabaseOperation{"database_operation", 5, std::chrono::milliseconds(100), std::chrono::milliseconds(3000),
                                                  std::chrono::milliseconds(100)};
};

static_assert(Policies::kDefault.Retries(util::ErrorKind::kStaleObject));
static_assert(Policies::kDefault.Retries(util::ErrorKind::kTransientConnection));
static_assert(!Policies::kConservative.Retries(util::ErrorKind::kValidation));
static_assert(Policies::kHighContention.BaseDelayFor(util::ErrorKind::kTransientConnection) >
              Policies::kHighContention.BaseDelayFor(util::ErrorKind::kLockAcquisition));

} // namespace flowlock::retry
