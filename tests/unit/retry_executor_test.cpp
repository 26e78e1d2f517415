#include "internal/retry/retry_executor.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

namespace {

using flowlock::retry::Policies;
using flowlock::retry::RetryContext;
using flowlock::retry::RetryExecutor;
using flowlock::util::ErrorKind;

struct RecordingSleep {
  std::vector<std::chrono::milliseconds>* delays;
  void                                    operator()(std::chrono::milliseconds d) const {
    delays->push_back(d);
  }
};

void TestContentionIsRetriedUntilSuccess() {
  std::vector<std::chrono::milliseconds> delays;
  RetryExecutor                          executor(RecordingSleep{&delays});

  int  calls  = 0;
  auto result = executor.Execute(
      [&] {
        if (++calls < 3) {
          throw flowlock::util::StaleObjectError("version moved");
        }
        return std::string("done");
      },
      Policies::kDefault, RetryContext{"test.contention", "corr-retry", std::nullopt});

  assert(result == "done");
  assert(calls == 3);
  assert(delays.size() == 2);
  for (auto d : delays) {
    assert(d <= Policies::kDefault.max_delay);
  }
}

void TestNonRetryableKindPropagatesImmediately() {
  std::vector<std::chrono::milliseconds> delays;
  RetryExecutor                          executor(RecordingSleep{&delays});

  int  calls = 0;
  bool threw = false;
  try {
    executor.Execute(
        [&]() -> int {
          ++calls;
          throw flowlock::util::InvalidTransitionError("NEW -> CLOSED");
        },
        Policies::kHighContention, RetryContext{"test.invalid", "corr-invalid", std::nullopt});
  } catch (const flowlock::util::InvalidTransitionError& e) {
    threw = true;
    assert(e.correlation_id() == "corr-invalid");
  }

  assert(threw);
  assert(calls == 1);
  assert(delays.empty());
}

void TestExhaustionRaisesServiceUnavailable() {
  std::vector<std::chrono::milliseconds> delays;
  RetryExecutor                          executor(RecordingSleep{&delays});

  int  calls = 0;
  bool threw = false;
  try {
    executor.Execute(
        [&]() -> int {
          ++calls;
          throw flowlock::util::LockAcquisitionError("busy");
        },
        Policies::kDefault, RetryContext{"test.exhaust", "corr-exhaust", std::nullopt});
  } catch (const flowlock::util::ServiceUnavailableError& e) {
    threw = true;
    assert(e.last_cause() == ErrorKind::kLockAcquisition);
    assert(e.correlation_id() == "corr-exhaust");
  }

  assert(threw);
  assert(calls == Policies::kDefault.max_attempts);
  assert(static_cast<int>(delays.size()) == Policies::kDefault.max_attempts - 1);
}

void TestTransientConnectionIsRetriedWithSlowerBackoff() {
  std::vector<std::chrono::milliseconds> delays;
  RetryExecutor                          executor(RecordingSleep{&delays});

  int  calls = 0;
  auto value = executor.Execute(
      [&] {
        if (++calls == 1) {
          throw flowlock::util::TransientConnectionError("connection reset");
        }
        return 7;
      },
      Policies::kDefault, RetryContext{"test.transient", "corr-t", std::nullopt});
  assert(value == 7);
  assert(calls == 2);
  assert(delays.size() == 1);
  assert(delays[0] >= Policies::kDefault.infrastructure_delay);

  delays.clear();
  calls      = 0;
  bool threw = false;
  try {
    executor.Execute(
        [&]() -> int {
          ++calls;
          throw flowlock::util::TransientConnectionError("connection reset");
        },
        Policies::kHighContention, RetryContext{"test.transient", "corr-t", std::nullopt});
  } catch (const flowlock::util::ServiceUnavailableError& e) {
    threw = true;
    assert(e.last_cause() == ErrorKind::kTransientConnection);
    assert(e.correlation_id() == "corr-t");
  }
  assert(threw);
  assert(calls == Policies::kHighContention.max_attempts);
  for (auto d : delays) {
    assert(d >= Policies::kHighContention.infrastructure_delay);
    assert(d <= Policies::kHighContention.max_delay);
  }
}

void TestDeadlineStopsRetrying() {
  std::vector<std::chrono::milliseconds> delays;
  RetryExecutor                          executor(RecordingSleep{&delays});

  int  calls = 0;
  bool threw = false;
  try {
    executor.Execute(
        [&]() -> int {
          ++calls;
          throw flowlock::util::StaleObjectError("version moved");
        },
        Policies::kConservative, RetryContext{"test.deadline", "corr-d", flowlock::util::SteadyNow()});
  } catch (const flowlock::util::ServiceUnavailableError& e) {
    threw = true;
    assert(e.last_cause() == ErrorKind::kStaleObject);
  }

  assert(threw);
  assert(calls == 1);
  assert(delays.empty());
}

void TestBackoffIsBoundedAndGrows() {
  for (int attempt = 0; attempt < 40; ++attempt) {
    auto delay = RetryExecutor::BackoffDelay(Policies::kDefault, attempt, ErrorKind::kStaleObject);
    assert(delay >= std::chrono::milliseconds(0));
    assert(delay <= Policies::kDefault.max_delay);
  }

  // attempt 5: 50ms * 32 = 1600ms before jitter
  auto late = RetryExecutor::BackoffDelay(Policies::kDefault, 5, ErrorKind::kStaleObject);
  assert(late >= std::chrono::milliseconds(1600));

  auto first = RetryExecutor::BackoffDelay(Policies::kDefault, 0, ErrorKind::kStaleObject);
  assert(first >= Policies::kDefault.base_delay);
  assert(first <= Policies::kDefault.base_delay * 2);

  auto outage = RetryExecutor::BackoffDelay(Policies::kDefault, 0, ErrorKind::kTransientConnection);
  assert(outage >= Policies::kDefault.infrastructure_delay);
  assert(outage <= Policies::kDefault.infrastructure_delay * 2);
}

} // namespace

int main() {
  TestContentionIsRetriedUntilSuccess();
  TestNonRetryableKindPropagatesImmediately();
  TestExhaustionRaisesServiceUnavailable();
  TestTransientConnectionIsRetriedWithSlowerBackoff();
  TestDeadlineStopsRetrying();
  TestBackoffIsBoundedAndGrows();

  std::cout << "flowlock_unit_retry_executor: pass\n";
  return 0;
}
