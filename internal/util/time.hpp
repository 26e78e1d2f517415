#pragma once

#include <chrono>
#include <cstdint>

#include <google/protobuf/duration.pb.h>

namespace flowlock::util {

/*
  Time utilities. Single place to control clock sources.

  Wall clock:   audit timestamps and lock expiry shared across processes.
  Steady clock: in-process TTLs, backoff and latency measurement.
*/

using Clock           = std::chrono::system_clock;
using TimePoint       = Clock::time_point;
using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint       Now();
SteadyTimePoint SteadyNow();

uint64_t NowUnixMillis();
uint64_t ToUnixMillis(TimePoint tp);

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);

// Elapsed milliseconds since start, measured on the steady clock.
uint64_t ElapsedMillis(SteadyTimePoint start);

} // namespace flowlock::util
