#include "time.hpp"

namespace flowlock::util {

TimePoint Now() {
  return Clock::now();
}

SteadyTimePoint SteadyNow() {
  return SteadyClock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

uint64_t NowUnixMillis() {
  return ToUnixMillis(Now());
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

uint64_t ElapsedMillis(SteadyTimePoint start) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(SteadyNow() - start).count());
}

} // namespace flowlock::util
