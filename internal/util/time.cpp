#include "time.hpp"

namespace ledger::util {

TimePoint Now() {
  return Clock::now();
}

int64_t NowMs() {
  return ToUnixMillis(Now());
}

int64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

MillisClock SystemMillisClock() {
  return [] { return NowMs(); };
}

} // namespace ledger::util
