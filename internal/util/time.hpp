#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

namespace ledger::util {

/*
  Time utilities; the one place that reads the clock.

  Kernel components never read the clock themselves; they take now_ms
  from the caller so tests can drive them with a fake clock.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Millisecond clock injected into the kernel and background workers.
using MillisClock = std::function<int64_t()>;

TimePoint Now();

int64_t NowMs();

int64_t ToUnixMillis(TimePoint tp);

MillisClock SystemMillisClock();

} // namespace ledger::util
