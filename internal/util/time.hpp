#pragma once

#include <chrono>
#include <cstdint>

namespace voucher::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

inline constexpr int64_t kMillisPerDay = 24LL * 60 * 60 * 1000;

TimePoint Now();

int64_t ToUnixMillis(TimePoint tp);
int64_t NowMillis();

} // namespace voucher::util
