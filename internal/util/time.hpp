#pragma once

#include <chrono>
#include <cstdint>

namespace miner::util {

/*
  Time utilities; single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

uint64_t NowMs();

// Milliseconds elapsed on the steady clock since `start`.
double ElapsedMs(std::chrono::steady_clock::time_point start);

} // namespace miner::util
