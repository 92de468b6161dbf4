#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace strata::util {

/*
  Time utilities; the one place that picks the clock source.

  Durations are measured on the steady clock; deadlines too, so a wall
  clock jump never cancels a transaction.
*/

using Clock     = std::chrono::steady_clock;
using TimePoint = Clock::time_point;
using Duration  = Clock::duration;

TimePoint Now();

double ToMillis(Duration d);

// "12.5ms", "3s", "250us"
std::string FormatDuration(Duration d);

} // namespace strata::util
