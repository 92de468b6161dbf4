#include "time.hpp"

#include <cstdio>

namespace strata::util {

TimePoint Now() {
  return Clock::now();
}

double ToMillis(Duration d) {
  return std::chrono::duration<double, std::milli>(d).count();
}

std::string FormatDuration(Duration d) {
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(d).count();

  char buf[32];
  if (nanos >= 1'000'000'000) {
    std::snprintf(buf, sizeof(buf), "%.3gs", static_cast<double>(nanos) / 1e9);
  } else if (nanos >= 1'000'000) {
    std::snprintf(buf, sizeof(buf), "%.3gms", static_cast<double>(nanos) / 1e6);
  } else if (nanos >= 1'000) {
    std::snprintf(buf, sizeof(buf), "%.3gus", static_cast<double>(nanos) / 1e3);
  } else {
    std::snprintf(buf, sizeof(buf), "%lldns", static_cast<long long>(nanos));
  }
  return buf;
}

} // namespace strata::util
