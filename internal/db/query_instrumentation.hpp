#pragma once

#include <chrono>
#include <exception>
#include <string>
#include <string_view>

#include "internal/db/sql/sql_params.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace strata::db {

/*
  SlowQueryReporter

  Middleware wrapped around every direct query primitive. Times the call
  and, only when it took longer than the threshold, logs one
  "database done" entry with type, query, args, duration and the error
  if it threw. Every call's duration goes to metrics.
*/
class SlowQueryReporter {
 public:
  static constexpr std::chrono::milliseconds kDefaultThreshold{100};

  explicit SlowQueryReporter(std::chrono::nanoseconds threshold = kDefaultThreshold) : threshold_(threshold) {
  }

  template <typename Fn>
  auto Instrument(const observability::Logger& logger, std::string_view kind, const std::string& query, const sql::Params& params, Fn&& fn)
      -> decltype(fn()) {
    const auto start = util::Now();
    try {
      auto result = fn();
      Report(logger, kind, query, params, util::Now() - start, nullptr);
      return result;
    } catch (const std::exception& e) {
      Report(logger, kind, query, params, util::Now() - start, e.what());
      throw;
    } catch (...) {
      Report(logger, kind, query, params, util::Now() - start, "unknown error");
      throw;
    }
  }

 private:
  void Report(const observability::Logger& logger, std::string_view kind, const std::string& query, const sql::Params& params,
              util::Duration elapsed, const char* error) const;

  std::chrono::nanoseconds threshold_;
};

} // namespace strata::db
