#pragma once

#include <chrono>
#include <optional>
#include <stop_token>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace strata::util {

/*
  Context

  Cooperative cancellation carried through a call chain: a stop token,
  an optional deadline, and log fields identifying the caller (request
  id, user, ...). Values are immutable; the With* builders return a copy.

  A default-constructed Context is never done.
*/
class Context {
 public:
  Context() = default;

  static Context Background() {
    return Context{};
  }

  Context WithStopToken(std::stop_token token) const;
  Context WithDeadline(TimePoint deadline) const;
  Context WithTimeout(Duration timeout) const;
  Context WithLogField(observability::LogField field) const;

  const std::stop_token& StopToken() const {
    return stop_token_;
  }

  const std::optional<TimePoint>& Deadline() const {
    return deadline_;
  }

  const std::vector<observability::LogField>& LogFields() const {
    return log_fields_;
  }

  bool StopRequested() const {
    return stop_token_.stop_requested();
  }

  bool DeadlinePassed() const;

  bool Done() const {
    return StopRequested() || DeadlinePassed();
  }

  // Time left before the deadline, clamped at zero; nullopt without one.
  std::optional<std::chrono::milliseconds> Remaining() const;

  // Throws Cancelled or DeadlineExceeded when done.
  void ThrowIfDone() const;

 private:
  std::stop_token                      stop_token_;
  std::optional<TimePoint>             deadline_;
  std::vector<observability::LogField> log_fields_;
};

} // namespace strata::util
