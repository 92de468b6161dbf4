#include "context.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace strata::util {

Context Context::WithStopToken(std::stop_token token) const {
  Context derived     = *this;
  derived.stop_token_ = std::move(token);
  return derived;
}

Context Context::WithDeadline(TimePoint deadline) const {
  Context derived = *this;
  // a derived context can only shorten the parent's deadline
  if (!derived.deadline_ || deadline < *derived.deadline_) {
    derived.deadline_ = deadline;
  }
  return derived;
}

Context Context::WithTimeout(Duration timeout) const {
  return WithDeadline(Now() + timeout);
}

Context Context::WithLogField(observability::LogField field) const {
  Context derived = *this;
  derived.log_fields_.push_back(std::move(field));
  return derived;
}

bool Context::DeadlinePassed() const {
  return deadline_.has_value() && Now() >= *deadline_;
}

std::optional<std::chrono::milliseconds> Context::Remaining() const {
  if (!deadline_) {
    return std::nullopt;
  }
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Now());
  return std::max(left, std::chrono::milliseconds::zero());
}

void Context::ThrowIfDone() const {
  if (StopRequested()) {
    throw Cancelled();
  }
  if (DeadlinePassed()) {
    throw DeadlineExceeded();
  }
}

} // namespace strata::util
