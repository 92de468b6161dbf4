#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace strata::db {

/*
  RetryPolicy

  How many times a transaction is attempted when the database aborts it
  with a serialization conflict, and how long to wait in between.

  Backoff is linear: attempt i (0-based) waits backoff_unit * i before it
  begins, so attempt 0 starts immediately.
*/
class RetryPolicy {
 public:
  static constexpr int                       kDefaultMaxAttempts = 10;
  static constexpr std::chrono::milliseconds kDefaultBackoffUnit{2};

  RetryPolicy() = default;

  RetryPolicy(int max_attempts, std::chrono::nanoseconds backoff_unit) : max_attempts_(max_attempts), backoff_unit_(backoff_unit) {
    if (max_attempts_ < 1) {
      throw std::invalid_argument("retry policy: max_attempts must be >= 1, got " + std::to_string(max_attempts_));
    }
    if (backoff_unit_ < std::chrono::nanoseconds::zero()) {
      throw std::invalid_argument("retry policy: backoff_unit must not be negative");
    }
  }

  int MaxAttempts() const {
    return max_attempts_;
  }

  std::chrono::nanoseconds BackoffUnit() const {
    return backoff_unit_;
  }

  std::chrono::nanoseconds Delay(int attempt) const {
    return backoff_unit_ * attempt;
  }

 private:
  int                      max_attempts_ = kDefaultMaxAttempts;
  std::chrono::nanoseconds backoff_unit_ = kDefaultBackoffUnit;
};

} // namespace strata::db
