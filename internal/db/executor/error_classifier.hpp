#pragma once

#include <exception>
#include <functional>
#include <string_view>

namespace strata::db {

enum class ErrorKind {
  kNone,
  kSerializationConflict,
  kOther,
};

/*
  Decides whether an error is a serialization conflict worth retrying.

  Must be pure: no I/O, no state. The executor never looks at driver
  types itself; the driver supplies the predicate
  (see postgres/pg_errors.hpp).
*/
using ErrorClassifier = std::function<bool(const std::exception_ptr&)>;

// SQLSTATE 40001 serialization_failure, 40P01 deadlock_detected.
inline constexpr std::string_view kSqlStateSerializationFailure = "40001";
inline constexpr std::string_view kSqlStateDeadlockDetected     = "40P01";

bool IsSerializationSqlState(std::string_view sqlstate);

ErrorKind Classify(const ErrorClassifier& classifier, const std::exception_ptr& error);

} // namespace strata::db
