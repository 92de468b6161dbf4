#include "internal/db/executor/error_classifier.hpp"

namespace strata::db {

bool IsSerializationSqlState(std::string_view sqlstate) {
  return sqlstate == kSqlStateSerializationFailure || sqlstate == kSqlStateDeadlockDetected;
}

ErrorKind Classify(const ErrorClassifier& classifier, const std::exception_ptr& error) {
  if (!error) {
    return ErrorKind::kNone;
  }
  if (classifier && classifier(error)) {
    return ErrorKind::kSerializationConflict;
  }
  return ErrorKind::kOther;
}

} // namespace strata::db
