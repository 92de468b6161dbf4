#include "internal/db/api/types.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "internal/util/errors.hpp"

namespace strata::db {

std::string_view ToSql(IsolationLevel level) {
  switch (level) {
    case IsolationLevel::kReadCommitted:
      return "READ COMMITTED";
    case IsolationLevel::kRepeatableRead:
      return "REPEATABLE READ";
    case IsolationLevel::kSerializable:
      return "SERIALIZABLE";
  }
  return "SERIALIZABLE";
}

IsolationLevel ParseIsolationLevel(std::string_view name) {
  std::string lowered(name);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });

  if (lowered == "read_committed") return IsolationLevel::kReadCommitted;
  if (lowered == "repeatable_read") return IsolationLevel::kRepeatableRead;
  if (lowered == "serializable") return IsolationLevel::kSerializable;

  throw util::InvalidConfig("unknown isolation level: " + std::string(name));
}

} // namespace strata::db
