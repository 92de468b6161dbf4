#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace strata::db {

enum class IsolationLevel {
  kReadCommitted,
  kRepeatableRead,
  kSerializable,
};

// SQL spelling, e.g. "SERIALIZABLE".
std::string_view ToSql(IsolationLevel level);

// Accepts "read_committed", "repeatable_read", "serializable"
// (case-insensitive); throws util::InvalidConfig otherwise.
IsolationLevel ParseIsolationLevel(std::string_view name);

struct PoolStats {
  std::uint32_t             max_open_connections = 0;
  std::uint32_t             open_connections     = 0;
  std::uint32_t             in_use               = 0;
  std::uint32_t             idle                 = 0;
  std::uint64_t             wait_count           = 0;
  std::chrono::nanoseconds  wait_duration{0};
};

using MetadataMap = std::map<std::string, std::string>;

} // namespace strata::db
