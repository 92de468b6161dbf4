#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace strata::db::sql {

/*
  Parameter abstraction.

  Postgres placeholders are positional ($1 $2 $3); Params binds in order.
*/

using Param = std::variant<
    std::nullptr_t,
    bool,
    int32_t,
    int64_t,
    uint64_t,
    double,
    std::string
>;

using Params = std::vector<Param>;

// [1, "repo", NULL]; for log fields only, never for building SQL.
std::string FormatParams(const Params& params);

} // namespace strata::db::sql
