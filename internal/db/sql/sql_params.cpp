#include "sql_params.hpp"

#include <sstream>
#include <type_traits>

namespace strata::db::sql {

std::string FormatParams(const Params& params) {
  std::ostringstream out;
  out << '[';
  bool first = true;
  for (const auto& param : params) {
    if (!first) out << ", ";
    first = false;

    std::visit(
        [&out](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out << "NULL";
          } else if constexpr (std::is_same_v<T, bool>) {
            out << (value ? "true" : "false");
          } else if constexpr (std::is_same_v<T, std::string>) {
            out << '"' << value << '"';
          } else {
            out << value;
          }
        },
        param);
  }
  out << ']';
  return out.str();
}

} // namespace strata::db::sql
