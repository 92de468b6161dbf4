#include "internal/db/sql/sql_row.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/db/sql/sql_params.hpp"

namespace {

using strata::db::sql::FormatParams;
using strata::db::sql::MakeRows;
using strata::db::sql::Params;

void TestTypedGetters() {
  auto rows = MakeRows({"id", "name", "active", "deleted_at"}, {{"42", "main", "t", std::nullopt}, {"-7", "dev", "false", "2024-01-01"}});

  assert(rows.size() == 2);
  assert(rows.Columns().size() == 4);

  const auto& first = rows[0];
  assert(first.Size() == 4);
  assert(first.GetInt64("id") == 42);
  assert(first.GetU64(0) == 42);
  assert(first.GetText("name") == "main");
  assert(first.GetBool(2));
  assert(first.IsNull("deleted_at"));
  assert(!first.IsNull(0));

  const auto& second = rows[1];
  assert(second.GetInt64(0) == -7);
  assert(!second.GetBool(2));
  assert(second.GetText(3) == "2024-01-01");
}

void TestGetterErrors() {
  auto rows = MakeRows({"id", "note"}, {{"abc", std::nullopt}});
  const auto& row = rows[0];

  bool threw = false;
  try {
    row.GetInt64("id");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    row.GetText("note");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    row.ColumnIndex("missing");
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    row.GetText(5);
  } catch (const std::out_of_range&) {
    threw = true;
  }
  assert(threw);
}

void TestIteration() {
  auto rows = MakeRows({"n"}, {{"1"}, {"2"}, {"3"}});
  int64_t sum = 0;
  for (const auto& row : rows) {
    sum += row.GetInt64(0);
  }
  assert(sum == 6);
  assert(MakeRows({"n"}, {}).empty());
}

void TestFormatParams() {
  Params params{int64_t{1}, std::string("repo"), nullptr, true, 2.5};
  assert(FormatParams(params) == "[1, \"repo\", NULL, true, 2.5]");
  assert(FormatParams({}) == "[]");
}

} // namespace

int main() {
  TestTypedGetters();
  TestGetterErrors();
  TestIteration();
  TestFormatParams();

  std::cout << "strata_db_unit_sql_row: pass\n";
  return 0;
}
