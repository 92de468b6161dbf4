#include "sql_row.hpp"

#include <charconv>
#include <stdexcept>

namespace strata::db::sql {

Row::Row(std::shared_ptr<const ColumnNames> columns, std::vector<std::optional<std::string>> values)
    : columns_(std::move(columns)), values_(std::move(values)) {
}

std::size_t Row::ColumnIndex(std::string_view name) const {
  if (columns_) {
    for (std::size_t i = 0; i < columns_->size(); ++i) {
      if ((*columns_)[i] == name) return i;
    }
  }
  throw std::out_of_range("no such column: " + std::string(name));
}

const std::optional<std::string>& Row::At(std::size_t col) const {
  if (col >= values_.size()) {
    throw std::out_of_range("column index " + std::to_string(col) + " out of range");
  }
  return values_[col];
}

bool Row::IsNull(std::size_t col) const {
  return !At(col).has_value();
}

std::string Row::GetText(std::size_t col) const {
  const auto& value = At(col);
  if (!value) {
    throw std::invalid_argument("column " + std::to_string(col) + " is NULL");
  }
  return *value;
}

int64_t Row::GetInt64(std::size_t col) const {
  const auto text   = GetText(col);
  int64_t    parsed = 0;
  auto [ptr, ec]    = std::from_chars(text.data(), text.data() + text.size(), parsed);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    throw std::invalid_argument("column " + std::to_string(col) + " is not an integer: " + text);
  }
  return parsed;
}

bool Row::GetBool(std::size_t col) const {
  const auto text = GetText(col);
  // postgres renders booleans as t/f
  if (text == "t" || text == "true") return true;
  if (text == "f" || text == "false") return false;
  throw std::invalid_argument("column " + std::to_string(col) + " is not a boolean: " + text);
}

const ColumnNames& Rows::Columns() const {
  static const ColumnNames kEmpty;
  return columns_ ? *columns_ : kEmpty;
}

Rows MakeRows(ColumnNames columns, const std::vector<std::vector<std::optional<std::string>>>& values) {
  auto             shared = std::make_shared<const ColumnNames>(std::move(columns));
  std::vector<Row> rows;
  rows.reserve(values.size());
  for (const auto& row : values) {
    rows.emplace_back(shared, row);
  }
  return Rows(std::move(shared), std::move(rows));
}

} // namespace strata::db::sql
