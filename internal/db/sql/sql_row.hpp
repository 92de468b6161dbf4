#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace strata::db::sql {

/*
  Generic row.

  Backends materialize their result rows into this (postgres: pqxx::row)
  so driver types never leak into callers. Values are kept in their text
  form; the typed getters parse on access and throw std::invalid_argument
  on mismatch and std::out_of_range on a bad column.
*/

using ColumnNames = std::vector<std::string>;

class Row {
 public:
  Row() = default;
  Row(std::shared_ptr<const ColumnNames> columns, std::vector<std::optional<std::string>> values);

  std::size_t Size() const {
    return values_.size();
  }

  std::size_t ColumnIndex(std::string_view name) const;

  bool IsNull(std::size_t col) const;
  bool IsNull(std::string_view column) const {
    return IsNull(ColumnIndex(column));
  }

  std::string GetText(std::size_t col) const;
  std::string GetText(std::string_view column) const {
    return GetText(ColumnIndex(column));
  }

  int64_t GetInt64(std::size_t col) const;
  int64_t GetInt64(std::string_view column) const {
    return GetInt64(ColumnIndex(column));
  }

  bool GetBool(std::size_t col) const;

  uint64_t GetU64(std::size_t col) const {
    return static_cast<uint64_t>(GetInt64(col));
  }

 private:
  const std::optional<std::string>& At(std::size_t col) const;

  std::shared_ptr<const ColumnNames>      columns_;
  std::vector<std::optional<std::string>> values_;
};

class Rows {
 public:
  using const_iterator = std::vector<Row>::const_iterator;

  Rows() = default;
  Rows(std::shared_ptr<const ColumnNames> columns, std::vector<Row> rows)
      : columns_(std::move(columns)), rows_(std::move(rows)) {
  }

  const ColumnNames& Columns() const;

  std::size_t size() const {
    return rows_.size();
  }
  bool empty() const {
    return rows_.empty();
  }
  const Row& operator[](std::size_t i) const {
    return rows_[i];
  }
  const_iterator begin() const {
    return rows_.begin();
  }
  const_iterator end() const {
    return rows_.end();
  }

 private:
  std::shared_ptr<const ColumnNames> columns_;
  std::vector<Row>                   rows_;
};

// Builds a Rows from literal text values; used by drivers and test doubles.
Rows MakeRows(ColumnNames columns, const std::vector<std::vector<std::optional<std::string>>>& values);

} // namespace strata::db::sql
