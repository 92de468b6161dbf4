#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "internal/db/api/transaction_options.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/util/context.hpp"

namespace strata::db {

/*
  Where transactions come from. Each Begin() hands out a handle that owns
  one connection until it is destroyed.
*/
class TransactionSource {
 public:
  virtual ~TransactionSource() = default;

  virtual std::unique_ptr<Transaction> Begin(const TransactionOptions& options) = 0;
};

/*
  Driver

  Seam between the Database facade and the database. Direct queries run
  as single autocommit statements on a pooled connection and observe the
  given context.

  Postgres: PgDriver (libpqxx)
*/
class Driver : public TransactionSource {
 public:
  // Single row; throws util::NotFound when there is none.
  virtual sql::Row Get(const util::Context& ctx, const std::string& query, const sql::Params& params) = 0;

  virtual sql::Rows Query(const util::Context& ctx, const std::string& query, const sql::Params& params) = 0;

  // Returns rows affected.
  virtual uint64_t Exec(const util::Context& ctx, const std::string& query, const sql::Params& params) = 0;

  virtual PoolStats Stats() const = 0;

  virtual void Close() = 0;
};

} // namespace strata::db
