#pragma once

#include <cstdint>
#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace strata::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL implementations:

  - Changes are invisible until Commit()
  - Rollback() discards all writes
  - Exactly one of Commit()/Rollback() ends the transaction; the handle
    is dead afterwards and must not be reused
  - Destructor MUST rollback if neither was called
  - The handle owns its connection; destroying it returns the connection

  Postgres: pqxx::work + SET TRANSACTION
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // Single row; throws util::NotFound when the query returns none.
  virtual sql::Row Get(const std::string& query, const sql::Params& params = {}) = 0;

  virtual sql::Rows Query(const std::string& query, const sql::Params& params = {}) = 0;

  // Returns rows affected.
  virtual uint64_t Exec(const std::string& query, const sql::Params& params = {}) = 0;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;
};

} // namespace strata::db
