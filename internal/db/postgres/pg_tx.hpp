#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <pqxx/pqxx>
#include <stop_token>

#include "internal/db/api/transaction.hpp"
#include "internal/db/api/transaction_options.hpp"
#include "internal/observability/logging.hpp"
#include "pg_pool.hpp"

namespace strata::db::postgres {

/*
  PgTransaction

  One pqxx::work on a connection borrowed from the pool for the life of
  this object. The constructor is the begin: it acquires the connection,
  opens the transaction and applies

    SET TRANSACTION ISOLATION LEVEL <level> READ ONLY|READ WRITE
    SET LOCAL statement_timeout = <time left>     (only with a deadline)

  A stop request on the options' context cancels the running statement
  (pqxx::connection::cancel_query); the statement then fails with
  pqxx::query_canceled.
*/
class PgTransaction final : public db::Transaction {
 public:
  PgTransaction(std::shared_ptr<PgPool> pool, const TransactionOptions& options);
  ~PgTransaction();

  PgTransaction(const PgTransaction&)            = delete;
  PgTransaction& operator=(const PgTransaction&) = delete;

  sql::Row  Get(const std::string& query, const sql::Params& params) override;
  sql::Rows Query(const std::string& query, const sql::Params& params) override;
  uint64_t  Exec(const std::string& query, const sql::Params& params) override;

  void Commit() override;
  void Rollback() override;

 private:
  pqxx::result Run(const char* kind, const std::string& query, const sql::Params& params);
  void         EnsureOpen() const;

  observability::Logger                                  logger_;
  std::shared_ptr<pqxx::connection>                      conn_;
  std::unique_ptr<pqxx::work>                            tx_;
  std::optional<std::stop_callback<std::function<void()>>> cancel_;
  bool finished_ = false;
};

// Driver-neutral copy of a pqxx result.
sql::Rows ToRows(const pqxx::result& result);

pqxx::params ToPqxxParams(const sql::Params& params);

} // namespace strata::db::postgres
