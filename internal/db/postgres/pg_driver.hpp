#pragma once

#include <memory>

#include "internal/db/api/driver.hpp"
#include "pg_pool.hpp"

namespace strata::db::postgres {

/*
  PgDriver

  Driver over a PgPool. Direct queries (Get/Query/Exec) run as a single
  READ COMMITTED transaction that commits right away, which is what an
  autocommit statement gets from postgres anyway, plus the context's
  deadline and cancellation.
*/
class PgDriver final : public Driver {
 public:
  explicit PgDriver(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin(const TransactionOptions& options) override;

  sql::Row  Get(const util::Context& ctx, const std::string& query, const sql::Params& params) override;
  sql::Rows Query(const util::Context& ctx, const std::string& query, const sql::Params& params) override;
  uint64_t  Exec(const util::Context& ctx, const std::string& query, const sql::Params& params) override;

  PoolStats Stats() const override;
  void      Close() override;

 private:
  TransactionOptions StatementOptions(const util::Context& ctx) const;

  std::shared_ptr<PgPool> pool_;
};

} // namespace strata::db::postgres
