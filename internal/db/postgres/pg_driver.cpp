#include "pg_driver.hpp"

#include <stdexcept>
#include <utility>

#include "pg_tx.hpp"

namespace strata::db::postgres {

PgDriver::PgDriver(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
  if (!pool_) {
    throw std::invalid_argument("postgres driver requires a connection pool");
  }
}

std::unique_ptr<Transaction> PgDriver::Begin(const TransactionOptions& options) {
  return std::make_unique<PgTransaction>(pool_, options);
}

TransactionOptions PgDriver::StatementOptions(const util::Context& ctx) const {
  TransactionOptions options;
  options.isolation_level = IsolationLevel::kReadCommitted;
  // the facade reports these itself
  options.logger  = observability::Logger::Discard();
  options.context = ctx;
  return options;
}

sql::Row PgDriver::Get(const util::Context& ctx, const std::string& query, const sql::Params& params) {
  PgTransaction tx(pool_, StatementOptions(ctx));
  auto          row = tx.Get(query, params);
  tx.Commit();
  return row;
}

sql::Rows PgDriver::Query(const util::Context& ctx, const std::string& query, const sql::Params& params) {
  PgTransaction tx(pool_, StatementOptions(ctx));
  auto          rows = tx.Query(query, params);
  tx.Commit();
  return rows;
}

uint64_t PgDriver::Exec(const util::Context& ctx, const std::string& query, const sql::Params& params) {
  PgTransaction tx(pool_, StatementOptions(ctx));
  auto          affected = tx.Exec(query, params);
  tx.Commit();
  return affected;
}

PoolStats PgDriver::Stats() const {
  return pool_->Stats();
}

void PgDriver::Close() {
  pool_->Close();
}

} // namespace strata::db::postgres
