#include "pg_tx.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <type_traits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace strata::db::postgres {

using observability::DurationField;
using observability::StringField;

PgTransaction::PgTransaction(std::shared_ptr<PgPool> pool, const TransactionOptions& options)
    : logger_(options.logger) {
  options.context.ThrowIfDone();

  conn_ = pool->Acquire(options.context);
  tx_   = std::make_unique<pqxx::work>(*conn_);

  std::string set_tx = "SET TRANSACTION ISOLATION LEVEL ";
  set_tx += ToSql(options.isolation_level);
  set_tx += options.read_only ? " READ ONLY" : " READ WRITE";
  tx_->exec(set_tx);

  if (auto remaining = options.context.Remaining()) {
    // 0 would disable the timeout
    auto timeout_ms = std::max<long long>(remaining->count(), 1);
    tx_->exec("SET LOCAL statement_timeout = " + std::to_string(timeout_ms));
  }

  if (options.context.StopToken().stop_possible()) {
    pqxx::connection* raw = conn_.get();
    cancel_.emplace(options.context.StopToken(), std::function<void()>([raw] { raw->cancel_query(); }));
    // a stop landing before the callback was registered had nothing to cancel
    if (options.context.StopRequested()) {
      throw util::Cancelled();
    }
  }
}

PgTransaction::~PgTransaction() {
  cancel_.reset();
  if (!finished_) {
    try {
      tx_->abort();
    } catch (const std::exception& e) {
      logger_.Warn("implicit rollback failed", {observability::ErrorField(e.what())});
    }
  }
}

void PgTransaction::EnsureOpen() const {
  if (finished_) {
    throw std::logic_error("transaction already finished");
  }
}

pqxx::result PgTransaction::Run(const char* kind, const std::string& query, const sql::Params& params) {
  EnsureOpen();

  const auto start = util::Now();
  auto       res   = params.empty() ? tx_->exec(query) : tx_->exec_params(query, ToPqxxParams(params));
  logger_.Trace("database done", {StringField("type", kind), StringField("query", query), StringField("args", sql::FormatParams(params)),
                                  DurationField("duration", util::Now() - start)});
  return res;
}

sql::Row PgTransaction::Get(const std::string& query, const sql::Params& params) {
  auto rows = ToRows(Run("get", query, params));
  if (rows.empty()) {
    throw util::NotFound("no rows in result set");
  }
  return rows[0];
}

sql::Rows PgTransaction::Query(const std::string& query, const sql::Params& params) {
  return ToRows(Run("query", query, params));
}

uint64_t PgTransaction::Exec(const std::string& query, const sql::Params& params) {
  return static_cast<uint64_t>(Run("exec", query, params).affected_rows());
}

void PgTransaction::Commit() {
  EnsureOpen();
  finished_ = true;
  tx_->commit();
}

void PgTransaction::Rollback() {
  EnsureOpen();
  finished_ = true;
  tx_->abort();
}

sql::Rows ToRows(const pqxx::result& result) {
  sql::ColumnNames columns;
  const auto       width = result.columns();
  columns.reserve(static_cast<std::size_t>(width));
  for (pqxx::row::size_type i = 0; i < width; ++i) {
    columns.emplace_back(result.column_name(i));
  }

  auto                  shared = std::make_shared<const sql::ColumnNames>(std::move(columns));
  std::vector<sql::Row> rows;
  rows.reserve(static_cast<std::size_t>(result.size()));
  for (const auto& row : result) {
    std::vector<std::optional<std::string>> values;
    values.reserve(static_cast<std::size_t>(width));
    for (const auto& field : row) {
      if (field.is_null()) {
        values.emplace_back(std::nullopt);
      } else {
        values.emplace_back(std::string(field.c_str(), field.size()));
      }
    }
    rows.emplace_back(shared, std::move(values));
  }
  return sql::Rows(std::move(shared), std::move(rows));
}

pqxx::params ToPqxxParams(const sql::Params& params) {
  pqxx::params out;
  for (const auto& param : params) {
    std::visit(
        [&out](const auto& value) {
          using T = std::decay_t<decltype(value)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            out.append();
          } else {
            out.append(value);
          }
        },
        param);
  }
  return out;
}

}
