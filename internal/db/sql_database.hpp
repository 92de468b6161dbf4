#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/database.hpp"
#include "internal/db/api/driver.hpp"
#include "internal/db/executor/error_classifier.hpp"
#include "internal/db/executor/retry_policy.hpp"
#include "internal/db/executor/transaction_executor.hpp"
#include "internal/db/query_instrumentation.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/context.hpp"

namespace strata::db {

struct DatabaseSettings {
  RetryPolicy                  retry_policy;
  ErrorClassifier              classifier;
  IsolationLevel               default_isolation    = IsolationLevel::kSerializable;
  std::chrono::nanoseconds     slow_query_threshold = SlowQueryReporter::kDefaultThreshold;
  TransactionExecutor::Sleeper sleeper;
  // used when no context is bound, and as the parent of derived loggers
  observability::Logger        logger;
};

/*
  SqlDatabase

  The Database facade. Direct queries go to the driver through the slow
  query middleware; Run()/Execute() go through a TransactionExecutor
  shared by every instance derived from this one.

  Instances are immutable after construction. WithContext() returns a
  fresh instance sharing the driver and executor but with its own logger
  and context.
*/
class SqlDatabase final : public Database {
 public:
  SqlDatabase(std::shared_ptr<Driver> driver, DatabaseSettings settings);

  sql::Row  Get(const std::string& query, const sql::Params& params = {}) override;
  sql::Rows Query(const std::string& query, const sql::Params& params = {}) override;
  uint64_t  Exec(const std::string& query, const sql::Params& params = {}) override;

  void Run(const Work& fn, const std::vector<TxOption>& options) override;

  MetadataMap Metadata() override;
  PoolStats   Stats() const override;

  std::shared_ptr<Database> WithContext(const util::Context& ctx) const override;

  void Close() override;

 private:
  struct QueryOptions {
    observability::Logger logger;
    util::Context         context;
  };

  SqlDatabase(std::shared_ptr<Driver> driver, std::shared_ptr<const TransactionExecutor> executor, SlowQueryReporter reporter,
              IsolationLevel default_isolation, observability::Logger base_logger, std::optional<QueryOptions> query_options);

  const observability::Logger& CurrentLogger() const;
  const util::Context&         CurrentContext() const;

  std::optional<std::string> TryScalar(const std::string& query);

  std::shared_ptr<Driver>                    driver_;
  std::shared_ptr<const TransactionExecutor> executor_;
  SlowQueryReporter                          reporter_;
  IsolationLevel                             default_isolation_;
  observability::Logger                      base_logger_;
  std::optional<QueryOptions>                query_options_;
};

} // namespace strata::db
