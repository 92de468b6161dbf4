#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/db/postgres/pg_driver.hpp"
#include "internal/db/postgres/pg_errors.hpp"
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/util/errors.hpp"

namespace strata::factory {

namespace {

constexpr std::size_t kDefaultMaxConnections = 16;

db::RetryPolicy BuildRetryPolicy(const strata::runtime::config::TransactionConfig& tx) {
  if (tx.max_attempts() < 0) {
    throw util::InvalidConfig("database.transactions.max_attempts must be >= 1");
  }
  if (tx.backoff_unit_ms() < 0) {
    throw util::InvalidConfig("database.transactions.backoff_unit_ms must not be negative");
  }

  const int  max_attempts = tx.max_attempts() == 0 ? db::RetryPolicy::kDefaultMaxAttempts : tx.max_attempts();
  const auto backoff_unit = tx.has_backoff_unit_ms() ? std::chrono::nanoseconds(std::chrono::milliseconds(tx.backoff_unit_ms()))
                                                     : std::chrono::nanoseconds(db::RetryPolicy::kDefaultBackoffUnit);
  return db::RetryPolicy(max_attempts, backoff_unit);
}

} // namespace

db::DatabaseSettings BuildDatabaseSettings(const strata::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();

  db::DatabaseSettings settings;
  settings.retry_policy = BuildRetryPolicy(database.transactions());
  settings.classifier   = db::postgres::IsSerializationConflict;

  if (!database.transactions().default_isolation().empty()) {
    settings.default_isolation = db::ParseIsolationLevel(database.transactions().default_isolation());
  }

  if (database.slow_query_threshold_ms() < 0) {
    throw util::InvalidConfig("database.slow_query_threshold_ms must not be negative");
  }
  if (database.has_slow_query_threshold_ms()) {
    settings.slow_query_threshold = std::chrono::milliseconds(database.slow_query_threshold_ms());
  }
  return settings;
}

Runtime Build(const strata::runtime::config::RuntimeConfig& config) {
  const auto& postgres = config.database().postgres();
  if (postgres.connection_uri().empty()) {
    throw util::InvalidConfig("database.postgres.connection_uri is required");
  }

  auto settings = BuildDatabaseSettings(config);

  const std::size_t max_connections = postgres.max_connections() == 0 ? kDefaultMaxConnections : postgres.max_connections();
  auto              pool            = std::make_shared<db::postgres::PgPool>(postgres.connection_uri(), max_connections);
  auto              driver          = std::make_shared<db::postgres::PgDriver>(std::move(pool));

  Runtime runtime;
  runtime.database    = std::make_shared<db::SqlDatabase>(std::move(driver), std::move(settings));
  runtime.dedup_index = std::make_shared<index::DedupIndex>(runtime.database);
  return runtime;
}

} // namespace strata::factory
