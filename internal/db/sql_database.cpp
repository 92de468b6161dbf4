#include "internal/db/sql_database.hpp"

#include <stdexcept>
#include <utility>

namespace strata::db {

namespace {

const util::Context kBackground;

} // namespace

SqlDatabase::SqlDatabase(std::shared_ptr<Driver> driver, DatabaseSettings settings)
    : driver_(std::move(driver)),
      reporter_(settings.slow_query_threshold),
      default_isolation_(settings.default_isolation),
      base_logger_(std::move(settings.logger)) {
  if (!driver_) {
    throw std::invalid_argument("database requires a driver");
  }
  executor_ = std::make_shared<const TransactionExecutor>(driver_, settings.retry_policy, std::move(settings.classifier),
                                                          std::move(settings.sleeper));
}

SqlDatabase::SqlDatabase(std::shared_ptr<Driver> driver, std::shared_ptr<const TransactionExecutor> executor, SlowQueryReporter reporter,
                         IsolationLevel default_isolation, observability::Logger base_logger, std::optional<QueryOptions> query_options)
    : driver_(std::move(driver)),
      executor_(std::move(executor)),
      reporter_(reporter),
      default_isolation_(default_isolation),
      base_logger_(std::move(base_logger)),
      query_options_(std::move(query_options)) {
}

const observability::Logger& SqlDatabase::CurrentLogger() const {
  return query_options_ ? query_options_->logger : base_logger_;
}

const util::Context& SqlDatabase::CurrentContext() const {
  return query_options_ ? query_options_->context : kBackground;
}

std::shared_ptr<Database> SqlDatabase::WithContext(const util::Context& ctx) const {
  QueryOptions options{base_logger_.WithFields(ctx.LogFields()), ctx};
  return std::shared_ptr<SqlDatabase>(new SqlDatabase(driver_, executor_, reporter_, default_isolation_, base_logger_, std::move(options)));
}

sql::Row SqlDatabase::Get(const std::string& query, const sql::Params& params) {
  return reporter_.Instrument(CurrentLogger(), "get", query, params, [&] { return driver_->Get(CurrentContext(), query, params); });
}

sql::Rows SqlDatabase::Query(const std::string& query, const sql::Params& params) {
  return reporter_.Instrument(CurrentLogger(), "query", query, params, [&] { return driver_->Query(CurrentContext(), query, params); });
}

uint64_t SqlDatabase::Exec(const std::string& query, const sql::Params& params) {
  return reporter_.Instrument(CurrentLogger(), "exec", query, params, [&] { return driver_->Exec(CurrentContext(), query, params); });
}

void SqlDatabase::Run(const Work& fn, const std::vector<TxOption>& options) {
  auto defaults            = DefaultTransactionOptions();
  defaults.isolation_level = default_isolation_;
  defaults.logger          = CurrentLogger();
  defaults.context         = CurrentContext();
  executor_->Run(fn, ApplyOptions(std::move(defaults), options));
}

std::optional<std::string> SqlDatabase::TryScalar(const std::string& query) {
  try {
    return Execute([&query](Transaction& tx) { return tx.Get(query).GetText(0); }, ReadOnly(),
                   WithLogger(observability::Logger::Discard()));
  } catch (const std::exception& e) {
    CurrentLogger().Debug("metadata query failed", {observability::StringField("query", query), observability::ErrorField(e.what())});
    return std::nullopt;
  }
}

MetadataMap SqlDatabase::Metadata() {
  MetadataMap metadata;

  if (auto version = TryScalar("SELECT version()")) {
    metadata["postgresql_version"] = *version;
  }
  if (auto aurora_version = TryScalar("SELECT aurora_version()")) {
    metadata["postgresql_aurora_version"] = *aurora_version;
  }

  MetadataMap settings;
  try {
    settings = Execute(
        [](Transaction& tx) {
          auto rows = tx.Query(
              "SELECT name, setting FROM pg_settings "
              "WHERE name IN ('data_directory', 'rds.extensions', 'TimeZone', 'work_mem')");

          MetadataMap found;
          for (const auto& row : rows) {
            auto name    = row.GetText("name");
            auto setting = row.GetText("setting");
            if (name == "data_directory") {
              found["is_rds"] = setting.rfind("/rdsdata", 0) == 0 ? "true" : "false";
              continue;
            }
            found[name] = setting;
          }
          return found;
        },
        ReadOnly());
  } catch (const std::exception& e) {
    CurrentLogger().Debug("metadata settings query failed", {observability::ErrorField(e.what())});
    return metadata;
  }

  for (const auto& [name, value] : settings) {
    metadata["postgresql_setting_" + name] = value;
  }
  return metadata;
}

PoolStats SqlDatabase::Stats() const {
  return driver_->Stats();
}

void SqlDatabase::Close() {
  driver_->Close();
}

} // namespace strata::db
