#include "internal/db/query_instrumentation.hpp"

#include "internal/observability/metrics.hpp"

namespace strata::db {

using observability::DurationField;
using observability::StringField;

void SlowQueryReporter::Report(const observability::Logger& logger, std::string_view kind, const std::string& query, const sql::Params& params,
                               util::Duration elapsed, const char* error) const {
  observability::Metrics::Instance().ObserveQueryDurationMs(kind, util::ToMillis(elapsed));

  if (elapsed <= threshold_) {
    return;
  }

  auto entry = logger.WithFields({StringField("type", kind), StringField("query", query), StringField("args", sql::FormatParams(params)),
                                  DurationField("duration", elapsed)});
  if (error != nullptr) {
    entry = entry.WithField(observability::ErrorField(error));
  }
  entry.Info("database done");
}

} // namespace strata::db
