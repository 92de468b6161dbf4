#pragma once

#include <functional>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/context.hpp"

namespace strata::db {

/*
  Per-call transaction settings.

  Built from defaults (or from the facade's bound logger/context), then
  each TxOption is applied in order; a later option wins for the field it
  sets. Not modified after Execute() starts.
*/
struct TransactionOptions {
  IsolationLevel        isolation_level = IsolationLevel::kSerializable;
  bool                  read_only       = false;
  observability::Logger logger;
  util::Context         context;
};

using TxOption = std::function<void(TransactionOptions&)>;

TxOption ReadOnly();
TxOption WithIsolation(IsolationLevel level);
TxOption WithLogger(observability::Logger logger);
TxOption WithContext(util::Context context);

TransactionOptions DefaultTransactionOptions();

TransactionOptions ApplyOptions(TransactionOptions base, const std::vector<TxOption>& options);

} // namespace strata::db
