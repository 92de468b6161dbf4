#include "internal/db/api/transaction_options.hpp"

#include <utility>

namespace strata::db {

TxOption ReadOnly() {
  return [](TransactionOptions& options) { options.read_only = true; };
}

TxOption WithIsolation(IsolationLevel level) {
  return [level](TransactionOptions& options) { options.isolation_level = level; };
}

TxOption WithLogger(observability::Logger logger) {
  return [logger = std::move(logger)](TransactionOptions& options) { options.logger = logger; };
}

TxOption WithContext(util::Context context) {
  return [context = std::move(context)](TransactionOptions& options) { options.context = context; };
}

TransactionOptions DefaultTransactionOptions() {
  return TransactionOptions{};
}

TransactionOptions ApplyOptions(TransactionOptions base, const std::vector<TxOption>& options) {
  for (const auto& option : options) {
    if (option) option(base);
  }
  return base;
}

} // namespace strata::db
