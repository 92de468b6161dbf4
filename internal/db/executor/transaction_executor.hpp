#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <type_traits>

#include "internal/db/api/database.hpp"
#include "internal/db/api/driver.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/transaction_options.hpp"
#include "internal/db/executor/error_classifier.hpp"
#include "internal/db/executor/retry_policy.hpp"

namespace strata::db {

/*
  TransactionExecutor

  Runs caller work inside a transaction and retries the whole thing when
  the database aborts it with a serialization conflict.

  Per attempt:
    begin -> fn(tx) -> commit            success, return
                    -> fn threw          rollback, retry on conflict
                    -> commit threw      retry on conflict

  Everything that is not a conflict is rethrown unmodified:
    - Begin() failures (no rollback, nothing began)
    - Rollback() failures, even when fn's error was a conflict
    - fn errors and Commit() errors the classifier rejects
    - util::Cancelled / util::DeadlineExceeded, checked before each begin

  When every attempt ended in a conflict, util::SerializationError is
  thrown instead of the last driver error.

  fn may run several times and must only have effects through tx.

  The executor is stateless between calls and may be shared by threads;
  each attempt borrows its own connection and returns it before the
  next backoff.
*/
class TransactionExecutor {
 public:
  using Work    = std::function<void(Transaction&)>;
  using Sleeper = std::function<void(std::chrono::nanoseconds)>;

  TransactionExecutor(std::shared_ptr<TransactionSource> source, RetryPolicy policy, ErrorClassifier classifier,
                      Sleeper sleeper = DefaultSleeper());

  static Sleeper DefaultSleeper();

  void Run(const Work& fn, const TransactionOptions& options) const;

  template <typename Fn>
  auto Execute(Fn&& fn, const TransactionOptions& options) const -> std::invoke_result_t<Fn&, Transaction&> {
    return detail::InvokeCapturing(fn, [this, &options](const Work& work) { Run(work, options); });
  }

 private:
  void RunAttempts(const Work& fn, const TransactionOptions& options) const;

  std::shared_ptr<TransactionSource> source_;
  RetryPolicy                        policy_;
  ErrorClassifier                    classifier_;
  Sleeper                            sleeper_;
};

} // namespace strata::db
