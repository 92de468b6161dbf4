#include "internal/db/executor/transaction_executor.hpp"

#include <stdexcept>
#include <thread>

#include "internal/observability/metrics.hpp"
#include "internal/util/errors.hpp"

namespace strata::db {

using observability::DurationField;
using observability::IntField;
using observability::Metrics;

TransactionExecutor::TransactionExecutor(std::shared_ptr<TransactionSource> source, RetryPolicy policy, ErrorClassifier classifier,
                                         Sleeper sleeper)
    : source_(std::move(source)), policy_(policy), classifier_(std::move(classifier)), sleeper_(std::move(sleeper)) {
  if (!source_) {
    throw std::invalid_argument("transaction executor requires a transaction source");
  }
  if (!classifier_) {
    throw std::invalid_argument("transaction executor requires an error classifier");
  }
  if (!sleeper_) {
    sleeper_ = DefaultSleeper();
  }
}

TransactionExecutor::Sleeper TransactionExecutor::DefaultSleeper() {
  return [](std::chrono::nanoseconds delay) { std::this_thread::sleep_for(delay); };
}

void TransactionExecutor::Run(const Work& fn, const TransactionOptions& options) const {
  try {
    RunAttempts(fn, options);
    Metrics::Instance().RecordTransaction("committed");
  } catch (const util::SerializationError&) {
    Metrics::Instance().RecordTransaction("serialization_exhausted");
    throw;
  } catch (...) {
    Metrics::Instance().RecordTransaction("error");
    throw;
  }
}

void TransactionExecutor::RunAttempts(const Work& fn, const TransactionOptions& options) const {
  const auto& logger = options.logger;

  for (int attempt = 0; attempt < policy_.MaxAttempts(); ++attempt) {
    if (attempt > 0) {
      const auto delay = policy_.Delay(attempt);
      Metrics::Instance().RecordTransactionRetry();
      logger.Warn("retrying transaction due to serialization error", {IntField("attempt", attempt), DurationField("sleep_interval", delay)});
      sleeper_(delay);
    }

    options.context.ThrowIfDone();

    auto tx = source_->Begin(options);

    std::exception_ptr fn_error;
    try {
      fn(*tx);
    } catch (...) {
      fn_error = std::current_exception();
    }

    if (fn_error) {
      // a rollback failure wins over whatever fn threw
      tx->Rollback();
      if (Classify(classifier_, fn_error) == ErrorKind::kSerializationConflict) {
        continue;
      }
      std::rethrow_exception(fn_error);
    }

    std::exception_ptr commit_error;
    try {
      tx->Commit();
    } catch (...) {
      commit_error = std::current_exception();
    }

    if (!commit_error) {
      return;
    }
    if (Classify(classifier_, commit_error) == ErrorKind::kSerializationConflict) {
      continue;
    }
    std::rethrow_exception(commit_error);
  }

  logger.Warn("transaction failed after max attempts due to serialization error", {IntField("attempt", policy_.MaxAttempts())});
  throw util::SerializationError();
}

} // namespace strata::db
