#include "internal/db/api/transaction_options.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <stop_token>

#include "internal/db/api/types.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;

using strata::db::ApplyOptions;
using strata::db::DefaultTransactionOptions;
using strata::db::IsolationLevel;
using strata::db::ReadOnly;
using strata::db::TxOption;
using strata::db::WithIsolation;

void TestDefaults() {
  auto options = DefaultTransactionOptions();
  assert(options.isolation_level == IsolationLevel::kSerializable);
  assert(!options.read_only);
  assert(options.logger.Fields().empty());
  assert(!options.context.Done());
}

void TestOptionsApplyInOrderLastWins() {
  auto options = ApplyOptions(DefaultTransactionOptions(),
                              {WithIsolation(IsolationLevel::kReadCommitted), ReadOnly(), WithIsolation(IsolationLevel::kRepeatableRead)});
  assert(options.isolation_level == IsolationLevel::kRepeatableRead);
  assert(options.read_only);
}

void TestEmptyAndNullOptionsKeepBase() {
  auto base            = DefaultTransactionOptions();
  base.isolation_level = IsolationLevel::kReadCommitted;

  auto options = ApplyOptions(base, {TxOption{}});
  assert(options.isolation_level == IsolationLevel::kReadCommitted);
  assert(!options.read_only);
}

void TestLoggerAndContextOptions() {
  std::stop_source stop;
  auto             ctx    = strata::util::Context::Background().WithStopToken(stop.get_token());
  auto             logger = strata::observability::Logger::Discard().WithField(strata::observability::StringField("k", "v"));

  auto options = ApplyOptions(DefaultTransactionOptions(), {strata::db::WithLogger(logger), strata::db::WithContext(ctx)});
  assert(options.logger.Fields().size() == 1);
  assert(!options.context.Done());

  stop.request_stop();
  assert(options.context.StopRequested());
}

void TestIsolationLevelNames() {
  assert(strata::db::ToSql(IsolationLevel::kSerializable) == "SERIALIZABLE");
  assert(strata::db::ToSql(IsolationLevel::kReadCommitted) == "READ COMMITTED");
  assert(strata::db::ParseIsolationLevel("Serializable") == IsolationLevel::kSerializable);
  assert(strata::db::ParseIsolationLevel("repeatable_read") == IsolationLevel::kRepeatableRead);

  bool threw = false;
  try {
    strata::db::ParseIsolationLevel("chaos");
  } catch (const strata::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

void TestContextDeadlines() {
  auto ctx = strata::util::Context::Background().WithTimeout(1h);
  assert(!ctx.Done());
  assert(ctx.Remaining().has_value());

  // a later deadline never extends an earlier one
  auto tighter = ctx.WithTimeout(1ms).WithTimeout(2h);
  assert(*tighter.Remaining() <= 1ms);

  auto expired = strata::util::Context::Background().WithDeadline(strata::util::Now() - 1s);
  assert(expired.DeadlinePassed());
  assert(*expired.Remaining() == 0ms);

  bool threw = false;
  try {
    expired.ThrowIfDone();
  } catch (const strata::util::DeadlineExceeded&) {
    threw = true;
  }
  assert(threw);

  assert(!strata::util::Context::Background().Remaining().has_value());
}

} // namespace

int main() {
  TestDefaults();
  TestOptionsApplyInOrderLastWins();
  TestEmptyAndNullOptionsKeepBase();
  TestLoggerAndContextOptions();
  TestIsolationLevelNames();
  TestContextDeadlines();

  std::cout << "strata_db_unit_transaction_options: pass\n";
  return 0;
}
