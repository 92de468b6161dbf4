#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/api/transaction_options.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/util/context.hpp"

namespace strata::db {

namespace detail {

// Adapts fn(Transaction&) -> R onto a void runner, keeping the value
// produced by the attempt that committed.
template <typename Fn, typename RunFn>
auto InvokeCapturing(Fn& fn, RunFn&& run) -> std::invoke_result_t<Fn&, Transaction&> {
  using Result = std::invoke_result_t<Fn&, Transaction&>;
  if constexpr (std::is_void_v<Result>) {
    run([&fn](Transaction& tx) { fn(tx); });
  } else {
    std::optional<Result> result;
    run([&fn, &result](Transaction& tx) { result.emplace(fn(tx)); });
    return std::move(*result);
  }
}

} // namespace detail

/*
  Capability interfaces.

  Consumers depend on the narrowest one they need; a dedup index that
  only runs transactions takes a TransactionRunner, not a Database.
*/

class Querier {
 public:
  virtual ~Querier() = default;

  // Single row; throws util::NotFound when there is none.
  virtual sql::Row  Get(const std::string& query, const sql::Params& params = {})   = 0;
  virtual sql::Rows Query(const std::string& query, const sql::Params& params = {}) = 0;
  // Returns rows affected.
  virtual uint64_t  Exec(const std::string& query, const sql::Params& params = {})  = 0;
};

class TransactionRunner {
 public:
  using Work = std::function<void(Transaction&)>;

  virtual ~TransactionRunner() = default;

  // Runs fn in a transaction, retrying on serialization conflicts.
  // See TransactionExecutor for the full contract.
  virtual void Run(const Work& fn, const std::vector<TxOption>& options) = 0;

  // Typed front end for Run():
  //   auto n = db.Execute([](Transaction& tx) { return tx.Get("SELECT 1").GetInt64(0); }, ReadOnly());
  template <typename Fn, typename... Opts>
  auto Execute(Fn&& fn, Opts&&... options) -> std::invoke_result_t<Fn&, Transaction&> {
    std::vector<TxOption> opts{TxOption(std::forward<Opts>(options))...};
    return detail::InvokeCapturing(fn, [this, &opts](const Work& work) { Run(work, opts); });
  }
};

class MetadataSource {
 public:
  virtual ~MetadataSource() = default;

  // Best effort: sub-queries that fail are left out of the map.
  virtual MetadataMap Metadata() = 0;
};

class StatsSource {
 public:
  virtual ~StatsSource() = default;

  virtual PoolStats Stats() const = 0;
};

class Database : public Querier, public TransactionRunner, public MetadataSource, public StatsSource {
 public:
  // New instance bound to ctx; this one is left as it was.
  virtual std::shared_ptr<Database> WithContext(const util::Context& ctx) const = 0;

  virtual void Close() = 0;
};

} // namespace strata::db
