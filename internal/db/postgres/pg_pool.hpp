#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/util/context.hpp"

namespace strata::db::postgres {

/*
  PgPool

  Bounded pool of libpqxx connections.

  Design notes:
  -------------
  - Each transaction gets its own connection for its whole lifetime.
  - libpqxx connections are NOT thread-safe → never shared.
  - Acquire() blocks while max_connections are in use; the wait honours
    the caller's stop token and deadline.
  - A broken connection is dropped on release instead of being reused.

  Lifetime:
    PgDriver owns shared_ptr<PgPool>
    PgTransaction holds shared_ptr<pqxx::connection>; its deleter hands
    the connection back (or deletes it once the pool is gone/closed).
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  // Acquire a ready-to-use connection; throws util::Cancelled or
  // util::DeadlineExceeded when ctx ends while waiting.
  std::shared_ptr<pqxx::connection> Acquire(const util::Context& ctx = {});

  PoolStats Stats() const;

  // Closes idle connections; connections in use are closed on release.
  void Close();

 private:
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);

  std::string conninfo_;
  std::size_t max_connections_;

  mutable std::mutex                             mutex_;
  std::condition_variable_any                    cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
  std::uint64_t                                  wait_count_       = 0;
  std::chrono::nanoseconds                       wait_duration_{0};
  bool                                           closed_ = false;
};

} // namespace strata::db::postgres
