#include "pg_pool.hpp"

#include <stdexcept>
#include <utility>

#include "internal/util/time.hpp"

namespace strata::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire(const util::Context& ctx) {
  std::unique_lock lock(mutex_);

  bool       waited     = false;
  const auto wait_start = util::Now();
  auto       finish_wait = [&] {
    if (waited) {
      wait_duration_ += util::Now() - wait_start;
    }
  };

  for (;;) {
    if (closed_) {
      throw std::runtime_error("connection pool is closed");
    }
    if (ctx.Done()) {
      finish_wait();
      ctx.ThrowIfDone();
    }

    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      finish_wait();
      return Wrap(conn.release());
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      finish_wait();
      lock.unlock();

      try {
        return Wrap(new pqxx::connection(conninfo_));
      } catch (...) {
        std::lock_guard rollback_lock(mutex_);
        --live_connections_;
        cv_.notify_one();
        throw;
      }
    }

    if (!waited) {
      waited = true;
      ++wait_count_;
    }

    auto ready = [this] {
      return closed_ || !idle_.empty() || live_connections_ < max_connections_;
    };
    if (ctx.Deadline()) {
      cv_.wait_until(lock, ctx.StopToken(), *ctx.Deadline(), ready);
    } else {
      cv_.wait(lock, ctx.StopToken(), ready);
    }
  }
}

PoolStats PgPool::Stats() const {
  std::lock_guard lock(mutex_);

  PoolStats stats;
  stats.max_open_connections = static_cast<std::uint32_t>(max_connections_);
  stats.open_connections     = static_cast<std::uint32_t>(live_connections_);
  stats.idle                 = static_cast<std::uint32_t>(idle_.size());
  stats.in_use               = stats.open_connections - stats.idle;
  stats.wait_count           = wait_count_;
  stats.wait_duration        = wait_duration_;
  return stats;
}

void PgPool::Close() {
  std::vector<std::unique_ptr<pqxx::connection>> closing;
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    live_connections_ -= idle_.size();
    closing.swap(idle_);
  }
  cv_.notify_all();
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  std::unique_ptr<pqxx::connection> owned(conn);
  {
    std::lock_guard lock(mutex_);
    if (closed_ || !owned->is_open()) {
      --live_connections_;
    } else {
      idle_.push_back(std::move(owned));
    }
  }
  cv_.notify_one();
}

} // namespace strata::db::postgres
