#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/database.hpp"
#include "internal/db/sql_database.hpp"
#include "internal/index/dedup_index.hpp"

namespace strata::factory {

/*
  Runtime

  Owns the long-lived objects of the process.
*/
struct Runtime {
  std::shared_ptr<db::Database>      database;
  std::shared_ptr<index::DedupIndex> dedup_index;
};

/*
  Validated database settings from config; throws util::InvalidConfig.
  Does not touch the network.
*/
db::DatabaseSettings BuildDatabaseSettings(const strata::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Composition root. The ONLY place allowed to know concrete DB types.
  Connections are opened lazily by the pool on first use.
*/
Runtime Build(const strata::runtime::config::RuntimeConfig& config);

} // namespace strata::factory
