#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/database.hpp"
#include "internal/factory.hpp"
#include "internal/index/dedup_index.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"
#include "internal/util/context.hpp"
#include "internal/util/time.hpp"

using strata::observability::StringField;

static constexpr std::chrono::seconds kCommandTimeout{30};

static void Usage() {
  std::cerr << "Usage:\n"
            << "  strata-db <config.yaml> metadata\n"
            << "  strata-db <config.yaml> stats\n"
            << "  strata-db <config.yaml> dedup <repository_id> <dedup_id> <physical_address>\n";
}

static int PrintMetadata(strata::db::Database& db) {
  for (const auto& [key, value] : db.Metadata()) {
    std::cout << key << '=' << value << '\n';
  }
  return 0;
}

static int PrintStats(const strata::db::Database& db) {
  auto stats = db.Stats();
  std::cout << "max_open_connections=" << stats.max_open_connections << '\n'
            << "open_connections=" << stats.open_connections << '\n'
            << "in_use=" << stats.in_use << '\n'
            << "idle=" << stats.idle << '\n'
            << "wait_count=" << stats.wait_count << '\n'
            << "wait_duration=" << strata::util::FormatDuration(stats.wait_duration) << '\n';
  return 0;
}

static int RunDedup(strata::db::Database& db, const std::vector<std::string>& args) {
  if (args.size() != 3) {
    Usage();
    return 1;
  }

  strata::index::DedupIndex::BootstrapSchema(db);

  auto ctx     = strata::util::Context::Background().WithTimeout(kCommandTimeout).WithLogField(StringField("command", "dedup"));
  auto scoped  = db.WithContext(ctx);
  auto index   = strata::index::DedupIndex(scoped);
  auto address = index.CreateDedupEntryIfNone(args[0], args[1], args[2]);

  std::cout << address << '\n';
  return address == args[2] ? 0 : 3;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string              config_path = argv[1];
  const std::string              command     = argv[2];
  const std::vector<std::string> args(argv + 3, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = strata::config::ConfigLoader::LoadFromYaml(config_path);

    strata::observability::InitializeMetrics(config);
    strata::observability::InitializeLogging(config);

    auto runtime = strata::factory::Build(config);

    int rc = 1;
    if (command == "metadata") {
      rc = PrintMetadata(*runtime.database);
    } else if (command == "stats") {
      rc = PrintStats(*runtime.database);
    } else if (command == "dedup") {
      rc = RunDedup(*runtime.database, args);
    } else {
      Usage();
    }

    runtime.database->Close();
    strata::observability::ShutdownLogging();
    strata::observability::ShutdownMetrics();
    return rc;
  } catch (const std::exception& e) {
    STRATA_LOG_ERROR("Fatal error", {StringField("command", command), StringField("error", e.what())});
    strata::observability::ShutdownLogging();
    strata::observability::ShutdownMetrics();
    return 2;
  }
}
