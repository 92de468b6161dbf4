#include "internal/index/dedup_index.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/db/sql_database.hpp"
#include "tests/unit/fake_driver.hpp"

namespace {

using namespace std::chrono_literals;

using strata::db::sql::MakeRows;
using strata::db::sql::Params;
using strata::db::sql::Rows;
using strata::index::DedupIndex;
using strata::testing::ConflictError;
using strata::testing::FakeDriver;

// object_dedup emulated in memory; each statement applies immediately
struct DedupTable {
  std::map<std::pair<std::string, std::string>, std::string> entries;
  int                                                         inserts          = 0;
  int                                                         conflicts_to_add = 0;
  std::string                                                 last_ddl;

  Rows Handle(const std::string& query, const Params& params) {
    if (query.rfind("CREATE TABLE", 0) == 0) {
      last_ddl = query;
      return {};
    }
    if (query.rfind("INSERT", 0) == 0) {
      ++inserts;
      if (conflicts_to_add > 0) {
        --conflicts_to_add;
        throw ConflictError();
      }
      auto key = std::make_pair(std::get<std::string>(params.at(0)), std::get<std::string>(params.at(1)));
      entries.emplace(key, std::get<std::string>(params.at(2)));
      return {};
    }
    if (query.rfind("SELECT", 0) == 0) {
      auto key = std::make_pair(std::get<std::string>(params.at(0)), std::get<std::string>(params.at(1)));
      auto it  = entries.find(key);
      if (it == entries.end()) return {};
      return MakeRows({"physical_address"}, {{it->second}});
    }
    throw std::logic_error("unexpected query: " + query);
  }
};

struct Fixture {
  std::shared_ptr<FakeDriver>              driver = std::make_shared<FakeDriver>();
  DedupTable                               table;
  std::shared_ptr<strata::db::SqlDatabase> database;

  Fixture() {
    driver->on_query = [this](const std::string& query, const Params& params) { return table.Handle(query, params); };

    strata::db::DatabaseSettings settings;
    settings.retry_policy = strata::db::RetryPolicy(3, 0ms);
    settings.classifier   = strata::testing::IsConflict;
    settings.sleeper      = [](std::chrono::nanoseconds) {};
    settings.logger       = strata::observability::Logger::Discard();
    database              = std::make_shared<strata::db::SqlDatabase>(driver, std::move(settings));
  }
};

void TestFirstWriterWins() {
  Fixture    f;
  DedupIndex index(f.database);

  assert(index.CreateDedupEntryIfNone("repo1", "sha-abc", "s3://bucket/a") == "s3://bucket/a");
  assert(index.CreateDedupEntryIfNone("repo1", "sha-abc", "s3://bucket/b") == "s3://bucket/a");
  // the same content in another repository is independent
  assert(index.CreateDedupEntryIfNone("repo2", "sha-abc", "s3://bucket/c") == "s3://bucket/c");

  assert(f.table.entries.size() == 2);
  assert(f.driver->commits == 3);
}

void TestConflictIsRetriedTransparently() {
  Fixture f;
  f.table.conflicts_to_add = 2;
  DedupIndex index(f.database);

  assert(index.CreateDedupEntryIfNone("repo1", "sha-1", "s3://bucket/x") == "s3://bucket/x");
  assert(f.table.inserts == 3);
  assert(f.driver->begins == 3);
  assert(f.driver->rollbacks == 2);
  assert(f.driver->commits == 1);
}

void TestRunsInSerializableReadWriteTransaction() {
  Fixture    f;
  DedupIndex index(f.database);

  index.CreateDedupEntryIfNone("repo1", "sha-2", "s3://bucket/y");
  assert(f.driver->begun_with.size() == 1);
  assert(f.driver->begun_with[0].isolation_level == strata::db::IsolationLevel::kSerializable);
  assert(!f.driver->begun_with[0].read_only);
}

void TestRejectsEmptyArguments() {
  Fixture    f;
  DedupIndex index(f.database);

  bool threw = false;
  try {
    index.CreateDedupEntryIfNone("repo1", "", "s3://bucket/z");
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
  assert(f.driver->begins == 0);

  threw = false;
  try {
    DedupIndex missing(nullptr);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw);
}

void TestBootstrapSchema() {
  Fixture f;
  DedupIndex::BootstrapSchema(*f.database);
  assert(f.table.last_ddl.find("object_dedup") != std::string::npos);
  assert(f.table.last_ddl.find("PRIMARY KEY (repository_id, dedup_id)") != std::string::npos);
}

} // namespace

int main() {
  TestFirstWriterWins();
  TestConflictIsRetriedTransparently();
  TestRunsInSerializableReadWriteTransaction();
  TestRejectsEmptyArguments();
  TestBootstrapSchema();

  std::cout << "strata_db_unit_dedup_index: pass\n";
  return 0;
}
