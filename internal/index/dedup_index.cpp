#include "internal/index/dedup_index.hpp"

#include <stdexcept>
#include <utility>

namespace strata::index {

namespace {

constexpr const char* kCreateTable =
    "CREATE TABLE IF NOT EXISTS object_dedup ("
    " repository_id TEXT NOT NULL,"
    " dedup_id TEXT NOT NULL,"
    " physical_address TEXT NOT NULL,"
    " PRIMARY KEY (repository_id, dedup_id))";

constexpr const char* kInsertIfNone =
    "INSERT INTO object_dedup (repository_id, dedup_id, physical_address)"
    " VALUES ($1, $2, $3) ON CONFLICT DO NOTHING";

constexpr const char* kSelectAddress =
    "SELECT physical_address FROM object_dedup"
    " WHERE repository_id = $1 AND dedup_id = $2";

} // namespace

DedupIndex::DedupIndex(std::shared_ptr<db::TransactionRunner> runner) : runner_(std::move(runner)) {
  if (!runner_) {
    throw std::invalid_argument("dedup index requires a transaction runner");
  }
}

std::string DedupIndex::CreateDedupEntryIfNone(const std::string& repository_id, const std::string& dedup_id,
                                               const std::string& physical_address) {
  if (repository_id.empty() || dedup_id.empty() || physical_address.empty()) {
    throw std::invalid_argument("dedup entry requires repository id, dedup id and physical address");
  }

  return runner_->Execute([&](db::Transaction& tx) {
    tx.Exec(kInsertIfNone, {repository_id, dedup_id, physical_address});
    return tx.Get(kSelectAddress, {repository_id, dedup_id}).GetText(0);
  });
}

void DedupIndex::BootstrapSchema(db::Querier& db) {
  db.Exec(kCreateTable);
}

} // namespace strata::index
