#pragma once

#include <memory>
#include <string>

#include "internal/db/api/database.hpp"

namespace strata::index {

/*
  DedupIndex

  Maps (repository, content hash) to the physical address of the first
  object uploaded with that content. The uploader writes a new object,
  then calls CreateDedupEntryIfNone(); when the returned address differs
  from the one it wrote, the content already existed and the new object
  can be removed.
*/
class DedupIndex {
 public:
  explicit DedupIndex(std::shared_ptr<db::TransactionRunner> runner);

  // Returns the physical address stored for (repository_id, dedup_id):
  // physical_address itself if the entry is new, the existing one otherwise.
  std::string CreateDedupEntryIfNone(const std::string& repository_id, const std::string& dedup_id, const std::string& physical_address);

  static void BootstrapSchema(db::Querier& db);

 private:
  std::shared_ptr<db::TransactionRunner> runner_;
};

} // namespace strata::index
