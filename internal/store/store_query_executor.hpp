#pragma once

#include "internal/db/api/repository.hpp"
#include "internal/search/query_executor.hpp"

namespace chartsync::store {

/*
  QueryExecutor over a Repository.

  All calls read through the transaction passed at construction, so one
  composed search observes a single consistent snapshot.

  Base results are ordered by logical id.
*/
class StoreQueryExecutor final : public search::QueryExecutor {
 public:
  StoreQueryExecutor(db::Repository& repository, db::Transaction& tx);

  std::vector<search::IndexedResource> ExecuteBase(const search::Search& search) override;

  std::vector<search::ForwardIncludedResource> ExecuteForwardIncludes(const std::vector<search::Include>& includes,
                                                                      const std::vector<std::string>& base_uuids) override;

  std::vector<search::ReverseIncludedResource> ExecuteReverseIncludes(const std::vector<search::RevInclude>& rev_includes,
                                                                      const std::vector<std::string>& base_type_with_ids) override;

  uint64_t ExecuteCount(const search::Search& search) override;

 private:
  std::vector<search::IndexedResource> Matching(const search::Search& search);

  db::Repository&  repository_;
  db::Transaction& tx_;
};

} // namespace chartsync::store
