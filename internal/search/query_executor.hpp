#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "internal/search/search.hpp"
#include "internal/search/search_result.hpp"

namespace chartsync::search {

/*
  Executes compiled searches against a store.

  Each call is one bulk operation; the composer never calls it per base row.
*/
class QueryExecutor {
 public:
  virtual ~QueryExecutor() = default;

  virtual std::vector<IndexedResource> ExecuteBase(const Search& search) = 0;

  virtual std::vector<ForwardIncludedResource> ExecuteForwardIncludes(const std::vector<Include>& includes,
                                                                      const std::vector<std::string>& base_uuids) = 0;

  virtual std::vector<ReverseIncludedResource> ExecuteReverseIncludes(const std::vector<RevInclude>& rev_includes,
                                                                      const std::vector<std::string>& base_type_with_ids) = 0;

  virtual uint64_t ExecuteCount(const Search& search) = 0;
};

} // namespace chartsync::search
