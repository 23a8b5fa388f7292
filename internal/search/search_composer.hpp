#pragma once

#include <vector>

#include "internal/search/query_executor.hpp"
#include "internal/search/search.hpp"
#include "internal/search/search_result.hpp"

namespace chartsync::search {

/*
  Joins a base result set with its _include and _revinclude sets.

  Both include kinds are fetched once for the whole base set and then
  sliced per base resource, so storage work does not grow with the
  number of base rows.
*/
class SearchComposer {
 public:
  explicit SearchComposer(QueryExecutor& executor);

  std::vector<SearchResult> Compose(const Search& search);

 private:
  QueryExecutor& executor_;
};

} // namespace chartsync::search
