#include "search_composer.hpp"

#include <string>
#include <unordered_map>
#include <utility>

#include "internal/model/resource_type.hpp"

namespace chartsync::search {

SearchComposer::SearchComposer(QueryExecutor& executor) : executor_(executor) {
}

std::vector<SearchResult> SearchComposer::Compose(const Search& search) {
  const auto base = executor_.ExecuteBase(search);

  std::optional<std::unordered_map<std::string, IncludedMap>> included_by_base;
  if (!search.forward_includes.empty() && !base.empty()) {
    std::vector<std::string> uuids;
    uuids.reserve(base.size());
    for (const auto& row : base) {
      uuids.push_back(row.uuid);
    }

    included_by_base.emplace();
    for (auto& entry : executor_.ExecuteForwardIncludes(search.forward_includes, uuids)) {
      (*included_by_base)[entry.base_uuid][entry.relation].push_back(std::move(entry.resource));
    }
  }

  std::optional<std::unordered_map<std::string, RevIncludedMap>> revincluded_by_base;
  if (!search.rev_includes.empty() && !base.empty()) {
    std::vector<std::string> keys;
    keys.reserve(base.size());
    for (const auto& row : base) {
      keys.push_back(chartsync::model::TypeWithId(row.resource.type(), row.resource.logical_id()));
    }

    revincluded_by_base.emplace();
    for (auto& entry : executor_.ExecuteReverseIncludes(search.rev_includes, keys)) {
      const RevIncludeKey group{entry.resource.type(), entry.relation};
      (*revincluded_by_base)[entry.base_type_with_id][group].push_back(std::move(entry.resource));
    }
  }

  std::vector<SearchResult> results;
  results.reserve(base.size());
  for (const auto& row : base) {
    SearchResult result;
    result.resource = row.resource;

    if (included_by_base) {
      auto it         = included_by_base->find(row.uuid);
      result.included = it == included_by_base->end() ? IncludedMap{} : std::move(it->second);
    }

    if (revincluded_by_base) {
      auto it            = revincluded_by_base->find(chartsync::model::TypeWithId(row.resource.type(), row.resource.logical_id()));
      result.revincluded = it == revincluded_by_base->end() ? RevIncludedMap{} : std::move(it->second);
    }

    results.push_back(std::move(result));
  }
  return results;
}

} // namespace chartsync::search
