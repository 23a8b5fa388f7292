#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "chartsync/v1.hpp"

namespace chartsync::search {

// Base query row: the resource plus its internal row identity.
struct IndexedResource {
  std::string             uuid;
  chartsync::v1::Resource resource;
};

// Resource reached through an _include from the base row `base_uuid`.
struct ForwardIncludedResource {
  std::string             base_uuid;
  std::string             relation;
  chartsync::v1::Resource resource;
};

// Resource reached through a _revinclude pointing at `base_type_with_id` ("Patient/123").
struct ReverseIncludedResource {
  std::string             base_type_with_id;
  std::string             relation;
  chartsync::v1::Resource resource;
};

using IncludedMap    = std::map<std::string, std::vector<chartsync::v1::Resource>>;
using RevIncludeKey  = std::pair<chartsync::v1::ResourceType, std::string>;
using RevIncludedMap = std::map<RevIncludeKey, std::vector<chartsync::v1::Resource>>;

/*
  One base resource with the include sets that belong to it.

  nullopt: the include kind was not requested, or the base set was empty.
  empty map: requested, nothing matched this resource.
*/
struct SearchResult {
  chartsync::v1::Resource       resource;
  std::optional<IncludedMap>    included;
  std::optional<RevIncludedMap> revincluded;
};

} // namespace chartsync::search
