#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "chartsync/v1.hpp"

namespace chartsync::search {

/*
  Search request handed to the query executor.

  Filters are equality tests on string fields of the resource content;
  `path` may be dotted to reach into nested objects ("name.family").
*/

struct StringFilter {
  std::string path;
  std::string value;
};

// _include: follow references out of each base resource.
struct Include {
  std::string relation;

  // RESOURCE_TYPE_UNSPECIFIED follows references to any type.
  chartsync::v1::ResourceType target_type = chartsync::v1::RESOURCE_TYPE_UNSPECIFIED;
};

// _revinclude: resources of `resource_type` that point at a base resource through `relation`.
struct RevInclude {
  chartsync::v1::ResourceType resource_type = chartsync::v1::RESOURCE_TYPE_UNSPECIFIED;
  std::string                 relation;
};

struct Search {
  chartsync::v1::ResourceType type = chartsync::v1::RESOURCE_TYPE_UNSPECIFIED;

  std::vector<StringFilter> filters;
  std::vector<Include>      forward_includes;
  std::vector<RevInclude>   rev_includes;

  std::optional<std::size_t> count;
  std::size_t                from = 0;
};

} // namespace chartsync::search
