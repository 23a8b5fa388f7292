#pragma once

#include <cstdint>
#include <string>

#include "chartsync/v1.hpp"

namespace chartsync::db::model {

/*
  Persistent resource row.

  IMPORTANT:
  - uuid is the internal row identity; forward includes are keyed by it.
  - (type, logical_id) is the external identity and is unique.
  - json is the full chartsync.core.v1.Resource in protobuf JSON form.
*/

struct ResourceRecord {
  std::string uuid;

  chartsync::v1::ResourceType type = chartsync::v1::RESOURCE_TYPE_UNSPECIFIED;
  std::string                 logical_id;

  std::string version_id;
  uint64_t    last_updated_ms = 0;

  std::string json;
};

struct ResourceKey {
  chartsync::v1::ResourceType type = chartsync::v1::RESOURCE_TYPE_UNSPECIFIED;
  std::string                 logical_id;
};

}
