#pragma once

#include <string>

#include "chartsync/v1.hpp"
#include "internal/db/model/resource_record.hpp"

namespace chartsync::db::model {

/*
  Reference index row: resource `source_uuid` points at
  (target_type, target_id) through search parameter `relation`.
*/

struct ReferenceRecord {
  std::string source_uuid;
  std::string relation;

  chartsync::v1::ResourceType target_type = chartsync::v1::RESOURCE_TYPE_UNSPECIFIED;
  std::string                 target_id;
};

// A reference row joined with the stored resource on its other end.
struct LinkedResourceRecord {
  ReferenceRecord reference;
  ResourceRecord  resource;
};

}
