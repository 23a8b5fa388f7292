#pragma once

#include <cstdint>
#include <string>

#include "chartsync/v1.hpp"

namespace chartsync::db::model {

/*
  One journal entry per local mutation.

  id is the journal sequence number (assigned by the repository).
  payload_json holds the resource after the change; empty for deletes.
*/

struct LocalChangeRecord {
  int64_t id = 0;

  chartsync::v1::ResourceType type = chartsync::v1::RESOURCE_TYPE_UNSPECIFIED;
  std::string                 resource_id;

  chartsync::v1::ChangeType change_type = chartsync::v1::CHANGE_TYPE_UNSPECIFIED;
  std::string               version_id;
  std::string               payload_json;

  uint64_t timestamp_ms = 0;
};

}
