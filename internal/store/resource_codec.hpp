#pragma once

#include <string>
#include <vector>

#include "chartsync/v1.hpp"
#include "internal/db/model/local_change_record.hpp"
#include "internal/db/model/reference_record.hpp"
#include "internal/db/model/resource_record.hpp"

namespace chartsync::store {

/*
  Conversions between the protobuf domain types and repository rows.
  Resources are persisted as protobuf JSON.
*/

std::string             ToJson(const chartsync::v1::Resource& resource);
chartsync::v1::Resource ResourceFromJson(const std::string& json);

db::model::ResourceRecord ToRecord(const chartsync::v1::Resource& resource, const std::string& uuid);
chartsync::v1::Resource   FromRecord(const db::model::ResourceRecord& record);

std::vector<db::model::ReferenceRecord> ToReferenceRecords(const chartsync::v1::Resource& resource, const std::string& uuid);

chartsync::v1::LocalChange FromRecord(const db::model::LocalChangeRecord& record);

} // namespace chartsync::store
