#include "resource_codec.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/time.hpp"

namespace chartsync::store {

std::string ToJson(const chartsync::v1::Resource& resource) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(resource, &json);
  if (!status.ok()) {
    throw std::runtime_error("resource serialize failed: " + std::string(status.message()));
  }
  return json;
}

chartsync::v1::Resource ResourceFromJson(const std::string& json) {
  chartsync::v1::Resource resource;
  auto                    status = google::protobuf::util::JsonStringToMessage(json, &resource);
  if (!status.ok()) {
    throw std::runtime_error("resource parse failed: " + std::string(status.message()));
  }
  return resource;
}

db::model::ResourceRecord ToRecord(const chartsync::v1::Resource& resource, const std::string& uuid) {
  db::model::ResourceRecord record;
  record.uuid            = uuid;
  record.type            = resource.type();
  record.logical_id      = resource.logical_id();
  record.version_id      = resource.version_id();
  record.last_updated_ms = resource.has_last_updated() ? chartsync::util::ToUnixMillis(resource.last_updated()) : 0;
  record.json            = ToJson(resource);
  return record;
}

chartsync::v1::Resource FromRecord(const db::model::ResourceRecord& record) {
  return ResourceFromJson(record.json);
}

std::vector<db::model::ReferenceRecord> ToReferenceRecords(const chartsync::v1::Resource& resource, const std::string& uuid) {
  std::vector<db::model::ReferenceRecord> out;
  out.reserve(resource.references_size());
  for (const auto& ref : resource.references()) {
    db::model::ReferenceRecord record;
    record.source_uuid = uuid;
    record.relation    = ref.relation();
    record.target_type = ref.target_type();
    record.target_id   = ref.target_id();
    out.push_back(std::move(record));
  }
  return out;
}

chartsync::v1::LocalChange FromRecord(const db::model::LocalChangeRecord& record) {
  chartsync::v1::LocalChange change;
  change.set_resource_type(record.type);
  change.set_resource_id(record.resource_id);
  change.set_version_id(record.version_id);
  change.set_type(record.change_type);
  if (!record.payload_json.empty()) {
    *change.mutable_payload() = ResourceFromJson(record.payload_json);
  }
  *change.mutable_timestamp() = chartsync::util::MillisToProto(record.timestamp_ms);
  change.add_token(record.id);
  return change;
}

} // namespace chartsync::store
