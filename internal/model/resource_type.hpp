#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "chartsync/v1.hpp"

namespace chartsync::model {

constexpr std::string_view ToString(chartsync::v1::ResourceType type) {
  switch (type) {
    case chartsync::v1::RESOURCE_TYPE_PATIENT:
      return "Patient";
    case chartsync::v1::RESOURCE_TYPE_PRACTITIONER:
      return "Practitioner";
    case chartsync::v1::RESOURCE_TYPE_ENCOUNTER:
      return "Encounter";
    case chartsync::v1::RESOURCE_TYPE_OBSERVATION:
      return "Observation";
    case chartsync::v1::RESOURCE_TYPE_CONDITION:
      return "Condition";
    case chartsync::v1::RESOURCE_TYPE_MEDICATION_REQUEST:
      return "MedicationRequest";
    case chartsync::v1::RESOURCE_TYPE_IMMUNIZATION:
      return "Immunization";
    case chartsync::v1::RESOURCE_TYPE_TASK:
      return "Task";
    case chartsync::v1::RESOURCE_TYPE_UNSPECIFIED:
    default:
      return "Unspecified";
  }
}

std::optional<chartsync::v1::ResourceType> ParseResourceType(std::string_view name);

// "Patient/123" form used to key reverse includes.
std::string TypeWithId(chartsync::v1::ResourceType type, const std::string& logical_id);

} // namespace chartsync::model
