#include "resource_type.hpp"

namespace chartsync::model {

std::optional<chartsync::v1::ResourceType> ParseResourceType(std::string_view name) {
  for (int value = chartsync::v1::ResourceType_MIN; value <= chartsync::v1::ResourceType_MAX; ++value) {
    if (!chartsync::v1::ResourceType_IsValid(value)) {
      continue;
    }
    const auto type = static_cast<chartsync::v1::ResourceType>(value);
    if (type != chartsync::v1::RESOURCE_TYPE_UNSPECIFIED && ToString(type) == name) {
      return type;
    }
  }
  return std::nullopt;
}

std::string TypeWithId(chartsync::v1::ResourceType type, const std::string& logical_id) {
  std::string out(ToString(type));
  out += '/';
  out += logical_id;
  return out;
}

} // namespace chartsync::model
