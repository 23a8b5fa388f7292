#pragma once

#include <string>

#include "config/config.pb.h"

namespace chartsync::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the
  config.proto field names are the YAML keys. Unknown keys are rejected.
  Unset sync/database settings receive defaults, then the result is validated.
*/
class ConfigLoader {
 public:
  static chartsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static chartsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(chartsync::runtime::config::RuntimeConfig& config);
  static void Validate(const chartsync::runtime::config::RuntimeConfig& config);
};

} // namespace chartsync::config
