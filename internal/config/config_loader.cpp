#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace chartsync::config {

using chartsync::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultUploadBatchSize   = 50;
constexpr uint32_t kDefaultDownloadQueueDepth = 4;
constexpr uint32_t kDefaultRemoteDeadlineMs  = 30'000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // An empty document is a valid, all-defaults config.
  if (yaml.IsDefined() && !yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  using namespace chartsync::runtime::config;

  if (config.database().backend_case() == DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }

  auto* sync = config.mutable_sync();
  if (sync->conflict_policy() == CONFLICT_POLICY_UNSPECIFIED) {
    sync->set_conflict_policy(CONFLICT_POLICY_ACCEPT_REMOTE);
  }
  if (sync->upload_fetch_mode() == UPLOAD_FETCH_MODE_UNSPECIFIED) {
    sync->set_upload_fetch_mode(UPLOAD_FETCH_MODE_ALL_CHANGES);
  }
  if (sync->upload_batch_size() == 0) {
    sync->set_upload_batch_size(kDefaultUploadBatchSize);
  }
  if (sync->download_queue_depth() == 0) {
    sync->set_download_queue_depth(kDefaultDownloadQueueDepth);
  }

  if (config.remote().deadline_ms() == 0) {
    config.mutable_remote()->set_deadline_ms(kDefaultRemoteDeadlineMs);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must be set");
  }
  if (config.sync().upload_batch_size() == 0) {
    throw std::runtime_error("Invalid configuration: sync.upload_batch_size must be positive");
  }
  if (config.sync().download_queue_depth() == 0) {
    throw std::runtime_error("Invalid configuration: sync.download_queue_depth must be positive");
  }
}

} // namespace chartsync::config
