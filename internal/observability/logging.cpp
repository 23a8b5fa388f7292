#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace chartsync::observability {
namespace {

std::string ResolveLevel(const chartsync::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("CHARTSYNC_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const chartsync::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("CHARTSYNC_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

std::string SerializeFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool first = true;
  for (const auto& field : fields) {
    if (!first) {
      out << ' ';
    }
    first = false;
    out << field.key << '=';
    // quote values that would otherwise split into several tokens
    if (field.value.empty() || field.value.find_first_of(" \t\"=") != std::string::npos) {
      out << '"';
      for (char c : field.value) {
        if (c == '"' || c == '\\') out << '\\';
        out << c;
      }
      out << '"';
    } else {
      out << field.value;
    }
  }
  return out.str();
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

void InitializeLogging(const chartsync::runtime::config::RuntimeConfig& config) {
  spdlog::drop("chartsync");
  auto logger = spdlog::stderr_color_mt("chartsync");
  logger->set_pattern(ResolvePattern(config));
  logger->set_level(spdlog::level::from_str(ResolveLevel(config)));
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  spdlog::debug("logging initialized level={}", spdlog::level::to_string_view(spdlog::get_level()));
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = SerializeFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace chartsync::observability
