#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <sstream>
#include <string>
#include <vector>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace netmap::observability {
namespace {

constexpr const char* kLoggerName = "netmap";

std::string ResolveLevel(const netmap::runtime::config::RuntimeConfig& config) {
  if (const char* level = std::getenv("NETMAP_LOG_LEVEL")) {
    return level;
  }

  if (!config.logging().level().empty()) {
    return config.logging().level();
  }

  return "info";
}

std::string ResolvePattern(const netmap::runtime::config::RuntimeConfig& config) {
  if (const char* pattern = std::getenv("NETMAP_LOG_PATTERN")) {
    return pattern;
  }

  if (!config.logging().pattern().empty()) {
    return config.logging().pattern();
  }

  return "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
}

thread_local std::vector<LogField> t_context;

void AppendValue(std::ostringstream& out, const std::string& value) {
  if (!value.empty() && value.find_first_of(" \t\"=") == std::string::npos) {
    out << value;
    return;
  }
  out << '"';
  for (char c : value) {
    if (c == '"' || c == '\\') out << '\\';
    out << c;
  }
  out << '"';
}

void AppendField(std::ostringstream& out, bool& first, const LogField& field) {
  if (!first) {
    out << ' ';
  }
  first = false;
  out << field.key << '=';
  AppendValue(out, field.value);
}

} // namespace

ScopedLogContext::ScopedLogContext(std::initializer_list<LogField> fields) : previous_size_(t_context.size()) {
  t_context.insert(t_context.end(), fields.begin(), fields.end());
}

ScopedLogContext::~ScopedLogContext() {
  t_context.resize(previous_size_);
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& field : t_context) {
    AppendField(out, first, field);
  }
  for (const auto& field : fields) {
    AppendField(out, first, field);
  }
  return out.str();
}

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField DoubleField(std::string_view key, double value) {
  std::ostringstream out;
  out << value;
  return {std::string(key), out.str()};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

void InitializeLogging(const netmap::runtime::config::RuntimeConfig& config) {
  // re-initialization (tests, config reload) replaces the logger
  spdlog::drop(kLoggerName);
  auto logger = spdlog::stderr_color_mt(kLoggerName);
  logger->set_pattern(ResolvePattern(config));

  const auto level_name = ResolveLevel(config);
  auto       level      = spdlog::level::from_str(level_name);
  // from_str maps anything it does not know to off
  const bool unknown = level == spdlog::level::off && level_name != "off";
  if (unknown) level = spdlog::level::info;
  logger->set_level(level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  if (unknown) {
    LogWarn("unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  auto serialized_fields = FormatFields(fields);

  if (!serialized_fields.empty()) {
    spdlog::log(level, "{} {}", message, serialized_fields);
    return;
  }
  spdlog::log(level, "{}", message);
}

} // namespace netmap::observability
