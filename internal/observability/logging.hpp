#pragma once

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>

namespace netmap::runtime::config {
class RuntimeConfig;
}

namespace netmap::observability {

struct LogField {
  std::string key;
  std::string value;
};

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);
LogField DoubleField(std::string_view key, double value);
LogField BoolField(std::string_view key, bool value);

/*
  Fields appended to every line the current thread logs while the scope is
  alive. Ingest opens one per batch, so fusion and store messages name the
  source host without passing it down.
*/
class ScopedLogContext {
 public:
  explicit ScopedLogContext(std::initializer_list<LogField> fields);
  ~ScopedLogContext();

  ScopedLogContext(const ScopedLogContext&)            = delete;
  ScopedLogContext& operator=(const ScopedLogContext&) = delete;

 private:
  std::size_t previous_size_;
};

// Renders "key=value ..." with context fields first; values holding spaces,
// quotes or '=' are quoted.
std::string FormatFields(std::initializer_list<LogField> fields);

// Logs go to stderr; stdout is reserved for command output. An unknown
// level falls back to info.
void InitializeLogging(const netmap::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

inline void LogDebug(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::debug, message, fields);
}

inline void LogInfo(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::info, message, fields);
}

inline void LogWarn(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::warn, message, fields);
}

inline void LogError(std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(spdlog::level::err, message, fields);
}

} // namespace netmap::observability

#define NETMAP_LOG_DEBUG(message, ...) ::netmap::observability::LogDebug((message), ##__VA_ARGS__)
#define NETMAP_LOG_INFO(message, ...) ::netmap::observability::LogInfo((message), ##__VA_ARGS__)
#define NETMAP_LOG_WARN(message, ...) ::netmap::observability::LogWarn((message), ##__VA_ARGS__)
#define NETMAP_LOG_ERROR(message, ...) ::netmap::observability::LogError((message), ##__VA_ARGS__)
