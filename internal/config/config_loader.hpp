#pragma once

#include <chrono>
#include <string>
#include <string_view>

#include "config/config.pb.h"

namespace netmap::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are an
  error; missing keys keep their defaults (see the Duration/Confidence
  helpers below for what an unset field means).
*/
class ConfigLoader {
 public:
  static netmap::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static netmap::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Throws util::InvalidArgument on values that parse but make no sense.
  static void Validate(const netmap::runtime::config::RuntimeConfig& config);
};

// Empty text yields the fallback; malformed text throws util::InvalidArgument
// naming the field.
std::chrono::milliseconds DurationOr(std::string_view text, std::chrono::milliseconds fallback, std::string_view field);

} // namespace netmap::config
