#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace netmap::config {

using netmap::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("10.0.0.1", "7")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

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

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
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
      throw util::InvalidArgument("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  RuntimeConfig config;
  // an empty file is a valid, all-defaults config
  if (yaml.IsNull()) return config;

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& fusion = config.fusion();
  for (const double base : {fusion.adjacency_base_confidence(), fusion.route_base_confidence()}) {
    if (base < 0.0 || base >= 1.0) {
      throw util::InvalidArgument("Invalid configuration: base confidences must be in [0, 1)");
    }
  }
  DurationOr(fusion.staleness_window(), {}, "fusion.staleness_window");

  const auto& ingest = config.ingest();
  DurationOr(ingest.initial_backoff(), {}, "ingest.initial_backoff");
  DurationOr(ingest.max_backoff(), {}, "ingest.max_backoff");
  DurationOr(ingest.lock_timeout(), {}, "ingest.lock_timeout");

  if (config.database().has_sqlite()) {
    if (config.database().sqlite().path().empty()) {
      throw util::InvalidArgument("Invalid configuration: database.sqlite.path is required");
    }
    DurationOr(config.database().sqlite().busy_timeout(), {}, "database.sqlite.busy_timeout");
  }
}

std::chrono::milliseconds DurationOr(std::string_view text, std::chrono::milliseconds fallback, std::string_view field) {
  if (text.empty()) return fallback;
  auto parsed = util::ParseDuration(text);
  if (!parsed) {
    throw util::InvalidArgument("Invalid configuration: " + std::string(field) + ": '" + std::string(text) + "' is not a duration");
  }
  return *parsed;
}

} // namespace netmap::config
