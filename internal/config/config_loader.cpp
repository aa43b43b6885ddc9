#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace negotiation::config {

namespace {

using negotiation::runtime::config::RuntimeConfig;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  // quoted scalars stay strings, e.g. participant_id: "42"
  if (node.Tag() != "!") {
    char*        end    = nullptr;
    const double number = std::strtod(scalar.c_str(), &end);
    if (!scalar.empty() && end && *end == '\0') {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (const auto& item : node) {
        YamlToProtoValue(item, list->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        YamlToProtoValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      break;
    }
  }
}

RuntimeConfig Parse(const YAML::Node& yaml) {
  google::protobuf::Value root;
  YamlToProtoValue(yaml, &root);

  // an empty document is an empty config
  if (root.has_null_value()) {
    root.mutable_struct_value();
  }

  std::string json;
  auto        to_json = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return Parse(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* manager = config.mutable_manager();
  if (manager->batch_size() == 0) manager->set_batch_size(5);
  if (manager->command_batch_size() == 0) manager->set_command_batch_size(5);
  if (manager->command_max_attempts() == 0) manager->set_command_max_attempts(3);
  if (manager->workers() == 0) manager->set_workers(1);
  if (manager->poll_interval_ms() == 0) manager->set_poll_interval_ms(1000);
  if (manager->lease_duration_ms() == 0) manager->set_lease_duration_ms(60000);
  if (manager->max_retries() == 0) manager->set_max_retries(7);
  if (manager->retry_base_delay_ms() == 0) manager->set_retry_base_delay_ms(1000);
  if (manager->retry_max_delay_ms() == 0) manager->set_retry_max_delay_ms(60000);

  if (config.connector().protocol().empty()) {
    config.mutable_connector()->set_protocol("dataspace-protocol-http");
  }
  if (config.database().backend_case() == negotiation::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    config.mutable_database()->mutable_memory();
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.connector().participant_id().empty()) {
    throw std::runtime_error("Invalid configuration: connector.participant_id is required");
  }
  if (config.connector().address().empty()) {
    throw std::runtime_error("Invalid configuration: connector.address is required");
  }
  const auto& manager = config.manager();
  if (manager.retry_max_delay_ms() < manager.retry_base_delay_ms()) {
    throw std::runtime_error("Invalid configuration: manager.retry_max_delay_ms is below manager.retry_base_delay_ms");
  }
  if (manager.lease_duration_ms() <= manager.poll_interval_ms()) {
    throw std::runtime_error("Invalid configuration: manager.lease_duration_ms must exceed manager.poll_interval_ms");
  }
}

} // namespace negotiation::config
