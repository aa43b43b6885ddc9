#pragma once

#include <string>

#include "config/config.pb.h"

namespace negotiation::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON and parsed into protobuf; unknown keys are
  rejected. Unset manager tunables get their defaults and the result is
  validated. Every failure throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static negotiation::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static negotiation::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(negotiation::runtime::config::RuntimeConfig& config);
  static void Validate(const negotiation::runtime::config::RuntimeConfig& config);
};

} // namespace negotiation::config
