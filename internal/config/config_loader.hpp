#pragma once

#include <string>

#include "config/config.pb.h"

namespace capacity::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset sections are
  filled with the deployment defaults, then the result is validated.
*/
class ConfigLoader {
 public:
  static capacity::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static capacity::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(capacity::runtime::config::RuntimeConfig& config);

  // Throws std::invalid_argument on the first inconsistent value.
  static void Validate(const capacity::runtime::config::RuntimeConfig& config);
};

} // namespace capacity::config
