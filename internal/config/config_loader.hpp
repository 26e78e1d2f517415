#pragma once

#include <string>

#include "flowlock/config/v1/config.pb.h"

namespace flowlock::config {

using RuntimeConfig = flowlock::config::v1::RuntimeConfig;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Missing values are filled from Defaults() and the result is
  checked by Validate() before it is returned.
*/
class ConfigLoader {
 public:
  static RuntimeConfig LoadFromYaml(const std::string& path);

  // In-memory database, 15s lock ttl, 10s blocking timeout, 5s row lock wait.
  static RuntimeConfig Defaults();

  static void ApplyDefaults(RuntimeConfig& config);

  // Throws std::runtime_error naming the offending key.
  static void Validate(const RuntimeConfig& config);
};

} // namespace flowlock::config
