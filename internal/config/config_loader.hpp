#pragma once

#include <string>

#include "config/config.pb.h"

namespace recall::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Zero-valued fields are replaced by defaults, then the result is
  validated.
*/
class ConfigLoader {
 public:
  static recall::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static recall::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills zero-valued fields with defaults. Idempotent.
  static void ApplyDefaults(recall::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error naming the first invalid field.
  static void Validate(const recall::runtime::config::RuntimeConfig& config);
};

} // namespace recall::config
