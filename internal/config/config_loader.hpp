#pragma once

#include <string>

#include "config/config.pb.h"

namespace analysis::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Environment
  overrides (ANALYSIS_*) are applied on top, defaults filled last.
  The result is read once at process start and passed by const reference.
*/
class ConfigLoader {
 public:
  static analysis::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // No file: defaults + environment only.
  static analysis::runtime::config::RuntimeConfig LoadFromEnvironment();

  static void ApplyEnvironmentOverrides(analysis::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(analysis::runtime::config::RuntimeConfig& config);

  // Throws InvalidState when addresses are malformed or broker/backend collide.
  static void Validate(const analysis::runtime::config::RuntimeConfig& config);
};

} // namespace analysis::config
