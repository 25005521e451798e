#pragma once

#include <string>

#include "config/config.pb.h"

namespace mirrorsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; every failure surfaces as util::ConfigError.
*/
class ConfigLoader {
 public:
  static mirrorsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

/*
  Startup validation. Only configuration problems are fatal, so these run
  before anything is started and throw util::ConfigError.
*/
void ValidateOriginConfig(const mirrorsync::runtime::config::RuntimeConfig& config);
void ValidateAgentConfig(const mirrorsync::runtime::config::RuntimeConfig& config);

} // namespace mirrorsync::config
