#pragma once

#include <string>

#include "config/config.pb.h"

namespace tracelens::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; every failure is reported as util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static tracelens::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static tracelens::runtime::config::RuntimeConfig ParseYaml(const std::string& document);
};

} // namespace tracelens::config
