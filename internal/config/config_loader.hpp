#pragma once

#include <string>

#include "config/config.pb.h"

namespace sitepull::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; absent values are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static sitepull::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static sitepull::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace sitepull::config
