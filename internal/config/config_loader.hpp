#pragma once

#include <string>

#include "config/config.pb.h"

namespace reaper::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so field names
  and types are checked against config.proto. Unknown keys are errors.
*/
class ConfigLoader {
 public:
  static reaper::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static reaper::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace reaper::config
