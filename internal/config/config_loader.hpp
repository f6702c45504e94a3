#pragma once

#include <string>

#include "config/config.pb.h"

namespace flowstore::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected the same way the proto JSON parser rejects them.
*/
class ConfigLoader {
 public:
  static flowstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static flowstore::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace flowstore::config
