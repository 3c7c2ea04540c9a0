#pragma once

#include <string>

#include "config/config.pb.h"

namespace pbxpatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Throws util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static pbxpatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace pbxpatch::config
