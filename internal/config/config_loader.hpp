#pragma once

#include <string>

#include "config/config.pb.h"

namespace srepl::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static srepl::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Configuration used when no file is given on the command line.
  static srepl::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(srepl::runtime::config::RuntimeConfig* config);
};

} // namespace srepl::config
