#pragma once

#include <string>

#include "config/config.pb.h"

namespace notewatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Zero values are
  replaced with defaults by ApplyDefaults.
*/
class ConfigLoader {
 public:
  static notewatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(notewatch::runtime::config::RuntimeConfig& config);
};

} // namespace notewatch::config
