#pragma once

#include <string>

#include "config/config.pb.h"

namespace batchsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  ${VAR} inside string scalars is replaced from the environment.
*/
class ConfigLoader {
 public:
  static batchsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static batchsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static std::string SubstituteEnv(const std::string& value);
};

} // namespace batchsync::config
