#pragma once

#include <string>

#include "config/config.pb.h"

namespace research::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. The returned config has defaults resolved.
*/
class ConfigLoader {
 public:
  static research::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

/*
  Replaces zero values with the documented defaults.

  Idempotent. An empty database section selects the memory backend, an empty
  worker_id becomes "<hostname>:<pid>".
*/
void ResolveDefaults(research::runtime::config::RuntimeConfig& config);

} // namespace research::config
