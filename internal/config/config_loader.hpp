#pragma once

#include <string>

#include "sharedq/config/v1/config.pb.h"

namespace sharedq::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Every failure, including a missing file, surfaces as
  util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static sharedq::config::v1::RuntimeConfig LoadFromYaml(const std::string& path);
  static sharedq::config::v1::RuntimeConfig LoadFromString(const std::string& yaml);
};

// Required: storage.root, leases.lease_duration, leases.heartbeat_interval
// (shorter than the lease) and recovery.max_retries.
void ValidateConfig(const sharedq::config::v1::RuntimeConfig& config);

} // namespace sharedq::config
