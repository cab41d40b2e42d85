#include "config_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"
#include "internal/util/yaml_proto.hpp"

namespace sharedq::config {

using sharedq::config::v1::RetryPolicyConfig;
using sharedq::config::v1::RuntimeConfig;

namespace {

RuntimeConfig ParseNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  try {
    util::ParseYamlNode(yaml, &config, /*ignore_unknown_fields=*/false);
  } catch (const std::runtime_error& e) {
    throw util::InvalidConfig("Invalid configuration: " + std::string(e.what()));
  }
  ValidateConfig(config);
  return config;
}

bool IsNegative(const google::protobuf::Duration& duration) {
  return duration.seconds() < 0 || duration.nanos() < 0;
}

void ValidateRetryPolicy(const std::string& name, const RetryPolicyConfig& policy) {
  if (IsNegative(policy.base_delay()) || IsNegative(policy.max_delay())) {
    throw util::InvalidConfig(name + " delays must not be negative");
  }
  if (policy.has_base_delay() && policy.has_max_delay() && util::FromProto(policy.max_delay()) < util::FromProto(policy.base_delay())) {
    throw util::InvalidConfig(name + ".max_delay must not be shorter than base_delay");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw util::InvalidConfig("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseNode(yaml);
}

void ValidateConfig(const RuntimeConfig& config) {
  if (config.storage().root().empty()) {
    throw util::InvalidConfig("storage.root is required");
  }

  const auto& leases = config.leases();
  if (!leases.has_lease_duration() || util::FromProto(leases.lease_duration()).count() <= 0) {
    throw util::InvalidConfig("leases.lease_duration is required and must be positive");
  }
  if (!leases.has_heartbeat_interval() || util::FromProto(leases.heartbeat_interval()).count() <= 0) {
    throw util::InvalidConfig("leases.heartbeat_interval is required and must be positive");
  }
  if (util::FromProto(leases.heartbeat_interval()) >= util::FromProto(leases.lease_duration())) {
    throw util::InvalidConfig("leases.heartbeat_interval must be shorter than leases.lease_duration");
  }

  if (!config.recovery().has_max_retries()) {
    throw util::InvalidConfig("recovery.max_retries is required");
  }

  const auto& scheduler = config.scheduler();
  for (const auto* duration : {&scheduler.poll_interval(), &scheduler.max_poll_interval(), &scheduler.recovery_interval(),
                               &scheduler.cleanup_interval(), &scheduler.temp_file_max_age(), &config.storage().rename_retry_delay()}) {
    if (IsNegative(*duration)) throw util::InvalidConfig("durations must not be negative");
  }
  if (scheduler.has_poll_interval() && util::FromProto(scheduler.poll_interval()).count() <= 0) {
    throw util::InvalidConfig("scheduler.poll_interval must be positive");
  }
  if (scheduler.has_poll_interval() && scheduler.has_max_poll_interval() &&
      util::FromProto(scheduler.max_poll_interval()) < util::FromProto(scheduler.poll_interval())) {
    throw util::InvalidConfig("scheduler.max_poll_interval must not be shorter than scheduler.poll_interval");
  }
  ValidateRetryPolicy("scheduler.claim_retry", scheduler.claim_retry());
  ValidateRetryPolicy("scheduler.finalize_retry", scheduler.finalize_retry());

  if (!config.worker().id().empty()) {
    try {
      util::ValidateId(config.worker().id());
    } catch (const std::invalid_argument& e) {
      throw util::InvalidConfig("worker.id: " + std::string(e.what()));
    }
  }
}

} // namespace sharedq::config
