#include "factory.hpp"

#include "internal/config/config_loader.hpp"
#include "internal/heartbeat/heartbeat_service.hpp"
#include "internal/lease/lock_manager.hpp"
#include "internal/storage/disk/local_fs_store.hpp"
#include "internal/task/task_store.hpp"
#include "internal/util/id.hpp"

namespace sharedq::factory {

using sharedq::config::v1::RetryPolicyConfig;
using sharedq::config::v1::RuntimeConfig;

namespace {

util::Milliseconds DurationOr(bool present, const google::protobuf::Duration& duration, util::Milliseconds fallback) {
  return present ? util::FromProto(duration) : fallback;
}

util::RetryPolicy MakeRetryPolicy(bool present, const RetryPolicyConfig& config) {
  util::RetryPolicy policy;
  if (!present) return policy;

  if (config.max_attempts() > 0) policy.max_attempts = config.max_attempts();
  if (config.has_base_delay()) policy.base_delay = util::FromProto(config.base_delay());
  if (config.has_max_delay()) policy.max_delay = util::FromProto(config.max_delay());
  return policy;
}

storage::StoreOptions MakeStoreOptions(const RuntimeConfig& config) {
  storage::StoreOptions options;
  const auto&           storage = config.storage();
  if (storage.rename_retries() > 0) options.rename_retries = storage.rename_retries();
  if (storage.has_rename_retry_delay()) options.rename_retry_delay = util::FromProto(storage.rename_retry_delay());
  return options;
}

} // namespace

scheduler::SchedulerOptions MakeSchedulerOptions(const RuntimeConfig& config, const std::string& worker_id) {
  const auto& scheduler = config.scheduler();

  scheduler::SchedulerOptions options;
  options.worker_id          = worker_id;
  options.lease_duration     = util::FromProto(config.leases().lease_duration());
  options.heartbeat_interval = util::FromProto(config.leases().heartbeat_interval());
  options.poll_interval      = DurationOr(scheduler.has_poll_interval(), scheduler.poll_interval(), options.poll_interval);
  options.max_poll_interval  = DurationOr(scheduler.has_max_poll_interval(), scheduler.max_poll_interval(), options.max_poll_interval);
  options.recovery_interval  = DurationOr(scheduler.has_recovery_interval(), scheduler.recovery_interval(), options.recovery_interval);
  options.cleanup_interval   = DurationOr(scheduler.has_cleanup_interval(), scheduler.cleanup_interval(), options.cleanup_interval);
  options.temp_file_max_age  = DurationOr(scheduler.has_temp_file_max_age(), scheduler.temp_file_max_age(), options.temp_file_max_age);
  options.claim_retry        = MakeRetryPolicy(scheduler.has_claim_retry(), scheduler.claim_retry());
  options.finalize_retry     = MakeRetryPolicy(scheduler.has_finalize_retry(), scheduler.finalize_retry());
  options.run_recovery       = !scheduler.has_run_recovery() || scheduler.run_recovery();

  if (options.max_poll_interval < options.poll_interval) options.max_poll_interval = options.poll_interval;
  return options;
}

recovery::RecoveryOptions MakeRecoveryOptions(const RuntimeConfig& config, const std::string& worker_id) {
  recovery::RecoveryOptions options;
  options.lease_duration = util::FromProto(config.leases().lease_duration());
  options.max_retries    = config.recovery().max_retries();
  options.recoverer_id   = worker_id + "-recovery";

  const auto& scheduler = config.scheduler();
  options.interval      = DurationOr(scheduler.has_recovery_interval(), scheduler.recovery_interval(), options.interval);
  return options;
}

Runtime BuildRuntime(const RuntimeConfig& config, std::shared_ptr<util::Clock> clock, std::shared_ptr<storage::SharedStore> store) {
  sharedq::config::ValidateConfig(config);

  Runtime runtime;
  runtime.config    = config;
  runtime.worker_id = config.worker().id().empty() ? util::GenerateWorkerId() : config.worker().id();
  runtime.clock     = std::move(clock);

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  if (store) {
    runtime.store = std::move(store);
  } else {
    runtime.store = std::make_shared<storage::LocalFsStore>(config.storage().root(), MakeStoreOptions(config), runtime.clock);
  }

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  runtime.locks = std::make_shared<lease::LockManager>(runtime.store, runtime.clock);
  runtime.tasks = std::make_shared<task::TaskStore>(runtime.store, runtime.clock, runtime.worker_id);
  runtime.tasks->Initialize();

  runtime.heartbeat = std::make_shared<heartbeat::HeartbeatService>(runtime.locks, runtime.clock);
  runtime.recovery  = std::make_shared<recovery::RecoveryService>(runtime.tasks, runtime.locks, runtime.clock,
                                                                  MakeRecoveryOptions(config, runtime.worker_id));
  return runtime;
}

std::unique_ptr<scheduler::Scheduler> BuildScheduler(const Runtime& runtime, scheduler::ExecuteFn execute) {
  return std::make_unique<scheduler::Scheduler>(runtime.store, runtime.tasks, runtime.locks, runtime.heartbeat, runtime.recovery, runtime.clock,
                                                MakeSchedulerOptions(runtime.config, runtime.worker_id), std::move(execute));
}

} // namespace sharedq::factory
