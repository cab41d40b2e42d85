#pragma once

#include <memory>

#include "internal/recovery/recovery_service.hpp"
#include "internal/scheduler/scheduler.hpp"
#include "internal/util/time.hpp"
#include "sharedq/config/v1/config.pb.h"

namespace sharedq::storage {
class SharedStore;
}
namespace sharedq::lease {
class LockManager;
}
namespace sharedq::task {
class TaskStore;
}
namespace sharedq::heartbeat {
class HeartbeatService;
}

namespace sharedq::factory {

/*
  Runtime

  Owns all long-lived components of one worker process.
  Everything here lives for the lifetime of the process.
*/
struct Runtime {
  sharedq::config::v1::RuntimeConfig config;
  std::string                        worker_id;

  std::shared_ptr<util::Clock>                 clock;
  std::shared_ptr<storage::SharedStore>        store;
  std::shared_ptr<lease::LockManager>          locks;
  std::shared_ptr<task::TaskStore>             tasks;
  std::shared_ptr<heartbeat::HeartbeatService> heartbeat;
  std::shared_ptr<recovery::RecoveryService>   recovery;
};

/*
  BuildRuntime

  Composition root. Validates the config, opens the store under
  storage.root and creates tasks/ and locks/. Throws util::InvalidConfig or
  util::StorageIOError, both fatal at startup.

  `store` overrides the local filesystem store (tests pass a MemoryStore).
*/
Runtime BuildRuntime(const sharedq::config::v1::RuntimeConfig& config, std::shared_ptr<util::Clock> clock = util::DefaultClock(),
                     std::shared_ptr<storage::SharedStore> store = nullptr);

scheduler::SchedulerOptions MakeSchedulerOptions(const sharedq::config::v1::RuntimeConfig& config, const std::string& worker_id);
recovery::RecoveryOptions   MakeRecoveryOptions(const sharedq::config::v1::RuntimeConfig& config, const std::string& worker_id);

std::unique_ptr<scheduler::Scheduler> BuildScheduler(const Runtime& runtime, scheduler::ExecuteFn execute);

} // namespace sharedq::factory
