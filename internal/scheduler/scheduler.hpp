#pragma once

#include <atomic>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/model/task.hpp"
#include "internal/util/backoff.hpp"
#include "internal/util/time.hpp"

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
namespace sharedq::recovery {
class RecoveryService;
}

namespace sharedq::scheduler {

enum class SchedulerState {
  kIdle,
  kClaiming,
  kExecuting,
  kFinalizing,
};

std::string_view SchedulerStateName(SchedulerState state);

struct ExecutionOutcome {
  bool                     ok = false;
  google::protobuf::Struct result;
  std::string              error;

  static ExecutionOutcome Success(google::protobuf::Struct result);
  static ExecutionOutcome Failure(std::string error);
};

// Runs one task. Throwing is treated the same as returning a failure.
using ExecuteFn = std::function<ExecutionOutcome(const std::string& task_id, const google::protobuf::Struct& payload)>;

struct SchedulerOptions {
  std::string        worker_id;
  util::Milliseconds lease_duration{0};
  util::Milliseconds heartbeat_interval{0};
  util::Milliseconds poll_interval{1000};
  util::Milliseconds max_poll_interval{30000};
  util::Milliseconds recovery_interval{30000};
  util::Milliseconds cleanup_interval{300000};
  util::Milliseconds temp_file_max_age{3600000};
  util::RetryPolicy  claim_retry;
  util::RetryPolicy  finalize_retry;
  bool               run_recovery = true;
};

struct SchedulerStats {
  uint64_t polls              = 0;
  uint64_t claimed            = 0;
  uint64_t claims_lost        = 0;
  uint64_t completed          = 0;
  uint64_t failed             = 0;
  uint64_t abandoned          = 0;
  uint64_t recovery_passes    = 0;
  uint64_t temp_files_removed = 0;

  uint64_t finished() const {
    return completed + failed + abandoned;
  }
};

/*
  One worker's participation in the shared queue, as an explicit state
  machine:

      IDLE -> CLAIMING -> EXECUTING -> FINALIZING -> IDLE

  IDLE        run due maintenance (recovery, temp cleanup), poll PENDING
  CLAIMING    lock the best candidate, rename it to RUNNING, start beating
  EXECUTING   invoke the callback
  FINALIZING  stop beating, write the terminal descriptor, release the lock

  Every state change goes through Step(), so tests can drive the machine
  one transition at a time with a manual clock and an in-memory store.
  Nothing that happens to a single task aborts the loop.
*/
class Scheduler {
 public:
  Scheduler(std::shared_ptr<storage::SharedStore> store, std::shared_ptr<task::TaskStore> tasks, std::shared_ptr<lease::LockManager> locks,
            std::shared_ptr<heartbeat::HeartbeatService> heartbeat, std::shared_ptr<recovery::RecoveryService> recovery,
            std::shared_ptr<util::Clock> clock, SchedulerOptions options, ExecuteFn execute);

  Scheduler(const Scheduler&)            = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Performs exactly one state transition and returns the new state.
  SchedulerState Step();

  // Drives one task to a terminal state. False once a poll finds nothing
  // this worker could claim.
  bool RunOnce();

  // Loops until RequestStop(), sleeping with backoff while idle.
  void Run();
  void RequestStop();

  // Runs recovery and temp cleanup if due.
  void RunMaintenance();

  // For use from inside the callback of the task currently executing.
  bool ReportProgress(const std::string& task_id, double percentage, const std::string& status = {});

  SchedulerState state() const {
    return state_;
  }

  std::optional<std::string> current_task_id() const;
  SchedulerStats             stats() const;

 private:
  SchedulerState HandleIdle();
  SchedulerState HandleClaiming();
  SchedulerState HandleExecuting();
  SchedulerState HandleFinalizing();

  void Poll();
  bool StillOwned(const std::string& task_id);
  std::optional<model::TaskState> Finish(const model::Task& task, const ExecutionOutcome& outcome);
  void SleepWhileIdle(util::Milliseconds delay);

  std::shared_ptr<storage::SharedStore>        store_;
  std::shared_ptr<task::TaskStore>             tasks_;
  std::shared_ptr<lease::LockManager>          locks_;
  std::shared_ptr<heartbeat::HeartbeatService> heartbeat_;
  std::shared_ptr<recovery::RecoveryService>   recovery_;
  std::shared_ptr<util::Clock>                 clock_;
  SchedulerOptions                             options_;
  ExecuteFn                                    execute_;

  std::atomic<SchedulerState> state_{SchedulerState::kIdle};
  std::atomic<bool>           stop_requested_{false};

  std::deque<model::Task>         candidates_;
  std::optional<ExecutionOutcome> outcome_;
  util::Milliseconds              idle_delay_;
  util::TimePoint                 next_recovery_{};
  util::TimePoint                 next_cleanup_{};

  // Guards current_ and stats_; ReportProgress may arrive from the
  // callback's own threads.
  mutable std::mutex         mutex_;
  std::optional<model::Task> current_;
  SchedulerStats             stats_;
};

} // namespace sharedq::scheduler
