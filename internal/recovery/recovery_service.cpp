#include "recovery_service.hpp"

#include <map>
#include <stdexcept>
#include <vector>

#include "internal/lease/lock_manager.hpp"
#include "internal/model/task_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/task/task_store.hpp"
#include "internal/util/errors.hpp"

namespace sharedq::recovery {

using model::Task;
using model::TaskState;
using observability::IntField;
using observability::StringField;

RecoveryService::RecoveryService(std::shared_ptr<task::TaskStore> tasks, std::shared_ptr<lease::LockManager> locks, std::shared_ptr<util::Clock> clock,
                                 RecoveryOptions options)
    : tasks_(std::move(tasks)), locks_(std::move(locks)), clock_(std::move(clock)), options_(std::move(options)) {
  if (options_.lease_duration.count() <= 0) {
    throw util::InvalidConfig("recovery lease_duration must be positive");
  }
  if (options_.recoverer_id.empty()) {
    throw util::InvalidConfig("recovery recoverer_id must be set");
  }
}

RecoveryService::~RecoveryService() {
  Shutdown();
}

RecoveryReport RecoveryService::RecoverOnce() {
  RecoveryReport report;
  report.duplicates_removed = ResolveDuplicates();

  for (const auto& id : tasks_->ListIds(TaskState::kRunning)) {
    ++report.scanned;
    try {
      switch (Reclaim(id)) {
        case ReclaimResult::kReclaimed:
          ++report.reclaimed;
          break;
        case ReclaimResult::kFailed:
          ++report.failed;
          break;
        case ReclaimResult::kSkipped:
          ++report.skipped;
          break;
      }
    } catch (const util::StorageIOError& e) {
      // left running; the next pass retries
      ++report.skipped;
      SHAREDQ_LOG_WARN("reclaim failed", {StringField("task_id", id), StringField("error", e.what())});
    } catch (const util::MalformedDescriptor& e) {
      ++report.skipped;
      SHAREDQ_LOG_WARN("cannot reclaim malformed descriptor", {StringField("task_id", id), StringField("error", e.what())});
    } catch (const std::invalid_argument& e) {
      ++report.skipped;
      SHAREDQ_LOG_WARN("ignoring descriptor with invalid name", {StringField("task_id", id), StringField("error", e.what())});
    }
  }

  report.orphan_locks_removed = SweepOrphanLocks();

  if (report.reclaimed || report.failed || report.duplicates_removed || report.orphan_locks_removed) {
    SHAREDQ_LOG_INFO("recovery pass complete", {IntField("scanned", report.scanned), IntField("reclaimed", report.reclaimed), IntField("failed", report.failed),
                                                IntField("duplicates_removed", report.duplicates_removed),
                                                IntField("orphan_locks_removed", report.orphan_locks_removed)});
  }
  return report;
}

ReclaimResult RecoveryService::Reclaim(const std::string& task_id) {
  if (!tasks_->Exists(task_id, TaskState::kRunning)) return ReclaimResult::kSkipped;

  const auto status = locks_->Inspect(task_id, options_.lease_duration);
  if (status.state == lease::MarkerState::kLive) return ReclaimResult::kSkipped;

  // Take the marker so no other recoverer or claimant works the task while
  // it is being moved. A fresh claimant winning here is a skip.
  if (!locks_->TryAcquire(task_id, options_.recoverer_id, options_.lease_duration)) {
    return ReclaimResult::kSkipped;
  }

  try {
    const auto result = ReclaimLocked(task_id);
    locks_->Release(task_id, options_.recoverer_id);
    return result;
  } catch (const std::exception&) {
    locks_->Release(task_id, options_.recoverer_id);
    throw;
  }
}

ReclaimResult RecoveryService::ReclaimLocked(const std::string& task_id) {
  Task task;
  task.id    = task_id;
  task.state = TaskState::kRunning;

  try {
    task = tasks_->Reload(task);
  } catch (const util::RaceLost&) {
    // finished or already reclaimed between listing and takeover
    return ReclaimResult::kSkipped;
  }

  const auto previous_owner = task.descriptor.owner();
  const auto retries        = task.descriptor.retry_count() + 1;

  auto& descriptor = task.descriptor;
  descriptor.set_retry_count(retries);
  *descriptor.mutable_last_failed_at() = util::ToProto(clock_->Now());
  descriptor.set_failure_reason("stale task recovery");
  descriptor.set_recovered_by(options_.recoverer_id);
  descriptor.clear_owner();
  descriptor.clear_heartbeat_at();

  try {
    if (retries > options_.max_retries) {
      task::TerminalOutcome outcome;
      outcome.error = "exhausted retries (" + std::to_string(retries) + " > " + std::to_string(options_.max_retries) + ")";
      tasks_->WriteTerminal(task, TaskState::kFailed, outcome);

      SHAREDQ_LOG_WARN("task failed after exhausting retries",
                       {StringField("task_id", task_id), StringField("previous_owner", previous_owner), IntField("retry_count", retries)});
      return ReclaimResult::kFailed;
    }

    tasks_->Rewrite(task);
    tasks_->Transition(task, TaskState::kRunning, TaskState::kPending);
  } catch (const util::RaceLost&) {
    return ReclaimResult::kSkipped;
  } catch (const util::Conflict&) {
    // target copy already exists; duplicate resolution settles it
    return ReclaimResult::kSkipped;
  }

  SHAREDQ_LOG_INFO("reclaimed stale task",
                   {StringField("task_id", task_id), StringField("previous_owner", previous_owner), IntField("retry_count", retries)});
  return ReclaimResult::kReclaimed;
}

std::size_t RecoveryService::ResolveDuplicates() {
  std::map<std::string, std::vector<TaskState>> copies;
  for (auto state : model::kAllTaskStates) {
    for (const auto& id : tasks_->ListIds(state)) copies[id].push_back(state);
  }

  std::size_t removed = 0;
  for (const auto& [id, states] : copies) {
    if (states.size() < 2) continue;

    TaskState keep = states.front();
    for (auto state : states) {
      if (model::Precedence(state) > model::Precedence(keep)) keep = state;
    }

    for (auto state : states) {
      if (state == keep) continue;
      try {
        if (state == TaskState::kRunning && locks_->Inspect(id, options_.lease_duration).state == lease::MarkerState::kLive) {
          // owner still active; may be listing lag on the other copy
          continue;
        }
        if (tasks_->RemoveCopy(id, state)) {
          ++removed;
          SHAREDQ_LOG_WARN("removed duplicate task descriptor",
                           {StringField("task_id", id), StringField("removed", std::string(model::StateName(state))),
                            StringField("kept", std::string(model::StateName(keep)))});
        }
      } catch (const util::StorageIOError& e) {
        SHAREDQ_LOG_WARN("failed to remove duplicate descriptor", {StringField("task_id", id), StringField("error", e.what())});
      } catch (const std::invalid_argument& e) {
        SHAREDQ_LOG_WARN("ignoring descriptor with invalid name", {StringField("task_id", id), StringField("error", e.what())});
      }
    }
  }
  return removed;
}

std::size_t RecoveryService::SweepOrphanLocks() {
  std::size_t removed = 0;

  for (const auto& id : locks_->ListMarkers()) {
    try {
      // a running descriptor means the marker is handled by Reclaim
      if (tasks_->Exists(id, TaskState::kRunning)) continue;
      if (locks_->RemoveIfStale(id, options_.lease_duration)) {
        ++removed;
        SHAREDQ_LOG_INFO("removed orphaned lock marker", {StringField("task_id", id)});
      }
    } catch (const util::StorageIOError& e) {
      SHAREDQ_LOG_WARN("failed to sweep lock marker", {StringField("task_id", id), StringField("error", e.what())});
    } catch (const std::invalid_argument& e) {
      SHAREDQ_LOG_WARN("ignoring lock marker with invalid name", {StringField("task_id", id), StringField("error", e.what())});
    }
  }
  return removed;
}

void RecoveryService::Launch() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&RecoveryService::Loop, this);
}

void RecoveryService::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void RecoveryService::Loop() {
  while (running_) {
    try {
      RecoverOnce();
    } catch (const util::StorageIOError& e) {
      SHAREDQ_LOG_WARN("recovery pass failed", {StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, options_.interval, [this] { return !running_; });
  }
}

} // namespace sharedq::recovery
