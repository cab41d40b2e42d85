#include "scheduler.hpp"

#include <algorithm>

#include "internal/heartbeat/heartbeat_service.hpp"
#include "internal/lease/lock_manager.hpp"
#include "internal/model/codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recovery/recovery_service.hpp"
#include "internal/storage/shared_store.hpp"
#include "internal/task/task_store.hpp"
#include "internal/util/errors.hpp"

namespace sharedq::scheduler {

using model::Task;
using model::TaskState;
using observability::IntField;
using observability::StringField;

namespace {

constexpr util::Milliseconds kSleepSlice{100};

bool ComesBefore(const Task& a, const Task& b) {
  if (a.descriptor.priority() != b.descriptor.priority()) {
    return a.descriptor.priority() > b.descriptor.priority();
  }
  const auto a_created = util::FromProto(a.descriptor.created_at());
  const auto b_created = util::FromProto(b.descriptor.created_at());
  if (a_created != b_created) return a_created < b_created;
  return a.id < b.id;
}

} // namespace

std::string_view SchedulerStateName(SchedulerState state) {
  switch (state) {
    case SchedulerState::kIdle:
      return "idle";
    case SchedulerState::kClaiming:
      return "claiming";
    case SchedulerState::kExecuting:
      return "executing";
    case SchedulerState::kFinalizing:
      return "finalizing";
  }
  return "unknown";
}

ExecutionOutcome ExecutionOutcome::Success(google::protobuf::Struct result) {
  ExecutionOutcome outcome;
  outcome.ok     = true;
  outcome.result = std::move(result);
  return outcome;
}

ExecutionOutcome ExecutionOutcome::Failure(std::string error) {
  ExecutionOutcome outcome;
  outcome.ok    = false;
  outcome.error = std::move(error);
  return outcome;
}

Scheduler::Scheduler(std::shared_ptr<storage::SharedStore> store, std::shared_ptr<task::TaskStore> tasks, std::shared_ptr<lease::LockManager> locks,
                     std::shared_ptr<heartbeat::HeartbeatService> heartbeat, std::shared_ptr<recovery::RecoveryService> recovery,
                     std::shared_ptr<util::Clock> clock, SchedulerOptions options, ExecuteFn execute)
    : store_(std::move(store)),
      tasks_(std::move(tasks)),
      locks_(std::move(locks)),
      heartbeat_(std::move(heartbeat)),
      recovery_(std::move(recovery)),
      clock_(std::move(clock)),
      options_(std::move(options)),
      execute_(std::move(execute)),
      idle_delay_(options_.poll_interval) {
  if (options_.worker_id.empty()) throw util::InvalidConfig("scheduler worker_id must be set");
  if (options_.lease_duration.count() <= 0) throw util::InvalidConfig("scheduler lease_duration must be positive");
  if (options_.heartbeat_interval.count() <= 0 || options_.heartbeat_interval >= options_.lease_duration) {
    throw util::InvalidConfig("scheduler heartbeat_interval must be positive and shorter than the lease");
  }
  if (options_.poll_interval.count() <= 0) throw util::InvalidConfig("scheduler poll_interval must be positive");
  if (!execute_) throw util::InvalidConfig("scheduler requires an execution callback");

  const auto now = clock_->Now();
  next_recovery_ = now;
  next_cleanup_  = now;
}

SchedulerState Scheduler::Step() {
  const auto current = state_.load();

  SchedulerState next = current;
  switch (current) {
    case SchedulerState::kIdle:
      next = HandleIdle();
      break;
    case SchedulerState::kClaiming:
      next = HandleClaiming();
      break;
    case SchedulerState::kExecuting:
      next = HandleExecuting();
      break;
    case SchedulerState::kFinalizing:
      next = HandleFinalizing();
      break;
  }

  if (next != current) {
    SHAREDQ_LOG_DEBUG("scheduler state change",
                      {StringField("from", SchedulerStateName(current)), StringField("to", SchedulerStateName(next))});
  }
  state_ = next;
  return next;
}

SchedulerState Scheduler::HandleIdle() {
  RunMaintenance();
  if (candidates_.empty()) Poll();
  return candidates_.empty() ? SchedulerState::kIdle : SchedulerState::kClaiming;
}

void Scheduler::Poll() {
  {
    std::lock_guard lock(mutex_);
    ++stats_.polls;
  }

  try {
    auto pending = tasks_->List(TaskState::kPending);
    std::sort(pending.begin(), pending.end(), ComesBefore);
    candidates_.assign(pending.begin(), pending.end());
  } catch (const util::StorageIOError& e) {
    SHAREDQ_LOG_WARN("failed to list pending tasks", {StringField("error", e.what())});
  }
}

SchedulerState Scheduler::HandleClaiming() {
  if (candidates_.empty()) return SchedulerState::kIdle;

  const Task candidate = candidates_.front();
  candidates_.pop_front();

  const auto& worker_id = options_.worker_id;

  bool acquired = false;
  try {
    acquired = util::RetryOnStorageError(options_.claim_retry, *clock_, "acquire task lock",
                                         [&] { return locks_->TryAcquire(candidate.id, worker_id, options_.lease_duration); });
  } catch (const util::StorageIOError& e) {
    SHAREDQ_LOG_WARN("giving up on claim", {StringField("task_id", candidate.id), StringField("error", e.what())});
    return SchedulerState::kIdle;
  }

  if (!acquired) {
    SHAREDQ_LOG_DEBUG("task already claimed", {StringField("task_id", candidate.id)});
    std::lock_guard lock(mutex_);
    ++stats_.claims_lost;
    return SchedulerState::kIdle;
  }

  Task running;
  try {
    tasks_->Transition(candidate, TaskState::kPending, TaskState::kRunning);

    // the polled body may be stale; work from what is on disk now
    running = tasks_->Reload(Task{candidate.id, TaskState::kRunning, {}});

    const auto now   = util::ToProto(clock_->Now());
    auto& descriptor = running.descriptor;
    descriptor.set_owner(worker_id);
    *descriptor.mutable_heartbeat_at() = now;
    *descriptor.mutable_started_at()   = now;
    descriptor.clear_progress();

    try {
      util::RetryOnStorageError(options_.claim_retry, *clock_, "record task owner", [&] { tasks_->Rewrite(running); });
    } catch (const util::StorageIOError& e) {
      // the marker is authoritative for ownership; keep going
      SHAREDQ_LOG_WARN("failed to record owner in descriptor", {StringField("task_id", candidate.id), StringField("error", e.what())});
    }
  } catch (const util::RaceLost& e) {
    locks_->Release(candidate.id, worker_id);
    SHAREDQ_LOG_DEBUG("lost claim race", {StringField("task_id", candidate.id), StringField("reason", e.what())});
    std::lock_guard lock(mutex_);
    ++stats_.claims_lost;
    return SchedulerState::kIdle;
  } catch (const util::Conflict& e) {
    locks_->Release(candidate.id, worker_id);
    SHAREDQ_LOG_WARN("running descriptor already exists", {StringField("task_id", candidate.id), StringField("error", e.what())});
    return SchedulerState::kIdle;
  } catch (const util::StorageIOError& e) {
    locks_->Release(candidate.id, worker_id);
    SHAREDQ_LOG_WARN("failed to move task to running", {StringField("task_id", candidate.id), StringField("error", e.what())});
    return SchedulerState::kIdle;
  } catch (const util::MalformedDescriptor& e) {
    locks_->Release(candidate.id, worker_id);
    SHAREDQ_LOG_WARN("claimed descriptor is malformed", {StringField("task_id", candidate.id), StringField("error", e.what())});
    return SchedulerState::kIdle;
  }

  heartbeat_->Start(running.id, worker_id, options_.heartbeat_interval);

  {
    std::lock_guard lock(mutex_);
    current_ = running;
    ++stats_.claimed;
  }
  outcome_.reset();

  SHAREDQ_LOG_INFO("claimed task", {StringField("task_id", running.id), IntField("retry_count", running.descriptor.retry_count())});
  return SchedulerState::kExecuting;
}

SchedulerState Scheduler::HandleExecuting() {
  Task task;
  {
    std::lock_guard lock(mutex_);
    if (!current_) return SchedulerState::kIdle;
    task = *current_;
  }

  ExecutionOutcome outcome;
  try {
    outcome = execute_(task.id, task.descriptor.payload());
  } catch (const std::exception& e) {
    outcome = ExecutionOutcome::Failure(e.what());
  } catch (...) {
    outcome = ExecutionOutcome::Failure("callback threw a non-standard exception");
  }

  if (outcome.ok && model::ContainsNonFiniteNumber(outcome.result)) {
    outcome = ExecutionOutcome::Failure("result contains a non-finite number");
  }

  if (!outcome.ok) {
    SHAREDQ_LOG_WARN("task callback failed", {StringField("task_id", task.id), StringField("error", outcome.error)});
  }

  outcome_ = std::move(outcome);
  return SchedulerState::kFinalizing;
}

SchedulerState Scheduler::HandleFinalizing() {
  Task task;
  {
    std::lock_guard lock(mutex_);
    if (!current_) return SchedulerState::kIdle;
    task = *current_;
  }

  const auto& worker_id = options_.worker_id;
  // the last beat may predate a reclaim; the marker decides
  const bool held = heartbeat_->Stop(task.id) && StillOwned(task.id);

  std::optional<TaskState> final_state;
  if (held) {
    final_state = Finish(task, outcome_ ? *outcome_ : ExecutionOutcome::Failure("no execution outcome recorded"));
  } else {
    SHAREDQ_LOG_WARN("ownership lost during execution, result discarded", {StringField("task_id", task.id)});
  }

  locks_->Release(task.id, worker_id);
  outcome_.reset();

  std::lock_guard lock(mutex_);
  current_.reset();
  if (final_state == TaskState::kDone) {
    ++stats_.completed;
  } else if (final_state == TaskState::kFailed) {
    ++stats_.failed;
  } else {
    ++stats_.abandoned;
  }
  return SchedulerState::kIdle;
}

bool Scheduler::StillOwned(const std::string& task_id) {
  try {
    const auto record =
        util::RetryOnStorageError(options_.finalize_retry, *clock_, "read task lock", [&] { return locks_->Read(task_id); });
    return record && record->owner_id() == options_.worker_id;
  } catch (const util::MalformedDescriptor& e) {
    SHAREDQ_LOG_WARN("unreadable lock marker at finalize", {StringField("task_id", task_id), StringField("error", e.what())});
  } catch (const util::StorageIOError& e) {
    SHAREDQ_LOG_ERROR("cannot confirm task ownership, leaving it to recovery", {StringField("task_id", task_id), StringField("error", e.what())});
  }
  return false;
}

std::optional<TaskState> Scheduler::Finish(const Task& task, const ExecutionOutcome& outcome) {
  const auto state = outcome.ok ? TaskState::kDone : TaskState::kFailed;

  task::TerminalOutcome terminal;
  terminal.result = outcome.result;
  terminal.error  = outcome.error;

  try {
    util::RetryOnStorageError(options_.finalize_retry, *clock_, "write terminal descriptor",
                              [&] { return tasks_->WriteTerminal(task, state, terminal); });
    return state;
  } catch (const util::RaceLost& e) {
    SHAREDQ_LOG_WARN("task moved before it could be finalized", {StringField("task_id", task.id), StringField("reason", e.what())});
    return std::nullopt;
  } catch (const util::Conflict& e) {
    SHAREDQ_LOG_WARN("terminal descriptor already exists", {StringField("task_id", task.id), StringField("error", e.what())});
    return std::nullopt;
  } catch (const util::StorageIOError& e) {
    if (!outcome.ok) {
      SHAREDQ_LOG_ERROR("failed to record task failure, leaving it to recovery", {StringField("task_id", task.id), StringField("error", e.what())});
      return std::nullopt;
    }
    SHAREDQ_LOG_ERROR("failed to record task result", {StringField("task_id", task.id), StringField("error", e.what())});
    terminal.error = std::string("failed to record result: ") + e.what();
  }

  try {
    util::RetryOnStorageError(options_.finalize_retry, *clock_, "write failed descriptor",
                              [&] { return tasks_->WriteTerminal(task, TaskState::kFailed, terminal); });
    return TaskState::kFailed;
  } catch (const util::RaceLost& e) {
    SHAREDQ_LOG_WARN("task moved before it could be finalized", {StringField("task_id", task.id), StringField("reason", e.what())});
  } catch (const util::Conflict& e) {
    SHAREDQ_LOG_WARN("terminal descriptor already exists", {StringField("task_id", task.id), StringField("error", e.what())});
  } catch (const util::StorageIOError& e) {
    SHAREDQ_LOG_ERROR("failed to finalize task, leaving it to recovery", {StringField("task_id", task.id), StringField("error", e.what())});
  }
  return std::nullopt;
}

void Scheduler::RunMaintenance() {
  const auto now = clock_->Now();

  if (options_.run_recovery && recovery_ && now >= next_recovery_) {
    next_recovery_ = now + options_.recovery_interval;
    try {
      recovery_->RecoverOnce();
      std::lock_guard lock(mutex_);
      ++stats_.recovery_passes;
    } catch (const util::StorageIOError& e) {
      SHAREDQ_LOG_WARN("recovery pass failed", {StringField("error", e.what())});
    }
  }

  if (now >= next_cleanup_) {
    next_cleanup_ = now + options_.cleanup_interval;
    try {
      const auto removed = store_->CleanupTempFiles(task::TaskStore::Directory(), options_.temp_file_max_age) +
                           store_->CleanupTempFiles(lease::LockManager::Directory(), options_.temp_file_max_age);
      if (removed > 0) {
        SHAREDQ_LOG_INFO("removed orphaned temp files", {IntField("count", removed)});
      }
      std::lock_guard lock(mutex_);
      stats_.temp_files_removed += removed;
    } catch (const util::StorageIOError& e) {
      SHAREDQ_LOG_WARN("temp file cleanup failed", {StringField("error", e.what())});
    }
  }
}

bool Scheduler::RunOnce() {
  const auto before          = stats();
  const auto finished_before = before.finished();

  // an interrupted task is always finished before returning
  while (state_ != SchedulerState::kIdle || !stop_requested_) {
    if (state_ == SchedulerState::kIdle && candidates_.empty() && stats().polls != before.polls) {
      return false;
    }
    Step();
    if (state_ == SchedulerState::kIdle && stats().finished() != finished_before) {
      return true;
    }
  }
  return false;
}

void Scheduler::Run() {
  heartbeat_->Launch();
  idle_delay_ = options_.poll_interval;

  SHAREDQ_LOG_INFO("scheduler started", {StringField("worker_id", options_.worker_id)});

  while (!stop_requested_) {
    bool worked = false;
    try {
      worked = RunOnce();
    } catch (const util::StorageIOError& e) {
      SHAREDQ_LOG_WARN("scheduler iteration failed", {StringField("error", e.what())});
    }

    if (worked) {
      idle_delay_ = options_.poll_interval;
      continue;
    }
    if (stop_requested_) break;

    SleepWhileIdle(idle_delay_);
    idle_delay_ = std::min(idle_delay_ * 2, options_.max_poll_interval);
  }

  SHAREDQ_LOG_INFO("scheduler stopped", {StringField("worker_id", options_.worker_id)});
}

void Scheduler::SleepWhileIdle(util::Milliseconds delay) {
  while (delay.count() > 0 && !stop_requested_) {
    const auto slice = std::min(delay, kSleepSlice);
    clock_->SleepFor(slice);
    delay -= slice;
  }
}

void Scheduler::RequestStop() {
  stop_requested_ = true;
}

bool Scheduler::ReportProgress(const std::string& task_id, double percentage, const std::string& status) {
  std::lock_guard lock(mutex_);
  if (!current_ || current_->id != task_id || state_ != SchedulerState::kExecuting) return false;

  try {
    current_ = tasks_->UpdateProgress(*current_, percentage, status);
    return true;
  } catch (const util::RaceLost& e) {
    SHAREDQ_LOG_WARN("progress update lost", {StringField("task_id", task_id), StringField("reason", e.what())});
  } catch (const util::StorageIOError& e) {
    SHAREDQ_LOG_WARN("progress update failed", {StringField("task_id", task_id), StringField("error", e.what())});
  }
  return false;
}

std::optional<std::string> Scheduler::current_task_id() const {
  std::lock_guard lock(mutex_);
  if (!current_) return std::nullopt;
  return current_->id;
}

SchedulerStats Scheduler::stats() const {
  std::lock_guard lock(mutex_);
  return stats_;
}

} // namespace sharedq::scheduler
