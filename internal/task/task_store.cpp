#include "task_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/lease/lock_manager.hpp"
#include "internal/model/codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"

namespace sharedq::task {

using model::Task;
using model::TaskState;
using observability::StringField;

namespace {

std::string StateLabel(TaskState state) {
  return std::string(model::StateName(state));
}

} // namespace

TaskStore::TaskStore(std::shared_ptr<storage::SharedStore> store, std::shared_ptr<util::Clock> clock, std::string worker_id)
    : store_(std::move(store)), clock_(std::move(clock)), worker_id_(std::move(worker_id)) {
}

std::filesystem::path TaskStore::Directory() {
  return "tasks";
}

std::filesystem::path TaskStore::DescriptorPath(const std::string& id, TaskState state) {
  util::ValidateId(id);
  return Directory() / (id + "." + std::string(model::Suffix(state)));
}

void TaskStore::Initialize() {
  store_->EnsureDirectory(Directory());
  store_->EnsureDirectory(lease::LockManager::Directory());
}

Task TaskStore::Load(const std::string& id, TaskState state) {
  const auto path = DescriptorPath(id, state);

  Task task;
  task.id         = id;
  task.state      = state;
  task.descriptor = model::DecodeTask(store_->Read(path), path.string());

  if (task.descriptor.id().empty()) {
    task.descriptor.set_id(id);
  } else if (task.descriptor.id() != id) {
    throw util::MalformedDescriptor(path.string() + ": body id '" + task.descriptor.id() + "' does not match file name");
  }
  return task;
}

Task TaskStore::Create(const google::protobuf::Struct& payload, int32_t priority, const std::string& id) {
  const auto now     = clock_->Now();
  const auto task_id = id.empty() ? util::GenerateTaskId(now) : id;
  util::ValidateId(task_id);
  if (model::ContainsNonFiniteNumber(payload)) {
    throw std::invalid_argument("payload contains a non-finite number");
  }

  if (!id.empty() && Get(task_id)) {
    throw util::Conflict("task id already in use: " + task_id);
  }

  Task task;
  task.id    = task_id;
  task.state = TaskState::kPending;

  auto& descriptor = task.descriptor;
  descriptor.set_id(task_id);
  *descriptor.mutable_payload() = payload;
  descriptor.set_priority(priority);
  descriptor.set_retry_count(0);
  *descriptor.mutable_created_at() = util::ToProto(now);
  descriptor.set_created_by(worker_id_);

  store_->WriteAtomic(DescriptorPath(task_id, TaskState::kPending), model::EncodeTask(descriptor), storage::WriteMode::kCreate);

  SHAREDQ_LOG_INFO("task created", {StringField("task_id", task_id)});
  return task;
}

std::vector<std::string> TaskStore::ListIds(TaskState state) {
  const auto suffix = "." + std::string(model::Suffix(state));

  std::vector<std::string> ids;
  for (const auto& name : store_->List(Directory(), suffix)) {
    ids.push_back(name.substr(0, name.size() - suffix.size()));
  }
  return ids;
}

std::vector<Task> TaskStore::List(TaskState state, std::vector<std::string>* malformed) {
  std::vector<Task> tasks;

  for (const auto& id : ListIds(state)) {
    try {
      tasks.push_back(Load(id, state));
    } catch (const util::NotFound&) {
      // moved between listing and reading
      continue;
    } catch (const util::MalformedDescriptor& e) {
      SHAREDQ_LOG_WARN("skipping malformed task descriptor", {StringField("task_id", id), StringField("state", StateLabel(state)), StringField("error", e.what())});
      if (malformed) malformed->push_back(id);
    } catch (const std::invalid_argument& e) {
      SHAREDQ_LOG_WARN("skipping descriptor with invalid name", {StringField("task_id", id), StringField("error", e.what())});
      if (malformed) malformed->push_back(id);
    }
  }
  return tasks;
}

std::optional<Task> TaskStore::Get(const std::string& id) {
  static constexpr TaskState kProbeOrder[] = {TaskState::kDone, TaskState::kFailed, TaskState::kRunning, TaskState::kPending};

  for (auto state : kProbeOrder) {
    try {
      return Load(id, state);
    } catch (const util::NotFound&) {
      continue;
    }
  }
  return std::nullopt;
}

Task TaskStore::Reload(const Task& task) {
  try {
    return Load(task.id, task.state);
  } catch (const util::NotFound&) {
    throw util::RaceLost("task " + task.id + " is no longer " + StateLabel(task.state));
  }
}

Task TaskStore::Transition(const Task& task, TaskState from, TaskState to) {
  if (!model::CanTransition(from, to)) {
    throw util::InvalidState("illegal transition " + StateLabel(from) + " -> " + StateLabel(to) + " for task " + task.id);
  }

  try {
    store_->RenameAtomic(DescriptorPath(task.id, from), DescriptorPath(task.id, to));
  } catch (const util::NotFound&) {
    throw util::RaceLost("task " + task.id + " is no longer " + StateLabel(from));
  }

  SHAREDQ_LOG_DEBUG("task transitioned", {StringField("task_id", task.id), StringField("from", StateLabel(from)), StringField("to", StateLabel(to))});

  Task moved  = task;
  moved.state = to;
  return moved;
}

void TaskStore::Rewrite(const Task& task) {
  try {
    store_->WriteAtomic(DescriptorPath(task.id, task.state), model::EncodeTask(task.descriptor), storage::WriteMode::kReplace);
  } catch (const util::NotFound&) {
    throw util::RaceLost("task " + task.id + " is no longer " + StateLabel(task.state));
  }
}

Task TaskStore::WriteTerminal(const Task& task, TaskState state, const TerminalOutcome& outcome) {
  if (!model::IsTerminal(state)) {
    throw util::InvalidState("not a terminal state: " + StateLabel(state));
  }
  if (task.state != TaskState::kRunning) {
    throw util::InvalidState("task " + task.id + " is " + StateLabel(task.state) + ", not running");
  }

  const auto now = clock_->Now();

  Task final_task = task;
  auto& descriptor = final_task.descriptor;
  if (state == TaskState::kDone) {
    *descriptor.mutable_result() = outcome.result;
  } else {
    descriptor.set_error(outcome.error.empty() ? "unknown error" : outcome.error);
  }

  *descriptor.mutable_completed_at() = util::ToProto(now);
  descriptor.set_completed_by(worker_id_);
  if (descriptor.has_started_at()) {
    descriptor.set_duration_seconds(util::SecondsBetween(util::FromProto(descriptor.started_at()), now));
  }
  descriptor.clear_owner();
  descriptor.clear_heartbeat_at();

  Rewrite(final_task);
  final_task = Transition(final_task, TaskState::kRunning, state);

  SHAREDQ_LOG_INFO("task finished", {StringField("task_id", task.id), StringField("state", StateLabel(state))});
  return final_task;
}

Task TaskStore::UpdateProgress(const Task& task, double percentage, const std::string& status) {
  if (task.state != TaskState::kRunning) {
    throw util::InvalidState("task " + task.id + " is not running");
  }

  Task updated   = task;
  auto* progress = updated.descriptor.mutable_progress();
  progress->set_percentage(std::clamp(percentage, 0.0, 100.0));
  if (!status.empty()) progress->set_status(status);
  *progress->mutable_updated_at() = util::ToProto(clock_->Now());

  Rewrite(updated);
  return updated;
}

TaskCounts TaskStore::Count() {
  TaskCounts counts;
  counts.pending = ListIds(TaskState::kPending).size();
  counts.running = ListIds(TaskState::kRunning).size();
  counts.done    = ListIds(TaskState::kDone).size();
  counts.failed  = ListIds(TaskState::kFailed).size();
  return counts;
}

std::vector<Task> TaskStore::ListOwnedBy(const std::string& owner) {
  auto running = List(TaskState::kRunning);
  running.erase(std::remove_if(running.begin(), running.end(), [&](const Task& task) { return task.descriptor.owner() != owner; }), running.end());
  return running;
}

bool TaskStore::Exists(const std::string& id, TaskState state) {
  return store_->Exists(DescriptorPath(id, state));
}

bool TaskStore::RemoveCopy(const std::string& id, TaskState state) {
  return store_->Remove(DescriptorPath(id, state));
}

} // namespace sharedq::task
