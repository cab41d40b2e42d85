#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <google/protobuf/struct.pb.h>

#include "internal/model/task.hpp"
#include "internal/model/task_state.hpp"
#include "internal/storage/shared_store.hpp"
#include "internal/util/time.hpp"

namespace sharedq::task {

struct TaskCounts {
  std::size_t pending = 0;
  std::size_t running = 0;
  std::size_t done    = 0;
  std::size_t failed  = 0;

  std::size_t total() const {
    return pending + running + done + failed;
  }
};

// Exactly one of the two is meaningful, depending on the terminal state.
struct TerminalOutcome {
  google::protobuf::Struct result;
  std::string              error;
};

/*
  Maps task identity and state to descriptor paths

      tasks/<task-id>.<todo|running|done|failed>

  and (de)serializes descriptors. A state change is a rename; the body is
  rewritten in place only while the descriptor still sits under the
  expected suffix. RaceLost from any call means another actor moved the
  descriptor first: skip the task and move on.
*/
class TaskStore {
 public:
  TaskStore(std::shared_ptr<storage::SharedStore> store, std::shared_ptr<util::Clock> clock, std::string worker_id);

  static std::filesystem::path Directory();
  static std::filesystem::path DescriptorPath(const std::string& id, model::TaskState state);

  // Creates tasks/ and locks/. Fatal at startup if the store is unusable.
  void Initialize();

  // Writes a PENDING descriptor. util::Conflict if `id` is already in use;
  // std::invalid_argument for a bad id or a non-finite number in `payload`.
  model::Task Create(const google::protobuf::Struct& payload, int32_t priority = 0, const std::string& id = {});

  // Malformed descriptors are logged, skipped and reported through
  // `malformed` (ids); never deleted.
  std::vector<model::Task> List(model::TaskState state, std::vector<std::string>* malformed = nullptr);
  std::vector<std::string> ListIds(model::TaskState state);

  // Most advanced copy if the descriptor is transiently duplicated.
  std::optional<model::Task> Get(const std::string& id);

  // Re-reads the descriptor under the state it was observed in.
  model::Task Reload(const model::Task& task);

  model::Task Transition(const model::Task& task, model::TaskState from, model::TaskState to);

  void Rewrite(const model::Task& task);

  /*
    Writes the full final body into the running descriptor, then renames it
    to the terminal suffix. The terminal file is therefore complete the
    instant it becomes visible.
  */
  model::Task WriteTerminal(const model::Task& task, model::TaskState state, const TerminalOutcome& outcome);

  model::Task UpdateProgress(const model::Task& task, double percentage, const std::string& status);

  TaskCounts Count();

  std::vector<model::Task> ListOwnedBy(const std::string& owner);

  bool Exists(const std::string& id, model::TaskState state);

  // Drops one copy of a duplicated descriptor.
  bool RemoveCopy(const std::string& id, model::TaskState state);

  const std::string& worker_id() const {
    return worker_id_;
  }

 private:
  model::Task Load(const std::string& id, model::TaskState state);

  std::shared_ptr<storage::SharedStore> store_;
  std::shared_ptr<util::Clock>          clock_;
  std::string                           worker_id_;
};

} // namespace sharedq::task
