#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/lease/lease.hpp"
#include "internal/storage/shared_store.hpp"
#include "internal/util/time.hpp"
#include "sharedq/task/v1/task.pb.h"

namespace sharedq::lease {

/*
  Advisory per-task mutual exclusion through a marker file

      locks/<task-id>.lock   {owner_id, acquired_at, last_heartbeat}

  whose existence claims ownership. A marker whose last heartbeat is older
  than the lease is stale and may be forcibly taken over; that takeover is
  the one place two workers can briefly both believe they hold a task.

  Every call is a single attempt. Retrying is the caller's policy.
*/
class LockManager {
 public:
  LockManager(std::shared_ptr<storage::SharedStore> store, std::shared_ptr<util::Clock> clock);

  static std::filesystem::path Directory();
  static std::filesystem::path MarkerPath(const std::string& task_id);

  // False (never an error) if a live marker belongs to someone else.
  bool TryAcquire(const std::string& task_id, const std::string& owner_id, util::Milliseconds lease);

  // Removes the marker only if `owner_id` still holds it. Never throws.
  void Release(const std::string& task_id, const std::string& owner_id);

  // Heartbeat write. False if the marker is gone or held by someone else.
  bool Refresh(const std::string& task_id, const std::string& owner_id);

  std::optional<sharedq::task::v1::LockRecord> Read(const std::string& task_id);

  MarkerStatus Inspect(const std::string& task_id, util::Milliseconds lease);

  // Task ids that currently have a visible marker.
  std::vector<std::string> ListMarkers();

  // Removes a marker only if it is stale. Returns whether it was removed.
  bool RemoveIfStale(const std::string& task_id, util::Milliseconds lease);

 private:
  bool IsStale(util::TimePoint last_heartbeat, util::Milliseconds lease) const;
  bool TryCreate(const std::string& task_id, const std::string& owner_id);

  std::shared_ptr<storage::SharedStore> store_;
  std::shared_ptr<util::Clock>          clock_;
};

} // namespace sharedq::lease
