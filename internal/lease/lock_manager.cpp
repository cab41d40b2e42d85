#include "lock_manager.hpp"

#include <string_view>

#include "internal/model/codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sharedq::lease {

using observability::IntField;
using observability::StringField;
using sharedq::task::v1::LockRecord;

namespace {

constexpr const char* kMarkerSuffix = ".lock";

} // namespace

LockManager::LockManager(std::shared_ptr<storage::SharedStore> store, std::shared_ptr<util::Clock> clock)
    : store_(std::move(store)), clock_(std::move(clock)) {
}

std::filesystem::path LockManager::Directory() {
  return "locks";
}

std::filesystem::path LockManager::MarkerPath(const std::string& task_id) {
  return Directory() / (task_id + kMarkerSuffix);
}

std::vector<std::string> LockManager::ListMarkers() {
  std::vector<std::string> ids;
  for (const auto& name : store_->List(Directory(), kMarkerSuffix)) {
    ids.push_back(name.substr(0, name.size() - std::string_view(kMarkerSuffix).size()));
  }
  return ids;
}

bool LockManager::IsStale(util::TimePoint last_heartbeat, util::Milliseconds lease) const {
  return clock_->Now() - last_heartbeat > lease;
}

bool LockManager::TryCreate(const std::string& task_id, const std::string& owner_id) {
  const auto now = util::ToProto(clock_->Now());

  LockRecord record;
  record.set_task_id(task_id);
  record.set_owner_id(owner_id);
  *record.mutable_acquired_at()    = now;
  *record.mutable_last_heartbeat() = now;

  try {
    store_->WriteAtomic(MarkerPath(task_id), model::EncodeLock(record), storage::WriteMode::kCreate);
    return true;
  } catch (const util::Conflict&) {
    return false;
  }
}

bool LockManager::TryAcquire(const std::string& task_id, const std::string& owner_id, util::Milliseconds lease) {
  if (TryCreate(task_id, owner_id)) return true;

  const auto status = Inspect(task_id, lease);
  switch (status.state) {
    case MarkerState::kAbsent:
      // released between the two calls
      return TryCreate(task_id, owner_id);
    case MarkerState::kLive:
      return status.owner() == owner_id && Refresh(task_id, owner_id);
    case MarkerState::kStale:
      break;
  }

  SHAREDQ_LOG_WARN("taking over stale lock",
                   {StringField("task_id", task_id), StringField("previous_owner", status.owner()), StringField("owner", owner_id),
                    IntField("age_ms", std::chrono::duration_cast<util::Milliseconds>(clock_->Now() - status.last_heartbeat).count())});

  const auto now = util::ToProto(clock_->Now());

  LockRecord record;
  record.set_task_id(task_id);
  record.set_owner_id(owner_id);
  *record.mutable_acquired_at()    = now;
  *record.mutable_last_heartbeat() = now;

  try {
    store_->WriteAtomic(MarkerPath(task_id), model::EncodeLock(record), storage::WriteMode::kReplace);
  } catch (const util::NotFound&) {
    return TryCreate(task_id, owner_id);
  }

  // A concurrent claimant may have overwritten us; the read-back decides.
  try {
    const auto current = Read(task_id);
    return current && current->owner_id() == owner_id;
  } catch (const util::MalformedDescriptor&) {
    return false;
  }
}

void LockManager::Release(const std::string& task_id, const std::string& owner_id) {
  try {
    const auto record = Read(task_id);
    if (!record) return;

    if (record->owner_id() != owner_id) {
      SHAREDQ_LOG_DEBUG("lock held by another owner, not releasing",
                        {StringField("task_id", task_id), StringField("owner", owner_id), StringField("holder", record->owner_id())});
      return;
    }

    store_->Remove(MarkerPath(task_id));
  } catch (const util::MalformedDescriptor& e) {
    SHAREDQ_LOG_WARN("unreadable lock marker, not releasing", {StringField("task_id", task_id), StringField("error", e.what())});
  } catch (const util::StorageIOError& e) {
    SHAREDQ_LOG_WARN("lock release failed, marker left for recovery", {StringField("task_id", task_id), StringField("error", e.what())});
  }
}

bool LockManager::Refresh(const std::string& task_id, const std::string& owner_id) {
  std::optional<LockRecord> record;
  try {
    record = Read(task_id);
  } catch (const util::MalformedDescriptor&) {
    return false;
  }
  if (!record || record->owner_id() != owner_id) return false;

  *record->mutable_last_heartbeat() = util::ToProto(clock_->Now());

  try {
    store_->WriteAtomic(MarkerPath(task_id), model::EncodeLock(*record), storage::WriteMode::kReplace);
  } catch (const util::NotFound&) {
    return false;
  }
  return true;
}

std::optional<LockRecord> LockManager::Read(const std::string& task_id) {
  const auto  path = MarkerPath(task_id);
  std::string bytes;
  try {
    bytes = store_->Read(path);
  } catch (const util::NotFound&) {
    return std::nullopt;
  }
  return model::DecodeLock(bytes, path.string());
}

MarkerStatus LockManager::Inspect(const std::string& task_id, util::Milliseconds lease) {
  const auto   path = MarkerPath(task_id);
  MarkerStatus status;

  try {
    try {
      auto record = Read(task_id);
      if (!record) return status;

      if (record->has_last_heartbeat()) {
        status.last_heartbeat = util::FromProto(record->last_heartbeat());
      } else if (record->has_acquired_at()) {
        status.last_heartbeat = util::FromProto(record->acquired_at());
      } else {
        status.last_heartbeat = store_->ModifiedAt(path);
      }
      status.record = std::move(record);
    } catch (const util::MalformedDescriptor& e) {
      SHAREDQ_LOG_WARN("unreadable lock marker, judging by modification time", {StringField("task_id", task_id), StringField("error", e.what())});
      status.last_heartbeat = store_->ModifiedAt(path);
    }
  } catch (const util::NotFound&) {
    return MarkerStatus{};
  }

  status.state = IsStale(status.last_heartbeat, lease) ? MarkerState::kStale : MarkerState::kLive;
  return status;
}

bool LockManager::RemoveIfStale(const std::string& task_id, util::Milliseconds lease) {
  const auto status = Inspect(task_id, lease);
  if (status.state != MarkerState::kStale) return false;
  return store_->Remove(MarkerPath(task_id));
}

} // namespace sharedq::lease
