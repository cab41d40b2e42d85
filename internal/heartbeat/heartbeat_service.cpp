#include "heartbeat_service.hpp"

#include <vector>

#include "internal/lease/lock_manager.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace sharedq::heartbeat {

using observability::StringField;

HeartbeatService::HeartbeatService(std::shared_ptr<lease::LockManager> locks, std::shared_ptr<util::Clock> clock, util::Milliseconds tick)
    : locks_(std::move(locks)), clock_(std::move(clock)), tick_(tick) {
}

HeartbeatService::~HeartbeatService() {
  Shutdown();
}

void HeartbeatService::Start(const std::string& task_id, const std::string& owner_id, util::Milliseconds interval) {
  {
    std::lock_guard lock(mutex_);
    Registration registration;
    registration.owner_id    = owner_id;
    registration.interval    = interval;
    registration.next_due    = clock_->Now();
    registrations_[task_id]  = registration;
  }
  cv_.notify_all();
}

bool HeartbeatService::Stop(const std::string& task_id) {
  std::lock_guard lock(mutex_);
  auto            it = registrations_.find(task_id);
  if (it == registrations_.end()) return false;

  const bool held = !it->second.lost;
  registrations_.erase(it);
  return held;
}

std::size_t HeartbeatService::BeatDue() {
  struct Due {
    std::string task_id;
    std::string owner_id;
  };

  std::vector<Due> due;
  {
    std::lock_guard lock(mutex_);
    const auto      now = clock_->Now();
    for (const auto& [task_id, registration] : registrations_) {
      if (!registration.lost && registration.next_due <= now) {
        due.push_back({task_id, registration.owner_id});
      }
    }
  }

  std::size_t written = 0;
  for (const auto& item : due) {
    bool held = false;
    try {
      held = locks_->Refresh(item.task_id, item.owner_id);
    } catch (const util::StorageIOError& e) {
      // stays due; retried on the next pass
      SHAREDQ_LOG_WARN("heartbeat write failed", {StringField("task_id", item.task_id), StringField("error", e.what())});
      continue;
    }

    std::lock_guard lock(mutex_);
    auto            it = registrations_.find(item.task_id);
    if (it == registrations_.end() || it->second.owner_id != item.owner_id) continue;

    if (!held) {
      it->second.lost = true;
      SHAREDQ_LOG_WARN("lost ownership of task, heartbeat stopped", {StringField("task_id", item.task_id), StringField("owner", item.owner_id)});
      continue;
    }

    ++it->second.beats;
    it->second.next_due = clock_->Now() + it->second.interval;
    ++written;
  }
  return written;
}

bool HeartbeatService::IsActive(const std::string& task_id) const {
  std::lock_guard lock(mutex_);
  auto            it = registrations_.find(task_id);
  return it != registrations_.end() && !it->second.lost;
}

uint64_t HeartbeatService::BeatCount(const std::string& task_id) const {
  std::lock_guard lock(mutex_);
  auto            it = registrations_.find(task_id);
  return it == registrations_.end() ? 0 : it->second.beats;
}

void HeartbeatService::Launch() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&HeartbeatService::Loop, this);
}

void HeartbeatService::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void HeartbeatService::Loop() {
  while (running_) {
    BeatDue();

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, tick_, [this] { return !running_; });
  }
}

} // namespace sharedq::heartbeat
