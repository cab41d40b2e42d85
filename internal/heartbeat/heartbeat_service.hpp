#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace sharedq::lease {
class LockManager;
}

namespace sharedq::heartbeat {

/*
  Keeps the lock markers of the tasks this worker owns fresh.

  One background thread serves every registered task. Each beat rewrites
  the marker's last_heartbeat; a beat that finds the marker gone or owned by
  someone else marks the registration lost and stops beating it. Missed
  beats are the only staleness signal recovery uses.

  The thread never waits on the work it supervises.
*/
class HeartbeatService {
 public:
  HeartbeatService(std::shared_ptr<lease::LockManager> locks, std::shared_ptr<util::Clock> clock,
                   util::Milliseconds tick = util::Milliseconds(100));
  ~HeartbeatService();

  HeartbeatService(const HeartbeatService&)            = delete;
  HeartbeatService& operator=(const HeartbeatService&) = delete;

  // The first beat is due immediately.
  void Start(const std::string& task_id, const std::string& owner_id, util::Milliseconds interval);

  // Idempotent. Returns whether ownership was still held at the last beat.
  bool Stop(const std::string& task_id);

  // One pass over due registrations. Returns the number of beats written.
  std::size_t BeatDue();

  bool     IsActive(const std::string& task_id) const;
  uint64_t BeatCount(const std::string& task_id) const;

  // Background thread lifecycle.
  void Launch();
  void Shutdown();

 private:
  void Loop();

  struct Registration {
    std::string        owner_id;
    util::Milliseconds interval{0};
    util::TimePoint    next_due{};
    bool               lost  = false;
    uint64_t           beats = 0;
  };

  std::shared_ptr<lease::LockManager> locks_;
  std::shared_ptr<util::Clock>        clock_;
  util::Milliseconds                  tick_;

  mutable std::mutex                            mutex_;
  std::condition_variable                       cv_;
  std::unordered_map<std::string, Registration> registrations_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace sharedq::heartbeat
