#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "internal/util/time.hpp"

namespace sharedq::lease {
class LockManager;
}

namespace sharedq::task {
class TaskStore;
}

namespace sharedq::recovery {

struct RecoveryOptions {
  util::Milliseconds lease_duration{0};
  uint32_t           max_retries = 0;
  // Must differ from every worker id so a takeover is never mistaken for
  // the worker's own live claim.
  std::string        recoverer_id;
  util::Milliseconds interval{30000};
};

struct RecoveryReport {
  std::size_t scanned              = 0;
  std::size_t reclaimed            = 0;
  std::size_t failed               = 0;
  std::size_t skipped              = 0;
  std::size_t duplicates_removed   = 0;
  std::size_t orphan_locks_removed = 0;
};

enum class ReclaimResult {
  kReclaimed,  // back to pending
  kFailed,     // retry ceiling exceeded
  kSkipped,    // not running, not stale, or another actor got there first
};

/*
  Returns RUNNING tasks whose owner stopped heartbeating to PENDING, or to
  FAILED once they have been reclaimed more than max_retries times.

  Recovery owns only the RUNNING -> {PENDING, FAILED} edge. Pending and
  terminal descriptors are never mutated, apart from removing the lower
  precedence copy of a transiently duplicated descriptor.

  Every step tolerates a concurrent recoverer: losing a race is a skip.
*/
class RecoveryService {
 public:
  RecoveryService(std::shared_ptr<task::TaskStore> tasks, std::shared_ptr<lease::LockManager> locks, std::shared_ptr<util::Clock> clock,
                  RecoveryOptions options);
  ~RecoveryService();

  RecoveryService(const RecoveryService&)            = delete;
  RecoveryService& operator=(const RecoveryService&) = delete;

  // One full pass: duplicates, stale running tasks, orphaned markers.
  RecoveryReport RecoverOnce();

  // No-op unless the task is running and its marker is absent or stale.
  ReclaimResult Reclaim(const std::string& task_id);

  std::size_t ResolveDuplicates();
  std::size_t SweepOrphanLocks();

  const RecoveryOptions& options() const {
    return options_;
  }

  // Runs RecoverOnce every interval on a background thread.
  void Launch();
  void Shutdown();

 private:
  void Loop();
  ReclaimResult ReclaimLocked(const std::string& task_id);

  std::shared_ptr<task::TaskStore>    tasks_;
  std::shared_ptr<lease::LockManager> locks_;
  std::shared_ptr<util::Clock>        clock_;
  RecoveryOptions                     options_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace sharedq::recovery
