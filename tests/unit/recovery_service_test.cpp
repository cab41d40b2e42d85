#include "internal/recovery/recovery_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/lease/lock_manager.hpp"
#include "internal/storage/ram/memory_store.hpp"
#include "internal/task/task_store.hpp"
#include "internal/util/yaml_proto.hpp"

namespace {

using namespace std::chrono_literals;

using sharedq::lease::LockManager;
using sharedq::model::Task;
using sharedq::model::TaskState;
using sharedq::recovery::ReclaimResult;
using sharedq::recovery::RecoveryOptions;
using sharedq::recovery::RecoveryService;
using sharedq::storage::MemoryStore;
using sharedq::task::TaskStore;
using sharedq::util::ManualClock;

constexpr auto kLease = std::chrono::milliseconds(30s);

struct Fixture {
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
  std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>(clock);
  std::shared_ptr<LockManager> locks = std::make_shared<LockManager>(store, clock);
  std::shared_ptr<TaskStore>   tasks = std::make_shared<TaskStore>(store, clock, "worker-r");
  std::unique_ptr<RecoveryService> recovery;

  explicit Fixture(uint32_t max_retries = 3) {
    tasks->Initialize();

    RecoveryOptions options;
    options.lease_duration = kLease;
    options.max_retries    = max_retries;
    options.recoverer_id   = "worker-r-recovery";
    recovery               = std::make_unique<RecoveryService>(tasks, locks, clock, options);
  }

  // Claims the task the way a worker does, then "dies".
  Task ClaimAndAbandon(const Task& pending, const std::string& worker) {
    assert(locks->TryAcquire(pending.id, worker, kLease));
    auto running = tasks->Transition(pending, TaskState::kPending, TaskState::kRunning);
    running.descriptor.set_owner(worker);
    *running.descriptor.mutable_heartbeat_at() = sharedq::util::ToProto(clock->Now());
    tasks->Rewrite(running);
    return running;
  }
};

void TestLiveTaskIsLeftAlone() {
  Fixture f;
  auto    running = f.ClaimAndAbandon(f.tasks->Create(sharedq::util::ParseStruct("{}")), "worker-a");

  f.clock->Advance(kLease);
  const auto report = f.recovery->RecoverOnce();
  assert(report.scanned == 1);
  assert(report.reclaimed == 0);
  assert(report.skipped == 1);
  assert(f.tasks->Get(running.id)->state == TaskState::kRunning);
  assert(f.locks->Read(running.id)->owner_id() == "worker-a");
}

void TestStaleTaskIsReclaimedOnce() {
  Fixture f;
  auto    running = f.ClaimAndAbandon(f.tasks->Create(sharedq::util::ParseStruct(R"({"n": 5})")), "worker-a");

  f.clock->Advance(kLease + 1s);
  const auto report = f.recovery->RecoverOnce();
  assert(report.reclaimed == 1);

  auto task = f.tasks->Get(running.id);
  assert(task->state == TaskState::kPending);
  assert(task->descriptor.retry_count() == 1);
  assert(task->descriptor.owner().empty());
  assert(!task->descriptor.has_heartbeat_at());
  assert(task->descriptor.failure_reason() == "stale task recovery");
  assert(task->descriptor.recovered_by() == "worker-r-recovery");
  assert(task->descriptor.payload().fields().at("n").number_value() == 5);

  // the marker was released with the reclaim
  assert(!f.locks->Read(running.id).has_value());

  // reclaiming again is a no-op
  assert(f.recovery->Reclaim(running.id) == ReclaimResult::kSkipped);
  assert(f.recovery->RecoverOnce().reclaimed == 0);
  assert(f.tasks->Get(running.id)->descriptor.retry_count() == 1);
  assert(!f.locks->Read(running.id).has_value());
}

void TestRunningTaskWithoutMarkerIsReclaimed() {
  Fixture f;
  auto    running = f.ClaimAndAbandon(f.tasks->Create(sharedq::util::ParseStruct("{}")), "worker-a");
  f.locks->Release(running.id, "worker-a");

  assert(f.recovery->Reclaim(running.id) == ReclaimResult::kReclaimed);
  assert(f.tasks->Get(running.id)->state == TaskState::kPending);
}

void TestRetryCeilingFailsTask() {
  const uint32_t kMaxRetries = 2;
  Fixture        f(kMaxRetries);

  auto task = f.tasks->Create(sharedq::util::ParseStruct("{}"));
  for (uint32_t attempt = 1; attempt <= kMaxRetries + 1; ++attempt) {
    auto pending = *f.tasks->Get(task.id);
    assert(pending.state == TaskState::kPending);

    f.ClaimAndAbandon(pending, "worker-" + std::to_string(attempt));
    f.clock->Advance(kLease + 1s);
    const auto result = f.recovery->Reclaim(task.id);
    assert(result == (attempt <= kMaxRetries ? ReclaimResult::kReclaimed : ReclaimResult::kFailed));
  }

  auto failed = f.tasks->Get(task.id);
  assert(failed->state == TaskState::kFailed);
  assert(failed->descriptor.retry_count() == kMaxRetries + 1);
  assert(failed->descriptor.error() == "exhausted retries (3 > 2)");
  assert(f.tasks->Count().total() == 1);

  // terminal tasks are never touched again
  f.clock->Advance(kLease * 10);
  assert(f.recovery->Reclaim(task.id) == ReclaimResult::kSkipped);
  assert(f.tasks->Get(task.id)->state == TaskState::kFailed);
}

void TestPendingAndTerminalTasksAreIgnored() {
  Fixture f;
  auto    pending = f.tasks->Create(sharedq::util::ParseStruct("{}"));

  assert(f.recovery->Reclaim(pending.id) == ReclaimResult::kSkipped);
  assert(f.recovery->Reclaim(pending.id) == ReclaimResult::kSkipped);
  assert(f.tasks->Get(pending.id)->state == TaskState::kPending);
  assert(f.tasks->Get(pending.id)->descriptor.retry_count() == 0);
  assert(!f.locks->Read(pending.id).has_value());
}

void TestDuplicateDescriptorsResolvedByPrecedence() {
  Fixture f;

  // a rename that propagated as a copy
  auto       running = f.ClaimAndAbandon(f.tasks->Create(sharedq::util::ParseStruct("{}"), 0, "dup-1"), "worker-a");
  const auto body    = f.store->Read(TaskStore::DescriptorPath("dup-1", TaskState::kRunning));
  f.store->Put(TaskStore::DescriptorPath("dup-1", TaskState::kPending), body);

  // done beats todo
  f.store->Put(TaskStore::DescriptorPath("dup-2", TaskState::kDone), R"({"id": "dup-2"})");
  f.store->Put(TaskStore::DescriptorPath("dup-2", TaskState::kPending), R"({"id": "dup-2"})");

  assert(f.recovery->ResolveDuplicates() == 2);
  assert(f.store->Exists(TaskStore::DescriptorPath("dup-1", TaskState::kRunning)));
  assert(!f.store->Exists(TaskStore::DescriptorPath("dup-1", TaskState::kPending)));
  assert(f.store->Exists(TaskStore::DescriptorPath("dup-2", TaskState::kDone)));
  assert(!f.store->Exists(TaskStore::DescriptorPath("dup-2", TaskState::kPending)));

  // a live running copy survives next to a terminal one
  f.store->Put(TaskStore::DescriptorPath("dup-1", TaskState::kDone), body);
  assert(f.recovery->ResolveDuplicates() == 0);
  assert(f.store->Exists(TaskStore::DescriptorPath("dup-1", TaskState::kRunning)));

  f.clock->Advance(kLease + 1s);
  assert(f.recovery->ResolveDuplicates() == 1);
  assert(!f.store->Exists(TaskStore::DescriptorPath("dup-1", TaskState::kRunning)));
  (void)running;
}

void TestOrphanedMarkersSwept() {
  Fixture f;
  auto    unclaimed = f.tasks->Create(sharedq::util::ParseStruct("{}"));
  assert(f.locks->TryAcquire(unclaimed.id, "worker-a", kLease));
  auto live = f.ClaimAndAbandon(f.tasks->Create(sharedq::util::ParseStruct("{}")), "worker-b");

  assert(f.recovery->SweepOrphanLocks() == 0);

  f.clock->Advance(kLease + 1s);
  assert(f.locks->Refresh(live.id, "worker-b"));
  assert(f.recovery->SweepOrphanLocks() == 1);
  assert(!f.locks->Read(unclaimed.id).has_value());
  assert(f.locks->Read(live.id).has_value());
}

} // namespace

int main() {
  TestLiveTaskIsLeftAlone();
  TestStaleTaskIsReclaimedOnce();
  TestRunningTaskWithoutMarkerIsReclaimed();
  TestRetryCeilingFailsTask();
  TestPendingAndTerminalTasksAreIgnored();
  TestDuplicateDescriptorsResolvedByPrecedence();
  TestOrphanedMarkersSwept();

  std::cout << "sharedq_unit_recovery_service: pass\n";
  return 0;
}
