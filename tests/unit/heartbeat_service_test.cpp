#include "internal/heartbeat/heartbeat_service.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <thread>

#include "internal/lease/lock_manager.hpp"
#include "internal/storage/ram/memory_store.hpp"

namespace {

using namespace std::chrono_literals;

using sharedq::heartbeat::HeartbeatService;
using sharedq::lease::LockManager;
using sharedq::lease::MarkerState;
using sharedq::storage::MemoryStore;
using sharedq::util::ManualClock;

constexpr auto kLease    = std::chrono::milliseconds(30s);
constexpr auto kInterval = std::chrono::milliseconds(10s);

struct Fixture {
  std::shared_ptr<ManualClock> clock = std::make_shared<ManualClock>();
  std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>(clock);
  std::shared_ptr<LockManager> locks = std::make_shared<LockManager>(store, clock);
  HeartbeatService             heartbeat{locks, clock};
};

void TestBeatsKeepMarkerLivePastTheLease() {
  Fixture f;
  assert(f.locks->TryAcquire("task-1", "worker-a", kLease));

  f.heartbeat.Start("task-1", "worker-a", kInterval);
  assert(f.heartbeat.IsActive("task-1"));
  assert(f.heartbeat.BeatDue() == 1);

  // not due again until the interval passes
  assert(f.heartbeat.BeatDue() == 0);

  for (int i = 0; i < 10; ++i) {
    f.clock->Advance(kInterval);
    assert(f.heartbeat.BeatDue() == 1);
  }
  assert(f.heartbeat.BeatCount("task-1") == 11);
  assert(f.locks->Inspect("task-1", kLease).state == MarkerState::kLive);

  assert(f.heartbeat.Stop("task-1"));
  assert(!f.heartbeat.IsActive("task-1"));
}

void TestStoppedTaskGoesStale() {
  Fixture f;
  assert(f.locks->TryAcquire("task-1", "worker-a", kLease));

  f.heartbeat.Start("task-1", "worker-a", kInterval);
  f.heartbeat.BeatDue();
  f.heartbeat.Stop("task-1");

  // stop is idempotent
  assert(!f.heartbeat.Stop("task-1"));

  f.clock->Advance(kLease + 1s);
  assert(f.heartbeat.BeatDue() == 0);
  assert(f.locks->Inspect("task-1", kLease).state == MarkerState::kStale);
}

void TestLostMarkerStopsBeating() {
  Fixture f;
  assert(f.locks->TryAcquire("task-1", "worker-a", kLease));
  f.heartbeat.Start("task-1", "worker-a", kInterval);
  f.heartbeat.BeatDue();

  // another worker took the marker over
  f.clock->Advance(kLease + 1s);
  assert(f.locks->TryAcquire("task-1", "worker-b", kLease));

  f.clock->Advance(kInterval);
  assert(f.heartbeat.BeatDue() == 0);
  assert(!f.heartbeat.IsActive("task-1"));
  assert(f.locks->Read("task-1")->owner_id() == "worker-b");

  // the lost registration reports that ownership was not held
  assert(!f.heartbeat.Stop("task-1"));
}

void TestStorageFailureIsRetriedNextPass() {
  Fixture f;
  assert(f.locks->TryAcquire("task-1", "worker-a", kLease));
  f.heartbeat.Start("task-1", "worker-a", kInterval);

  f.store->FailNextRenames(100);
  assert(f.heartbeat.BeatDue() == 0);
  assert(f.heartbeat.IsActive("task-1"));

  f.store->FailNextRenames(0);
  assert(f.heartbeat.BeatDue() == 1);
}

void TestBackgroundThreadBeatsIndependently() {
  auto clock = std::make_shared<sharedq::util::RealClock>();
  auto store = std::make_shared<MemoryStore>(clock);
  auto locks = std::make_shared<LockManager>(store, clock);

  HeartbeatService heartbeat(locks, clock, 5ms);
  assert(locks->TryAcquire("task-1", "worker-a", kLease));

  heartbeat.Launch();
  heartbeat.Start("task-1", "worker-a", 10ms);

  // the test thread is busy elsewhere; beats still happen
  const auto deadline = std::chrono::steady_clock::now() + 5s;
  while (heartbeat.BeatCount("task-1") < 3 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(5ms);
  }
  assert(heartbeat.BeatCount("task-1") >= 3);

  assert(heartbeat.Stop("task-1"));
  heartbeat.Shutdown();
}

} // namespace

int main() {
  TestBeatsKeepMarkerLivePastTheLease();
  TestStoppedTaskGoesStale();
  TestLostMarkerStopsBeating();
  TestStorageFailureIsRetriedNextPass();
  TestBackgroundThreadBeatsIndependently();

  std::cout << "sharedq_unit_heartbeat_service: pass\n";
  return 0;
}
