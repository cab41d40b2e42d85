#include "internal/storage/disk/local_fs_store.hpp"
#include "internal/storage/ram/memory_store.hpp"

#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/id.hpp"
#include "internal/util/time.hpp"

namespace {

using sharedq::storage::LocalFsStore;
using sharedq::storage::MemoryStore;
using sharedq::storage::SharedStore;
using sharedq::storage::StoreOptions;
using sharedq::storage::WriteMode;

std::filesystem::path MakeRoot(const std::string& test_name) {
  const auto root = std::filesystem::temp_directory_path() / "sharedq_shared_store_tests" / (test_name + "-" + sharedq::util::RandomHex(4));
  std::filesystem::remove_all(root);
  return root;
}

// Contract checks shared by both implementations.
void ExerciseContract(SharedStore& store) {
  store.EnsureDirectory("tasks");

  store.WriteAtomic("tasks/a.todo", "first");
  assert(store.Read("tasks/a.todo") == "first");

  store.WriteAtomic("tasks/a.todo", "second");
  assert(store.Read("tasks/a.todo") == "second");

  bool conflict = false;
  try {
    store.WriteAtomic("tasks/a.todo", "third", WriteMode::kCreate);
  } catch (const sharedq::util::Conflict&) {
    conflict = true;
  }
  assert(conflict);
  assert(store.Read("tasks/a.todo") == "second");

  bool not_found = false;
  try {
    store.WriteAtomic("tasks/missing.todo", "x", WriteMode::kReplace);
  } catch (const sharedq::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
  assert(!store.Exists("tasks/missing.todo"));

  store.RenameAtomic("tasks/a.todo", "tasks/a.running");
  assert(!store.Exists("tasks/a.todo"));
  assert(store.Read("tasks/a.running") == "second");

  not_found = false;
  try {
    store.RenameAtomic("tasks/a.todo", "tasks/a.running");
  } catch (const sharedq::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  store.WriteAtomic("tasks/b.todo", "b", WriteMode::kCreate);
  conflict = false;
  try {
    store.RenameAtomic("tasks/b.todo", "tasks/a.running");
  } catch (const sharedq::util::Conflict&) {
    conflict = true;
  }
  assert(conflict);
  assert(store.Read("tasks/a.running") == "second");
  assert(store.Exists("tasks/b.todo"));

  const auto todo = store.List("tasks", ".todo");
  assert(todo.size() == 1 && todo[0] == "b.todo");
  assert(store.List("nowhere", ".todo").empty());

  assert(store.Remove("tasks/b.todo"));
  assert(!store.Remove("tasks/b.todo"));
}

void TestLocalFsContract() {
  const auto   root = MakeRoot("contract");
  LocalFsStore store(root);
  ExerciseContract(store);

  // atomic writes leave no temp files behind
  for (const auto& entry : std::filesystem::directory_iterator(root / "tasks")) {
    assert(entry.path().filename().string().front() != '.');
  }
  std::filesystem::remove_all(root);
}

void TestMemoryContract() {
  MemoryStore store(std::make_shared<sharedq::util::ManualClock>());
  ExerciseContract(store);
}

void TestLocalFsListSkipsHiddenEntries() {
  const auto   root = MakeRoot("hidden");
  LocalFsStore store(root);
  store.EnsureDirectory("tasks");

  std::ofstream(root / "tasks" / ".task-1.todo.deadbeef.tmp") << "partial";
  store.WriteAtomic("tasks/task-2.todo", "{}");
  store.WriteAtomic("tasks/task-1.todo", "{}");

  const auto names = store.List("tasks", ".todo");
  assert(names.size() == 2);
  assert(names[0] == "task-1.todo");
  assert(names[1] == "task-2.todo");
  std::filesystem::remove_all(root);
}

void TestLocalFsCleanupRemovesOnlyOldTempFiles() {
  const auto   root = MakeRoot("cleanup");
  LocalFsStore store(root);
  store.EnsureDirectory("tasks");

  const auto old_temp   = root / "tasks" / ".task-1.todo.0badf00d.tmp";
  const auto fresh_temp = root / "tasks" / ".task-2.todo.0badf00d.tmp";
  std::ofstream(old_temp) << "old";
  std::ofstream(fresh_temp) << "fresh";
  store.WriteAtomic("tasks/task-3.todo", "{}");

  std::filesystem::last_write_time(old_temp, std::filesystem::last_write_time(old_temp) - std::chrono::hours(2));

  assert(store.CleanupTempFiles("tasks", std::chrono::hours(1)) == 1);
  assert(!std::filesystem::exists(old_temp));
  assert(std::filesystem::exists(fresh_temp));
  assert(store.Exists("tasks/task-3.todo"));
  std::filesystem::remove_all(root);
}

void TestLocalFsCleanupUsesInjectedClock() {
  const auto root  = MakeRoot("cleanup-clock");
  auto       clock = std::make_shared<sharedq::util::ManualClock>(sharedq::util::Now());
  LocalFsStore store(root, StoreOptions{}, clock);
  store.EnsureDirectory("tasks");

  const auto temp = root / "tasks" / ".task-1.todo.0badf00d.tmp";
  std::ofstream(temp) << "partial";

  assert(store.CleanupTempFiles("tasks", std::chrono::hours(1)) == 0);

  // only the store's clock moves; the file's mtime stays where it was
  clock->Advance(std::chrono::hours(2));
  assert(store.CleanupTempFiles("tasks", std::chrono::hours(1)) == 1);
  assert(!std::filesystem::exists(temp));
  std::filesystem::remove_all(root);
}

void TestLocalFsRejectsUnusableRoot() {
  const auto root = MakeRoot("not-a-dir");
  std::filesystem::create_directories(root.parent_path());
  std::ofstream(root) << "plain file";

  bool failed = false;
  try {
    LocalFsStore store(root);
  } catch (const sharedq::util::StorageIOError&) {
    failed = true;
  }
  assert(failed);
  std::filesystem::remove(root);
}

void TestMemoryRenameRetriesTransientFailures() {
  auto clock = std::make_shared<sharedq::util::ManualClock>();

  StoreOptions options;
  options.rename_retries = 3;
  MemoryStore store(clock, options);

  store.FailNextRenames(2);
  store.WriteAtomic("tasks/a.todo", "payload");
  assert(store.Read("tasks/a.todo") == "payload");

  store.FailNextRenames(3);
  bool failed = false;
  try {
    store.RenameAtomic("tasks/a.todo", "tasks/a.running");
  } catch (const sharedq::util::StorageIOError&) {
    failed = true;
  }
  assert(failed);
  assert(store.Exists("tasks/a.todo"));
  assert(!store.Exists("tasks/a.running"));
}

void TestMemoryCleanupUsesClock() {
  auto        clock = std::make_shared<sharedq::util::ManualClock>();
  MemoryStore store(clock);

  store.Put("tasks/.a.todo.12345678.tmp", "partial");
  store.Put("tasks/.b.running.12345678.completing", "partial");
  clock->Advance(std::chrono::minutes(90));
  store.Put("tasks/.c.todo.12345678.tmp", "partial");

  assert(store.CleanupTempFiles("tasks", std::chrono::hours(1)) == 2);
  assert(store.Exists("tasks/.c.todo.12345678.tmp"));
}

} // namespace

int main() {
  TestLocalFsContract();
  TestMemoryContract();
  TestLocalFsListSkipsHiddenEntries();
  TestLocalFsCleanupRemovesOnlyOldTempFiles();
  TestLocalFsCleanupUsesInjectedClock();
  TestLocalFsRejectsUnusableRoot();
  TestMemoryRenameRetriesTransientFailures();
  TestMemoryCleanupUsesClock();

  std::cout << "sharedq_unit_shared_store: pass\n";
  return 0;
}
