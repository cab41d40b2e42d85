#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/lease/lock_manager.hpp"
#include "internal/model/task_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/recovery/recovery_service.hpp"
#include "internal/storage/shared_store.hpp"
#include "internal/task/task_store.hpp"
#include "internal/util/yaml_proto.hpp"

using namespace sharedq;

static void Usage() {
  std::cout << "Usage:\n"
            << "  sharedqctl --config <config.yaml> submit <payload-json|yaml> [priority] [task_id]\n"
            << "  sharedqctl --config <config.yaml> list <todo|running|done|failed>\n"
            << "  sharedqctl --config <config.yaml> show <task_id>\n"
            << "  sharedqctl --config <config.yaml> counts\n"
            << "  sharedqctl --config <config.yaml> recover\n"
            << "  sharedqctl --config <config.yaml> reclaim <task_id>\n"
            << "  sharedqctl --config <config.yaml> cleanup\n";
}

static std::optional<int32_t> ParsePriority(const std::string& value) {
  try {
    size_t     consumed = 0;
    const auto priority = std::stoi(value, &consumed);
    if (consumed != value.size()) return std::nullopt;
    return priority;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

static const char* ReclaimResultName(recovery::ReclaimResult result) {
  switch (result) {
    case recovery::ReclaimResult::kReclaimed:
      return "reclaimed";
    case recovery::ReclaimResult::kFailed:
      return "failed";
    case recovery::ReclaimResult::kSkipped:
      return "skipped";
  }
  return "unknown";
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto runtime = factory::BuildRuntime(config);
    auto& tasks  = *runtime.tasks;

    // ------------------------------------------------------------

    if (cmd == "submit") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      int32_t priority = 0;
      if (argc >= 6) {
        auto parsed = ParsePriority(argv[5]);
        if (!parsed) {
          std::cerr << "invalid priority: " << argv[5] << "\n";
          return 1;
        }
        priority = *parsed;
      }
      const std::string id = argc >= 7 ? argv[6] : "";

      google::protobuf::Struct payload;
      try {
        payload = util::ParseStruct(argv[4]);
      } catch (const std::runtime_error& e) {
        std::cerr << "invalid payload: " << e.what() << "\n";
        return 1;
      }

      auto task = tasks.Create(payload, priority, id);
      std::cout << task.id << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "list") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      auto state = model::ParseState(argv[4]);
      if (!state) {
        std::cerr << "unknown state: " << argv[4] << "\n";
        return 1;
      }

      for (const auto& task : tasks.List(*state)) {
        const auto& d = task.descriptor;
        std::cout << task.id << " priority=" << d.priority() << " retry_count=" << d.retry_count();
        if (!d.owner().empty()) std::cout << " owner=" << d.owner();
        std::cout << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "show") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      auto task = tasks.Get(argv[4]);
      if (!task) {
        std::cerr << "task not found: " << argv[4] << "\n";
        return 2;
      }
      std::cout << "state=" << model::StateName(task->state) << "\n" << util::ToJson(task->descriptor) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "counts") {
      const auto counts = tasks.Count();
      std::cout << "pending=" << counts.pending << "\n"
                << "running=" << counts.running << "\n"
                << "done=" << counts.done << "\n"
                << "failed=" << counts.failed << "\n"
                << "total=" << counts.total() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "recover") {
      const auto report = runtime.recovery->RecoverOnce();
      std::cout << "scanned=" << report.scanned << " reclaimed=" << report.reclaimed << " failed=" << report.failed << " skipped=" << report.skipped
                << " duplicates_removed=" << report.duplicates_removed << " orphan_locks_removed=" << report.orphan_locks_removed << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "reclaim") {
      if (argc < 5) {
        Usage();
        return 1;
      }
      std::cout << ReclaimResultName(runtime.recovery->Reclaim(argv[4])) << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "cleanup") {
      const auto max_age = factory::MakeSchedulerOptions(config, runtime.worker_id).temp_file_max_age;
      const auto removed = runtime.store->CleanupTempFiles(task::TaskStore::Directory(), max_age) +
                           runtime.store->CleanupTempFiles(lease::LockManager::Directory(), max_age);
      std::cout << "removed=" << removed << "\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    observability::ShutdownLogging();
    return 2;
  }
}
