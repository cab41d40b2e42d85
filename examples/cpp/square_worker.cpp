#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/heartbeat/heartbeat_service.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using sharedq::scheduler::ExecutionOutcome;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

// Squares payload field `n`, e.g. {"n": 5} -> {"square": 25}.
ExecutionOutcome Square(const std::string& task_id, const google::protobuf::Struct& payload) {
  const auto it = payload.fields().find("n");
  if (it == payload.fields().end() || !it->second.has_number_value()) {
    throw sharedq::util::CallbackError("task " + task_id + ": payload field 'n' must be a number");
  }

  const double n = it->second.number_value();

  google::protobuf::Struct result;
  (*result.mutable_fields())["square"].set_number_value(n * n);
  return ExecutionOutcome::Success(std::move(result));
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: square_worker <config.yaml> OR square_worker --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    auto config = sharedq::config::ConfigLoader::LoadFromYaml(config_path);
    sharedq::observability::InitializeLogging(config);

    auto runtime   = sharedq::factory::BuildRuntime(config);
    auto scheduler = sharedq::factory::BuildScheduler(runtime, Square);

    // Register signal handlers before starting the loop to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::thread loop([&] { scheduler->Run(); });
    SHAREDQ_LOG_INFO("square worker started", {sharedq::observability::StringField("worker_id", runtime.worker_id)});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    SHAREDQ_LOG_INFO("shutting down square worker");

    // the current task, if any, is finalized before Run returns
    scheduler->RequestStop();
    loop.join();
    runtime.heartbeat->Shutdown();
    sharedq::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    SHAREDQ_LOG_ERROR("Fatal error", {sharedq::observability::StringField("error", e.what())});
    sharedq::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
