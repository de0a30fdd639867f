#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using research::pipeline::WorkerOutcome;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: research-worker [--config <config.yaml>] (--once | --loop [--sleep <seconds>])" << std::endl;
}

// Sleeps in short slices so a signal ends the wait promptly.
static void Pause(uint32_t seconds) {
  const auto until = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
  while (g_running && std::chrono::steady_clock::now() < until) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  bool        once          = false;
  bool        loop          = false;
  long        sleep_seconds = -1;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--once") {
      once = true;
    } else if (arg == "--loop") {
      loop = true;
    } else if (arg == "--sleep" && i + 1 < argc) {
      char* end     = nullptr;
      sleep_seconds = std::strtol(argv[++i], &end, 10);
      if (*end != '\0' || sleep_seconds < 0) {
        Usage();
        return 1;
      }
    } else {
      Usage();
      return 1;
    }
  }
  if (once == loop) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    research::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = research::config::ConfigLoader::LoadFromYaml(config_path);
    } else {
      research::config::ResolveDefaults(config);
    }

    research::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto deps = research::factory::BuildRuntime(config);

    if (once) {
      const auto outcome = deps.worker->RunOnce();
      RESEARCH_LOG_INFO("worker pass finished", {research::observability::StringField("outcome", research::pipeline::ToString(outcome))});
      research::observability::ShutdownLogging();
      return 0;
    }

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    const uint32_t idle_sleep = sleep_seconds >= 0 ? static_cast<uint32_t>(sleep_seconds) : config.worker().sleep_seconds();
    RESEARCH_LOG_INFO("research worker started", {research::observability::StringField("worker_id", deps.worker->WorkerId()),
                                                  research::observability::IntField("sleep_seconds", idle_sleep)});

    while (g_running) {
      WorkerOutcome outcome = WorkerOutcome::kIdle;
      try {
        outcome = deps.worker->RunOnce();
      } catch (const std::exception& e) {
        RESEARCH_LOG_ERROR("worker pass failed", {research::observability::StringField("error", e.what())});
      }
      if (outcome == WorkerOutcome::kIdle || outcome == WorkerOutcome::kDeferred) {
        Pause(idle_sleep);
      }
    }

    RESEARCH_LOG_INFO("Shutting down research worker");
    research::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    RESEARCH_LOG_ERROR("Fatal error", {research::observability::StringField("error", e.what())});
    research::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
