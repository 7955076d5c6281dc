#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"

using batchsync::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: batchsync <config.yaml> [--dry-run] OR batchsync --config <config.yaml> [--dry-run]" << std::endl;
}

static void PrintPlan(const batchsync::model::RunSummary& summary) {
  for (const auto& item : summary.items) {
    std::cout << item.batch_id << "\t" << (item.classification ? batchsync::model::ClassificationName(*item.classification) : "unreadable");
    if (!item.outcome.reason.empty()) std::cout << "\t" << item.outcome.reason;
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  bool        dry_run = false;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--dry-run") {
      dry_run = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (config_path.empty() && arg.rfind("--", 0) != 0) {
      config_path = arg;
    } else {
      Usage();
      return 2;
    }
  }
  if (config_path.empty()) {
    Usage();
    return 2;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = batchsync::config::ConfigLoader::LoadFromYaml(config_path);

    batchsync::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = batchsync::factory::Build(config, dry_run);

    if (!app.connectivity->IsConnected()) {
      app.notifier->NotifyFatal(config_path, "not connected (" + app.connectivity->Describe() + ")");
      batchsync::observability::ShutdownLogging();
      return 2;
    }
    if (!app.source.backend->IsAccessible(app.source.root)) {
      app.notifier->NotifyFatal(config_path, "source root not accessible: " + app.source.root);
      batchsync::observability::ShutdownLogging();
      return 2;
    }
    if (!dry_run && !app.destination.backend->IsAccessible(app.destination.root)) {
      app.notifier->NotifyFatal(config_path, "destination root not accessible: " + app.destination.root);
      batchsync::observability::ShutdownLogging();
      return 2;
    }

    auto records = app.records->LoadRecords();

    // Register signal handlers before the run; the watcher turns them into a cancellation.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    std::atomic<bool> finished{false};
    std::thread       watcher([&] {
      while (!finished) {
        if (!g_running) {
          app.coordinator->Cancel();
          break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
      }
    });

    batchsync::model::RunSummary summary;
    try {
      summary = app.coordinator->RunOnce(records, app.criteria, app.source, app.destination, *app.ledger);
    } catch (...) {
      finished = true;
      watcher.join();
      throw;
    }
    finished = true;
    watcher.join();

    if (dry_run) {
      PrintPlan(summary);
    }
    app.notifier->Notify(summary);

    batchsync::observability::ShutdownLogging();
    return summary.AllSucceeded() ? 0 : 1;
  } catch (const std::exception& e) {
    BATCHSYNC_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    batchsync::observability::ShutdownLogging();
    return 2;
  }
}
