#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/observer.hpp"
#include "internal/observability/logging.hpp"
#include "internal/watch/change_watcher.hpp"

using notewatch::factory::Application;
using notewatch::factory::Build;
using notewatch::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;
static volatile std::sig_atomic_t g_reload  = 0;

void HandleSignal(int) {
  g_running = 0;
}

void HandleReload(int) {
  g_reload = 1;
}

static void PrintUsage() {
  std::cerr << "Usage: notewatch [--config <config.yaml>] <watch|sync|observers>" << std::endl;
}

static int RunWatch(Application& app) {
  const auto primed = app.normalizer->Prime();
  NOTEWATCH_LOG_INFO("Snapshots primed", {notewatch::observability::IntField("notes", static_cast<std::int64_t>(primed))});

  auto watcher =
      std::make_shared<notewatch::watch::ChangeWatcher>(app.store, std::chrono::milliseconds(app.config.watch().debounce_ms()));

  // Register signal handlers before starting the watcher to avoid race window.
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
  std::signal(SIGHUP, HandleReload);

  app.pipeline->Start();

  std::exception_ptr watch_error;
  std::thread        watch_thread([&] {
    try {
      app.pipeline->Watch(watcher);
    } catch (...) {
      watch_error = std::current_exception();
    }
    g_running = 0;
  });

  NOTEWATCH_LOG_INFO("Notewatch started", {StringField("notes", app.store->Root().string())});

  while (g_running) {
    if (g_reload) {
      g_reload          = 0;
      const auto loaded = app.scripts->Load();
      NOTEWATCH_LOG_INFO("Scripts reloaded", {notewatch::observability::IntField("scripts", static_cast<std::int64_t>(loaded))});
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  NOTEWATCH_LOG_INFO("Shutting down notewatch");

  app.pipeline->Stop();
  watch_thread.join();

  if (watch_error) std::rethrow_exception(watch_error);
  return 0;
}

static int RunSync(Application& app) {
  app.normalizer->Prime();
  app.pipeline->Start();
  app.pipeline->SyncAll();
  app.pipeline->WaitIdle();
  app.pipeline->Stop();

  const auto stats = app.pipeline->Stats();
  std::cout << "synced " << stats.events << " notes, " << stats.commits << " updated, " << stats.failures << " observer failures"
            << std::endl;
  return 0;
}

static int RunObservers(Application& app) {
  for (const auto& observer : app.registry->List()) {
    const auto& d = observer.descriptor;
    std::cout << d.name << "\t" << notewatch::model::RuntimeKindName(d.runtime) << "\tpriority=" << d.priority
              << "\ttimeout_ms=" << d.timeout.count() << std::endl;
  }
  return 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  std::string command;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (command.empty() && arg.rfind("--", 0) != 0) {
      command = arg;
    } else {
      PrintUsage();
      return 1;
    }
  }
  if (command != "watch" && command != "sync" && command != "observers") {
    PrintUsage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    notewatch::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = notewatch::config::ConfigLoader::LoadFromYaml(config_path);
    } else {
      notewatch::config::ConfigLoader::ApplyDefaults(config);
    }

    notewatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    int rc = 0;
    {
      auto app = Build(config);

      if (command == "watch")
        rc = RunWatch(app);
      else if (command == "sync")
        rc = RunSync(app);
      else
        rc = RunObservers(app);
    }

    notewatch::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    NOTEWATCH_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    notewatch::observability::ShutdownLogging();
    return 2;
  }
}
