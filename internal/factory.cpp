#include "factory.hpp"

#include <filesystem>
#include <stop_token>
#include <string>
#include <type_traits>
#include <vector>

#include "internal/config/observer_settings.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observers/code_fence_observer.hpp"
#include "internal/observers/sqlite_index_observer.hpp"
#include "internal/observers/tag_index_observer.hpp"
#include "internal/observers/timestamp_observer.hpp"
#include "internal/observers/toc_observer.hpp"
#include "internal/persist/note_committer.hpp"
#include "internal/runtime/native_runtime.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::factory {

using notewatch::runtime::config::RuntimeConfig;

namespace {

using model::EventKind;

const std::vector<EventKind> kLiveEvents = {EventKind::kCreated, EventKind::kUpdated, EventKind::kSynced};
const std::vector<EventKind> kAllEvents  = {EventKind::kCreated, EventKind::kUpdated, EventKind::kSynced, EventKind::kDeleted};

// Wraps a Process(event[, stop]) observer object into a native binding.
template <typename Observer>
runtime::ObserverRuntimePtr Native(std::shared_ptr<Observer> observer) {
  constexpr bool kCancellable = std::is_invocable_v<decltype(&Observer::Process), Observer&, const model::NoteEvent&, std::stop_token>;

  return std::make_shared<runtime::NativeRuntime>(
      runtime::NativeRuntime::Handler([observer](const model::ObserverDescriptor&, const model::NoteEvent& event, std::stop_token stop) {
        if constexpr (kCancellable)
          return observer->Process(event, std::move(stop));
        else
          return observer->Process(event);
      }));
}

void RegisterBuiltin(registry::ObserverRegistry&     registry,
                     const RuntimeConfig&            config,
                     const std::string&              name,
                     model::RuntimeKind              kind,
                     const config::ObserverDefaults& defaults,
                     runtime::ObserverRuntimePtr     binding) {
  registry.Register(config::DescribeObserver(config, name, kind, defaults), std::move(binding));
  NOTEWATCH_LOG_INFO("Built-in observer registered", {observability::StringField("observer", name)});
}

void RegisterBuiltins(Application& app) {
  const auto& config = app.config;
  auto&       reg    = *app.registry;

  // ------------------------------------------------------------------
  // SQLite index (runs first so SQL blocks see the note itself)
  // ------------------------------------------------------------------
  if (config::ObserverEnabled(config, "sqlite", !config.sqlite().path().empty())) {
    if (config.sqlite().path().empty()) {
      throw util::InvalidArgument("observer sqlite enabled without sqlite.path");
    }
    auto db = std::make_shared<db::sqlite::SqliteDB>(config.sqlite().path());

    config::ObserverDefaults defaults;
    defaults.priority     = 100;
    defaults.capabilities = model::kRewriteBody;
    defaults.events       = kAllEvents;
    RegisterBuiltin(reg, config, "sqlite", model::RuntimeKind::kNative, defaults,
                    Native(std::make_shared<observers::SqliteIndexObserver>(std::move(db))));
  }

  // ------------------------------------------------------------------
  // Code-fence executor
  // ------------------------------------------------------------------
  if (config::ObserverEnabled(config, "code_fence", true)) {
    config::ObserverDefaults defaults;
    defaults.priority     = 10;
    defaults.capabilities = model::kRewriteBody;
    defaults.events       = kLiveEvents;
    RegisterBuiltin(reg, config, "code_fence", model::RuntimeKind::kRestrictedScript, defaults,
                    std::make_shared<observers::CodeFenceObserver>(app.lua));
  }

  // ------------------------------------------------------------------
  // Timestamps
  // ------------------------------------------------------------------
  if (config::ObserverEnabled(config, "timestamp", true)) {
    config::ObserverDefaults defaults;
    defaults.capabilities = model::kAddMetadata | model::kWriteMetadata;
    defaults.events       = kLiveEvents;
    RegisterBuiltin(reg, config, "timestamp", model::RuntimeKind::kNative, defaults,
                    Native(std::make_shared<observers::TimestampObserver>()));
  }

  // ------------------------------------------------------------------
  // Table of contents (opt-in)
  // ------------------------------------------------------------------
  if (config::ObserverEnabled(config, "toc", false)) {
    config::ObserverDefaults defaults;
    defaults.capabilities = model::kRewriteBody;
    defaults.events       = kLiveEvents;
    RegisterBuiltin(reg, config, "toc", model::RuntimeKind::kNative, defaults, Native(std::make_shared<observers::TocObserver>()));
  }

  // ------------------------------------------------------------------
  // Tag index (opt-in, runs last so it indexes the final tags)
  // ------------------------------------------------------------------
  if (config::ObserverEnabled(config, "tag_index", false)) {
    config::ObserverDefaults defaults;
    defaults.priority     = -99;
    defaults.capabilities = model::kWriteMetadata;
    defaults.events       = kAllEvents;
    RegisterBuiltin(reg, config, "tag_index", model::RuntimeKind::kNative, defaults,
                    Native(std::make_shared<observers::TagIndexObserver>(app.store, config.tag_index().file_name(),
                                                                         config.persistence().fsync())));
  }
}

std::shared_ptr<runtime::PythonRuntime> BuildPython(const RuntimeConfig& config) {
  if (!config.scripts().python() || config.scripts().directory().empty()) return nullptr;

  const auto      modules = std::filesystem::path(config.scripts().directory()) / "python";
  std::error_code ec;
  if (!std::filesystem::is_directory(modules, ec)) return nullptr;

  const auto host = config.scripts().python_host().empty() ? runtime::DefaultPythonHost()
                                                           : std::filesystem::path(config.scripts().python_host());
  try {
    return std::make_shared<runtime::PythonRuntime>(host, std::vector<std::filesystem::path>{modules});
  } catch (const util::ObserverExecutionError& e) {
    NOTEWATCH_LOG_WARN("Python scripts disabled", {observability::StringField("error", e.what())});
    return nullptr;
  }
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;
  app.config = config;

  // ------------------------------------------------------------------
  // Note directory
  // ------------------------------------------------------------------
  store::NoteStoreOptions store_options;
  store_options.root      = config.notes().directory();
  store_options.extension = config.notes().extension();
  store_options.fsync     = config.persistence().fsync();
  store_options.ignored_files.insert(config.tag_index().file_name());

  app.store      = std::make_shared<store::NoteStore>(std::move(store_options));
  app.normalizer = std::make_shared<watch::EventNormalizer>(app.store);
  app.registry   = std::make_shared<registry::ObserverRegistry>();

  // ------------------------------------------------------------------
  // Observer runtimes
  // ------------------------------------------------------------------
  app.lua    = std::make_shared<runtime::LuaRuntime>(config.dispatch().script_pool_size());
  app.python = BuildPython(config);

  RegisterBuiltins(app);

  std::shared_ptr<runtime::ScriptEngine> lua_engine;
  if (config.scripts().lua()) lua_engine = app.lua;

  app.scripts = std::make_shared<script::ScriptLoader>(app.registry, config, lua_engine, app.python);
  app.scripts->Load();

  // ------------------------------------------------------------------
  // Pipeline
  // ------------------------------------------------------------------
  persist::CommitOptions commit_options;
  commit_options.max_attempts = config.persistence().max_attempts();
  commit_options.backoff      = std::chrono::milliseconds(config.persistence().backoff_ms());

  core::PipelineOptions options;
  options.worker_threads        = config.dispatch().worker_threads();
  options.shutdown_grace        = std::chrono::milliseconds(config.dispatch().shutdown_grace_ms());
  options.retry_initial_backoff = std::chrono::milliseconds(config.watch().retry_initial_backoff_ms());
  options.retry_max_backoff     = std::chrono::milliseconds(config.watch().retry_max_backoff_ms());
  options.retry_max_attempts    = config.watch().retry_max_attempts();

  app.pipeline = std::make_shared<core::Pipeline>(app.store,
                                                  app.normalizer,
                                                  std::make_shared<dispatch::Dispatcher>(app.registry),
                                                  std::make_shared<persist::NoteCommitter>(app.store, commit_options),
                                                  options);

  NOTEWATCH_LOG_INFO("Application built",
                     {observability::StringField("notes", app.store->Root().string()),
                      observability::IntField("observers", static_cast<std::int64_t>(app.registry->Size()))});
  return app;
}

} // namespace notewatch::factory
