#include "script_loader.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

#include "internal/config/observer_settings.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/script_observer.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::script {

namespace fs = std::filesystem;

namespace {

std::vector<fs::path> ListScripts(const fs::path& directory, const std::string& extension) {
  std::vector<fs::path> scripts;

  std::error_code ec;
  if (!fs::is_directory(directory, ec)) return scripts;

  for (const auto& entry : fs::directory_iterator(directory, ec)) {
    const auto& path = entry.path();
    if (!entry.is_regular_file() || path.extension() != extension) continue;
    if (path.filename().string().front() == '.' || path.filename().string().front() == '_') continue;
    scripts.push_back(path);
  }
  if (ec) {
    throw util::InvalidArgument("cannot list scripts in " + directory.string() + ": " + ec.message());
  }

  std::sort(scripts.begin(), scripts.end());
  return scripts;
}

std::string ReadSource(const fs::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) throw util::NotFound("cannot read script: " + path.string());
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

} // namespace

ScriptLoader::ScriptLoader(std::shared_ptr<registry::ObserverRegistry> registry,
                           notewatch::runtime::config::RuntimeConfig   config,
                           std::shared_ptr<runtime::ScriptEngine>      lua,
                           std::shared_ptr<runtime::ScriptEngine>      python)
    : registry_(std::move(registry)), config_(std::move(config)), lua_(std::move(lua)), python_(std::move(python)) {
}

std::size_t ScriptLoader::LoadDirectory(const fs::path&                               directory,
                                        const std::string&                            extension,
                                        model::RuntimeKind                            kind,
                                        const std::shared_ptr<runtime::ScriptEngine>& engine,
                                        std::set<std::string>&                        seen) {
  std::size_t count = 0;

  for (const auto& path : ListScripts(directory, extension)) {
    const auto name = path.stem().string();

    if (!engine) {
      NOTEWATCH_LOG_WARN("Script runtime disabled, skipping", {observability::StringField("script", path.string())});
      continue;
    }
    if (seen.count(name) > 0) {
      NOTEWATCH_LOG_WARN("Duplicate observer name, skipping", {observability::StringField("script", path.string())});
      continue;
    }
    if (!config::ObserverEnabled(config_, name, true)) {
      NOTEWATCH_LOG_INFO("Observer disabled by config", {observability::StringField("observer", name)});
      continue;
    }

    try {
      auto descriptor = config::DescribeObserver(config_, name, kind);
      auto entry      = kind == model::RuntimeKind::kRestrictedScript ? runtime::kLuaEntryPoint : runtime::kPythonEntryPoint;
      auto binding    = std::make_shared<runtime::ScriptObserver>(engine, kind, entry, ReadSource(path));

      registry_->Register(std::move(descriptor), std::move(binding));
      seen.insert(name);
      ++count;

      NOTEWATCH_LOG_INFO("Script observer registered",
                         {observability::StringField("observer", name),
                          observability::StringField("runtime", model::RuntimeKindName(kind))});
    } catch (const util::InvalidArgument& e) {
      NOTEWATCH_LOG_ERROR("Invalid observer settings", {observability::StringField("observer", name), observability::StringField("error", e.what())});
    } catch (const util::NotFound& e) {
      NOTEWATCH_LOG_ERROR("Script unreadable", {observability::StringField("observer", name), observability::StringField("error", e.what())});
    }
  }

  return count;
}

std::size_t ScriptLoader::Load() {
  std::lock_guard lock(mutex_);

  const fs::path root = config_.scripts().directory();
  if (root.empty()) return 0;

  std::set<std::string> seen;
  std::size_t           count = 0;
  count += LoadDirectory(root / "lua", ".lua", model::RuntimeKind::kRestrictedScript, lua_, seen);
  count += LoadDirectory(root / "python", ".py", model::RuntimeKind::kInterpreter, python_, seen);

  for (const auto& name : loaded_) {
    if (seen.count(name) == 0 && registry_->Unregister(name)) {
      NOTEWATCH_LOG_INFO("Script observer removed", {observability::StringField("observer", name)});
    }
  }
  loaded_ = std::move(seen);

  return count;
}

std::set<std::string> ScriptLoader::Loaded() const {
  std::lock_guard lock(mutex_);
  return loaded_;
}

} // namespace notewatch::script
