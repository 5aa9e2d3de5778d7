#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include "config/config.pb.h"
#include "internal/registry/observer_registry.hpp"
#include "internal/runtime/script_engine.hpp"

namespace notewatch::script {

/*
  Script Loader.

  Registers user scripts found under the scripts directory:

    <dir>/lua/<name>.lua      restricted runtime, entry on_event(event)
    <dir>/python/<name>.py    interpreter runtime, entry process_event(event)

  The observer name is the file stem. Settings come from the matching
  observers[] config entry. Load() can be called again at runtime; scripts
  that disappeared are unregistered, the rest are replaced in place.
*/
class ScriptLoader {
 public:
  ScriptLoader(std::shared_ptr<registry::ObserverRegistry> registry,
               notewatch::runtime::config::RuntimeConfig   config,
               std::shared_ptr<runtime::ScriptEngine>      lua,
               std::shared_ptr<runtime::ScriptEngine>      python);

  // Returns the number of scripts registered.
  std::size_t Load();

  std::set<std::string> Loaded() const;

 private:
  std::size_t LoadDirectory(const std::filesystem::path&                 directory,
                            const std::string&                            extension,
                            model::RuntimeKind                            kind,
                            const std::shared_ptr<runtime::ScriptEngine>& engine,
                            std::set<std::string>&                        seen);

  std::shared_ptr<registry::ObserverRegistry> registry_;
  notewatch::runtime::config::RuntimeConfig   config_;
  std::shared_ptr<runtime::ScriptEngine>      lua_;
  std::shared_ptr<runtime::ScriptEngine>      python_;

  mutable std::mutex    mutex_;
  std::set<std::string> loaded_;
};

} // namespace notewatch::script
