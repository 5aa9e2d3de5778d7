#pragma once

#include <memory>
#include <string>

#include "internal/runtime/observer_runtime.hpp"
#include "internal/runtime/script_engine.hpp"

namespace notewatch::runtime {

// Entry points of the plugin contract.
inline constexpr const char* kLuaEntryPoint    = "on_event";
inline constexpr const char* kPythonEntryPoint = "process_event";

/*
  Observer backed by a user script. The event is encoded as JSON, handed
  to the script entry point and the reply decoded into a result.
*/
class ScriptObserver : public ObserverRuntime {
 public:
  ScriptObserver(std::shared_ptr<ScriptEngine> engine, model::RuntimeKind kind, std::string entry, std::string source);

  model::ObserverResult Invoke(const model::ObserverDescriptor& descriptor, const model::NoteEvent& event) override;

  model::RuntimeKind Kind() const override {
    return kind_;
  }

 private:
  std::shared_ptr<ScriptEngine> engine_;
  model::RuntimeKind            kind_;
  std::string                   entry_;
  std::string                   source_;
};

} // namespace notewatch::runtime
