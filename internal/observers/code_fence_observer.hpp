#pragma once

#include <memory>
#include <set>
#include <string>
#include <string_view>

#include "internal/runtime/lua_runtime.hpp"
#include "internal/runtime/observer_runtime.hpp"

namespace notewatch::observers {

/*
  Code-fence executor.

  Runs every ```lua fenced block of a note in the restricted script
  runtime and writes what it printed right below the block:

      ```lua
      print(1+1)
      ```

      > Output:
      > 2

  A single forward pass with a cursor; inserted output is never rescanned.
  An existing "> Output:" annotation directly after a block is replaced.
  Each block leaves a marker (hash of its code). On Updated, a block whose
  marker is known keeps its annotation; Created and Synced re-run all.
*/
class CodeFenceObserver : public runtime::ObserverRuntime {
 public:
  explicit CodeFenceObserver(std::shared_ptr<runtime::LuaRuntime> lua);

  model::ObserverResult Invoke(const model::ObserverDescriptor& descriptor, const model::NoteEvent& event) override;

  model::RuntimeKind Kind() const override {
    return model::RuntimeKind::kRestrictedScript;
  }

  // "> line" per output line, ">" for an empty one.
  static std::string RenderAnnotation(const runtime::SnippetResult& result);

 private:
  std::shared_ptr<runtime::LuaRuntime> lua_;
};

} // namespace notewatch::observers
