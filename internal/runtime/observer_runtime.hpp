#pragma once

#include <memory>

#include "internal/model/note_event.hpp"
#include "internal/model/observer.hpp"

namespace notewatch::runtime {

/*
  Execution backend bound to one registered observer.

  Implementations:
    restricted script  -> fresh sandboxed Lua state per call, bounded pool
    interpreter        -> embedded Python, one call at a time on a dedicated thread
    native             -> compiled-in function, fully concurrent
*/
class ObserverRuntime {
 public:
  virtual ~ObserverRuntime() = default;

  // ------------------------------------------------------------------
  // Invoke
  // ------------------------------------------------------------------
  /*
    Runs the observer against a read-only event, bounded by
    descriptor.timeout. Faults and timeouts come back as Failed results;
    implementations may also throw ObserverExecutionError.
  */
  virtual model::ObserverResult Invoke(const model::ObserverDescriptor& descriptor, const model::NoteEvent& event) = 0;

  virtual model::RuntimeKind Kind() const = 0;
};

using ObserverRuntimePtr = std::shared_ptr<ObserverRuntime>;

} // namespace notewatch::runtime
