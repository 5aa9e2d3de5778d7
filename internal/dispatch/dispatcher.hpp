#pragma once

#include <memory>

#include "internal/model/note_event.hpp"
#include "internal/model/observer.hpp"
#include "internal/registry/observer_registry.hpp"

namespace notewatch::dispatch {

// Frontmatter key listing observers to skip for a note ("all" skips every one).
inline constexpr const char* kSkipObserversKey = "skip_observers";

/*
  Dispatcher.

  Invokes every interested observer in priority order. Each observer sees
  the note as folded so far. A failing or timed out observer is recorded
  and the remaining observers still run.
*/
class Dispatcher {
 public:
  explicit Dispatcher(std::shared_ptr<const registry::ObserverRegistry> registry);

  model::MergedNote Dispatch(const model::NoteEvent& event) const;

 private:
  std::shared_ptr<const registry::ObserverRegistry> registry_;
};

} // namespace notewatch::dispatch
