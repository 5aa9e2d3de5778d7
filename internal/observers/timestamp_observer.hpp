#pragma once

#include <functional>

#include "internal/model/note_event.hpp"
#include "internal/model/observer.hpp"
#include "internal/util/time.hpp"

namespace notewatch::observers {

/*
  Maintains created_at / updated_at.

    Created  -> created_at (if absent), updated_at
    Updated  -> updated_at, created_at (if absent)
    Synced   -> created_at (if absent) only, so repeated syncs converge
*/
class TimestampObserver {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit TimestampObserver(ClockFn clock = util::Now);

  model::ObserverResult Process(const model::NoteEvent& event) const;

 private:
  ClockFn clock_;
};

} // namespace notewatch::observers
