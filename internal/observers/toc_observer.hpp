#pragma once

#include <string>
#include <string_view>

#include "internal/model/note_event.hpp"
#include "internal/model/observer.hpp"

namespace notewatch::observers {

/*
  Table of contents.

  Keeps a "## Contents" list of the note's headings right after its first
  H1 (or at the top without one). The first H1 itself is not listed.
  Short notes and notes without other headings are left alone.
*/
class TocObserver {
 public:
  model::ObserverResult Process(const model::NoteEvent& event) const;

  // Body with a fresh contents section; returns `body` unchanged when none applies.
  static std::string Rebuild(std::string_view body);

  // "Getting Started!" -> "getting-started"
  static std::string Anchor(std::string_view heading);
};

} // namespace notewatch::observers
