#pragma once

#include <set>
#include <string>
#include <string_view>

#include "internal/model/note.hpp"

namespace notewatch::store {

// Reserved frontmatter key holding the idempotency markers.
inline constexpr std::string_view kMarkersKey = "processed_markers";

struct ParsedDocument {
  model::Frontmatter    frontmatter;
  std::set<std::string> markers;
  std::string           body;
};

/*
  Splits a note file into frontmatter and body.

  Frontmatter is a YAML mapping between a leading "---" line and the next
  "---" line. Anything else (no block, unterminated block, YAML that is not a
  mapping) is treated as body only.
*/
ParsedDocument ParseDocument(std::string_view text);

// Inverse of ParseDocument. Without frontmatter or markers only the body is written.
std::string SerializeDocument(const model::Frontmatter& frontmatter, const std::set<std::string>& markers, std::string_view body);

} // namespace notewatch::store
