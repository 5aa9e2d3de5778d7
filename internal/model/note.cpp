#include "note.hpp"

#include <algorithm>

#include "internal/util/strings.hpp"

namespace notewatch::model {

std::string MetaValueToString(const MetaValue& value) {
  if (const auto* scalar = std::get_if<std::string>(&value)) {
    return *scalar;
  }
  if (const auto* nested = std::get_if<NestedValue>(&value)) {
    return nested->yaml;
  }
  return util::Join(std::get<std::vector<std::string>>(value), ", ");
}

std::vector<std::string> MetaValueToList(const MetaValue& value) {
  if (const auto* scalar = std::get_if<std::string>(&value)) {
    return util::SplitList(*scalar);
  }
  if (const auto* nested = std::get_if<NestedValue>(&value)) {
    return {nested->yaml};
  }
  return std::get<std::vector<std::string>>(value);
}

const MetaValue* Frontmatter::Find(std::string_view key) const {
  for (const auto& [k, v] : entries_) {
    if (k == key) return &v;
  }
  return nullptr;
}

void Frontmatter::Set(const std::string& key, MetaValue value) {
  for (auto& [k, v] : entries_) {
    if (k == key) {
      v = std::move(value);
      return;
    }
  }
  entries_.emplace_back(key, std::move(value));
}

bool Frontmatter::Erase(std::string_view key) {
  auto it = std::find_if(entries_.begin(), entries_.end(), [&](const Entry& e) { return e.first == key; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

bool Frontmatter::operator==(const Frontmatter& other) const {
  if (entries_.size() != other.entries_.size()) return false;
  for (const auto& [k, v] : entries_) {
    const auto* theirs = other.Find(k);
    if (!theirs || *theirs != v) return false;
  }
  return true;
}

bool SameContent(const Note& lhs, const Note& rhs) {
  return lhs.title == rhs.title && lhs.frontmatter == rhs.frontmatter && lhs.body == rhs.body &&
         lhs.processed_markers == rhs.processed_markers;
}

std::string TitleFromPath(const std::filesystem::path& path) {
  std::string stem = path.stem().string();
  std::string title;
  title.reserve(stem.size());
  for (std::size_t i = 0; i < stem.size(); ++i) {
    if (stem.compare(i, 3, "%20") == 0) {
      title.push_back(' ');
      i += 2;
      continue;
    }
    title.push_back(stem[i]);
  }
  return title;
}

} // namespace notewatch::model
