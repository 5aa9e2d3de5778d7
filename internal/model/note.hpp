#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace notewatch::model {

// A mapping, or a list holding non-scalars, kept as emitted YAML.
struct NestedValue {
  std::string yaml;

  bool operator==(const NestedValue&) const = default;
};

// Frontmatter values are scalars, string lists or nested YAML.
using MetaValue = std::variant<std::string, std::vector<std::string>, NestedValue>;

std::string MetaValueToString(const MetaValue& value);

// List view of a value; a scalar is read as a comma separated list and
// nested YAML as a single item.
std::vector<std::string> MetaValueToList(const MetaValue& value);

/*
  Ordered key/value map.

  Keys keep their first insertion position; equality ignores order.
*/
class Frontmatter {
 public:
  using Entry = std::pair<std::string, MetaValue>;

  const MetaValue* Find(std::string_view key) const;
  bool             Contains(std::string_view key) const {
    return Find(key) != nullptr;
  }

  void Set(const std::string& key, MetaValue value);
  bool Erase(std::string_view key);

  const std::vector<Entry>& Entries() const {
    return entries_;
  }
  bool Empty() const {
    return entries_.empty();
  }
  std::size_t Size() const {
    return entries_.size();
  }

  bool operator==(const Frontmatter& other) const;

 private:
  std::vector<Entry> entries_;
};

struct Note {
  std::filesystem::path path;
  std::string           title;
  Frontmatter           frontmatter;
  std::string           body;

  // hash of the file bytes last read or written
  std::string content_hash;

  // "<observer>:<token>" idempotency markers
  std::set<std::string> processed_markers;
};

// Equal title, frontmatter, body and markers. Path and hash are ignored.
bool SameContent(const Note& lhs, const Note& rhs);

// File stem with "%20" decoded to spaces.
std::string TitleFromPath(const std::filesystem::path& path);

} // namespace notewatch::model
