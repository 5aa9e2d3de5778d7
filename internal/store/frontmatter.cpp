#include "frontmatter.hpp"

#include <yaml-cpp/yaml.h>

#include <vector>

#include "internal/observability/logging.hpp"

namespace notewatch::store {
namespace {

constexpr std::string_view kOpen = "---\n";

bool IsFlatList(const YAML::Node& node) {
  for (const auto& item : node) {
    if (!item.IsScalar() && !item.IsNull()) return false;
  }
  return true;
}

model::MetaValue NodeToValue(const YAML::Node& node) {
  if (node.IsMap() || (node.IsSequence() && !IsFlatList(node))) {
    YAML::Emitter out;
    out << node;
    return model::NestedValue{out.c_str()};
  }
  if (node.IsSequence()) {
    std::vector<std::string> items;
    for (const auto& item : node) items.push_back(item.IsScalar() ? item.Scalar() : std::string());
    return items;
  }
  return node.IsScalar() ? node.Scalar() : std::string();
}

// Repeated keys accumulate into a list.
void Accumulate(model::Frontmatter& frontmatter, const std::string& key, model::MetaValue value) {
  const auto* existing = frontmatter.Find(key);
  if (!existing) {
    frontmatter.Set(key, std::move(value));
    return;
  }

  auto merged = model::MetaValueToList(*existing);
  if (const auto* scalar = std::get_if<std::string>(&value)) {
    merged.push_back(*scalar);
  } else {
    const auto items = model::MetaValueToList(value);
    merged.insert(merged.end(), items.begin(), items.end());
  }
  frontmatter.Set(key, std::move(merged));
}

// Locates "\n---\n" (or "\n---" at end of input) after the opening marker.
bool FindClosing(std::string_view text, std::size_t& yaml_end, std::size_t& body_start) {
  std::size_t pos = kOpen.size() - 1;
  while (true) {
    pos = text.find("\n---", pos);
    if (pos == std::string_view::npos) return false;

    const auto after = pos + 4;
    if (after == text.size()) {
      yaml_end   = pos;
      body_start = after;
      return true;
    }
    if (text[after] == '\n') {
      yaml_end   = pos;
      body_start = after + 1;
      return true;
    }
    pos = after;
  }
}

} // namespace

ParsedDocument ParseDocument(std::string_view text) {
  ParsedDocument doc;
  if (text.substr(0, kOpen.size()) != kOpen) {
    doc.body = std::string(text);
    return doc;
  }

  std::size_t yaml_end   = 0;
  std::size_t body_start = 0;
  if (!FindClosing(text, yaml_end, body_start)) {
    doc.body = std::string(text);
    return doc;
  }

  const std::string yaml_text(text.substr(kOpen.size(), yaml_end > kOpen.size() ? yaml_end - kOpen.size() : 0));

  YAML::Node root;
  try {
    root = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    NOTEWATCH_LOG_WARN("Malformed frontmatter, keeping file as body", {observability::StringField("error", e.what())});
    doc.body = std::string(text);
    return doc;
  }

  if (!root.IsNull() && !root.IsMap()) {
    doc.body = std::string(text);
    return doc;
  }

  if (root.IsMap()) {
    for (const auto& entry : root) {
      const auto key = entry.first.Scalar();
      if (key == kMarkersKey) {
        for (const auto& marker : model::MetaValueToList(NodeToValue(entry.second))) doc.markers.insert(marker);
        continue;
      }
      Accumulate(doc.frontmatter, key, NodeToValue(entry.second));
    }
  }

  doc.body = std::string(text.substr(body_start));
  return doc;
}

std::string SerializeDocument(const model::Frontmatter& frontmatter, const std::set<std::string>& markers, std::string_view body) {
  if (frontmatter.Empty() && markers.empty()) {
    return std::string(body);
  }

  YAML::Emitter out;
  out << YAML::BeginMap;
  for (const auto& [key, value] : frontmatter.Entries()) {
    out << YAML::Key << key << YAML::Value;
    if (const auto* scalar = std::get_if<std::string>(&value)) {
      out << *scalar;
    } else if (const auto* nested = std::get_if<model::NestedValue>(&value)) {
      out << YAML::Load(nested->yaml);
    } else {
      out << YAML::BeginSeq;
      for (const auto& item : std::get<std::vector<std::string>>(value)) out << item;
      out << YAML::EndSeq;
    }
  }
  if (!markers.empty()) {
    out << YAML::Key << std::string(kMarkersKey) << YAML::Value << YAML::BeginSeq;
    for (const auto& marker : markers) out << marker;
    out << YAML::EndSeq;
  }
  out << YAML::EndMap;

  std::string text;
  text.reserve(body.size() + out.size() + 16);
  text += kOpen;
  text += out.c_str();
  text += "\n---\n";
  text += body;
  return text;
}

} // namespace notewatch::store
