#include "merge_engine.hpp"

#include <algorithm>
#include <string_view>
#include <variant>

#include "internal/store/frontmatter.hpp"
#include "internal/util/strings.hpp"

namespace notewatch::merge {

using model::NoticeKind;

namespace {

constexpr std::string_view kCreatedAtKey = "created_at";
constexpr std::string_view kTimestampKey = "timestamp";

bool IsUnionKey(std::string_view key) {
  return key == "tags" || key == "topics";
}

bool IsNested(const model::MetaValue* value) {
  return value && std::holds_alternative<model::NestedValue>(*value);
}

// The result keeps the shape of `current`, or of `proposed` for a new key.
model::MetaValue UnionItems(const model::MetaValue* current, const model::MetaValue& proposed) {
  std::vector<std::string> items;
  auto                     add = [&](const model::MetaValue& value) {
    for (const auto& raw : model::MetaValueToList(value)) {
      auto item = util::Trim(raw);
      if (!item.empty() && item.front() == '#') item.erase(0, 1);
      if (!item.empty()) items.push_back(std::move(item));
    }
  };
  if (current) add(*current);
  add(proposed);

  std::sort(items.begin(), items.end());
  items.erase(std::unique(items.begin(), items.end()), items.end());

  if (std::holds_alternative<std::vector<std::string>>(current ? *current : proposed)) return items;
  return util::Join(items, ", ");
}

} // namespace

MergeEngine::MergeEngine(model::Note base) : base_(std::move(base)), current_(base_) {
}

void MergeEngine::Notice(const std::string& observer, NoticeKind kind, std::string detail) {
  notices_.push_back({observer, kind, std::move(detail)});
}

// ------------------------------------------------------------
// Metadata
// ------------------------------------------------------------

void MergeEngine::ApplyMetadata(const model::ObserverDescriptor& descriptor, const std::string& key, const std::optional<model::MetaValue>& value) {
  const auto& name = descriptor.name;

  if (key == store::kMarkersKey) {
    Notice(name, NoticeKind::kRejected, "reserved key " + key);
    return;
  }

  const auto* current = current_.frontmatter.Find(key);
  auto        owner   = key_owner_.find(key);

  if (!value) {
    if (!descriptor.Allows(model::kDeleteMetadata)) {
      Notice(name, NoticeKind::kRejected, "delete " + key + " without delete_metadata");
      return;
    }
    if (!current) return;
    if (owner != key_owner_.end() && owner->second != name) {
      Notice(name, NoticeKind::kShadowed, "key " + key + " owned by " + owner->second);
      return;
    }
    current_.frontmatter.Erase(key);
    key_owner_[key] = name;
    return;
  }

  if (key == kTimestampKey) return;
  if (current && *current == *value) return;
  if (current && key == kCreatedAtKey) return;

  const bool union_key = IsUnionKey(key) && !IsNested(current) && !IsNested(&*value);
  auto       next      = union_key ? UnionItems(current, *value) : *value;
  if (current && *current == next) return;

  const bool allowed = descriptor.Allows(model::kWriteMetadata) || (!current && descriptor.Allows(model::kAddMetadata));
  if (!allowed) {
    Notice(name, NoticeKind::kRejected, "set " + key + " without " + (current ? "write_metadata" : "add_metadata"));
    return;
  }
  const bool shared = union_key && unioned_.count(key) > 0;
  if (owner != key_owner_.end() && owner->second != name && !shared) {
    Notice(name, NoticeKind::kShadowed, "key " + key + " owned by " + owner->second);
    return;
  }

  current_.frontmatter.Set(key, std::move(next));
  key_owner_.emplace(key, name);
  if (union_key) unioned_.insert(key);
}

// ------------------------------------------------------------
// Apply
// ------------------------------------------------------------

void MergeEngine::Apply(const model::ObserverDescriptor& descriptor, const model::ObserverResult& result, const model::Note& view) {
  const auto& name = descriptor.name;

  if (result.status == model::ObserverStatus::kFailed) {
    Notice(name, NoticeKind::kFailed, result.reason.empty() ? "failed" : result.reason);
    return;
  }

  for (const auto& [key, value] : result.metadata) {
    ApplyMetadata(descriptor, key, value);
  }

  if (result.body && *result.body != current_.body) {
    if (!descriptor.Allows(model::kRewriteBody)) {
      Notice(name, NoticeKind::kRejected, "body rewrite without rewrite_body");
    } else if (view.body != current_.body) {
      Notice(name, NoticeKind::kShadowed, "body was rewritten by a higher priority observer");
    } else {
      current_.body = *result.body;
    }
  }

  if (result.markers) {
    const auto prefix = name + ":";
    for (auto it = current_.processed_markers.begin(); it != current_.processed_markers.end();) {
      it = util::StartsWith(*it, prefix) ? current_.processed_markers.erase(it) : std::next(it);
    }
    for (const auto& token : *result.markers) {
      current_.processed_markers.insert(prefix + token);
    }
  }
}

model::MergedNote MergeEngine::Finish() const {
  model::MergedNote merged;
  merged.note      = current_;
  merged.base_hash = base_.content_hash;
  merged.changed   = !model::SameContent(base_, current_);
  merged.notices   = notices_;
  return merged;
}

model::MergedNote MergeEngine::Fold(const model::Note& base, std::vector<FoldInput> inputs) {
  std::stable_sort(inputs.begin(), inputs.end(), [](const FoldInput& a, const FoldInput& b) { return a.descriptor.priority > b.descriptor.priority; });

  MergeEngine engine(base);
  for (const auto& input : inputs) {
    engine.Apply(input.descriptor, input.result, base);
  }
  return engine.Finish();
}

} // namespace notewatch::merge
