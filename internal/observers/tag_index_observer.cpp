#include "tag_index_observer.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"

namespace notewatch::observers {

namespace {

constexpr const char* kTagsKey = "tags";

std::string LinkTarget(const std::filesystem::path& relative) {
  std::string out;
  for (char c : relative.generic_string()) {
    if (c == ' ')
      out += "%20";
    else
      out.push_back(c);
  }
  return out;
}

void AddNote(TagIndexObserver::Index& index, const model::Note& note, const std::filesystem::path& root) {
  const auto* tags = note.frontmatter.Find(kTagsKey);
  if (!tags) return;

  const auto relative = note.path.lexically_relative(root);
  for (const auto& tag : TagIndexObserver::NormalizeTags(*tags)) {
    index[tag].emplace_back(note.title, LinkTarget(relative));
  }
}

} // namespace

TagIndexObserver::TagIndexObserver(std::shared_ptr<const store::NoteStore> store, std::string file_name, bool fsync)
    : store_(std::move(store)), file_name_(std::move(file_name)), fsync_(fsync) {
}

std::vector<std::string> TagIndexObserver::NormalizeTags(const model::MetaValue& value) {
  // a mapping under "tags" is not a tag list
  if (std::holds_alternative<model::NestedValue>(value)) return {};

  auto tags = model::MetaValueToList(value);
  for (auto& tag : tags) {
    tag = util::Trim(tag);
    if (!tag.empty() && tag.front() == '#') tag.erase(0, 1);
  }
  tags.erase(std::remove(tags.begin(), tags.end(), std::string{}), tags.end());
  std::sort(tags.begin(), tags.end());
  tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
  return tags;
}

std::string TagIndexObserver::Render(const Index& index) {
  std::ostringstream out;
  out << "# Tag Index\n";
  for (const auto& [tag, notes] : index) {
    out << "\n## " << tag << "\n\n";
    for (const auto& [title, target] : notes) {
      out << "- [" << title << "](" << target << ")\n";
    }
  }
  return out.str();
}

TagIndexObserver::Index TagIndexObserver::BuildIndex(const model::NoteEvent& event, const std::stop_token& stop) const {
  Index index;

  for (const auto& path : store_->List()) {
    if (stop.stop_requested()) break;
    if (path == event.path) continue;
    try {
      AddNote(index, store_->Read(path), store_->Root());
    } catch (const util::NotFound&) {
      // removed since listing
    } catch (const util::PersistenceError& e) {
      NOTEWATCH_LOG_WARN("tag index skipped unreadable note",
                         {observability::StringField("path", path.string()), observability::StringField("error", e.what())});
    }
  }

  if (event.kind != model::EventKind::kDeleted && event.after) {
    AddNote(index, *event.after, store_->Root());
  }

  for (auto& [tag, notes] : index) {
    std::sort(notes.begin(), notes.end());
  }
  return index;
}

void TagIndexObserver::WriteIndex(const std::string& contents) {
  const auto path = store_->Root() / file_name_;

  if (last_written_.empty()) {
    std::ifstream      in(path, std::ios::binary);
    std::ostringstream existing;
    if (in) existing << in.rdbuf();
    last_written_ = existing.str();
  }
  if (contents == last_written_) return;

  store::WriteFileAtomic(path, contents, fsync_);
  last_written_ = contents;

  NOTEWATCH_LOG_DEBUG("tag index written", {observability::StringField("path", path.string())});
}

model::ObserverResult TagIndexObserver::Process(const model::NoteEvent& event, std::stop_token stop) {
  model::ObserverResult result;

  if (event.kind != model::EventKind::kDeleted && event.after) {
    const auto* tags = event.after->frontmatter.Find(kTagsKey);
    if (tags && !std::holds_alternative<model::NestedValue>(*tags)) {
      auto normalized = NormalizeTags(*tags);

      model::MetaValue value;
      if (std::holds_alternative<std::string>(*tags))
        value = util::Join(normalized, ", ");
      else
        value = normalized;

      if (value != *tags) {
        result.status = model::ObserverStatus::kModified;
        result.metadata.emplace_back(kTagsKey, std::move(value));
      }
    }
  }

  std::lock_guard lock(mutex_);
  const auto      index = BuildIndex(event, stop);
  if (stop.stop_requested()) {
    return model::ObserverResult::Failed("cancelled before the tag index was written");
  }
  WriteIndex(Render(index));

  return result;
}

} // namespace notewatch::observers
