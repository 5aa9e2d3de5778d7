#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stop_token>
#include <string>

#include "internal/observers/tag_index_observer.hpp"
#include "internal/observers/timestamp_observer.hpp"
#include "internal/observers/toc_observer.hpp"

namespace {

namespace fs = std::filesystem;

using notewatch::model::EventKind;
using notewatch::model::MetaValue;
using notewatch::model::NoteEvent;
using notewatch::model::ObserverStatus;

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "notewatch_builtin_observer_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

NoteEvent Event(EventKind kind, const fs::path& path, const std::string& body = "body\n") {
  notewatch::model::Note note;
  note.path  = path;
  note.title = notewatch::model::TitleFromPath(path);
  note.body  = body;

  NoteEvent event;
  event.kind = kind;
  event.path = path;
  if (kind == EventKind::kDeleted)
    event.before = note;
  else
    event.after = note;
  return event;
}

const MetaValue* FindPatch(const notewatch::model::ObserverResult& result, const std::string& key) {
  for (const auto& [name, value] : result.metadata) {
    if (name == key && value) return &*value;
  }
  return nullptr;
}

// ------------------------------------------------------------
// timestamp
// ------------------------------------------------------------

void TestTimestampsOnCreate() {
  const auto fixed = notewatch::util::TimePoint(std::chrono::seconds(1714555800));
  notewatch::observers::TimestampObserver observer([fixed] { return fixed; });

  auto result = observer.Process(Event(EventKind::kCreated, "/notes/a.md"));
  assert(result.status == ObserverStatus::kModified);
  const auto* created = FindPatch(result, "created_at");
  const auto* updated = FindPatch(result, "updated_at");
  assert(created && std::get<std::string>(*created) == "2024-05-01T09:30:00Z");
  assert(updated && std::get<std::string>(*updated) == "2024-05-01T09:30:00Z");
}

void TestSyncOnlyFillsMissingCreatedAt() {
  notewatch::observers::TimestampObserver observer;

  auto event = Event(EventKind::kSynced, "/notes/a.md");
  auto first = observer.Process(event);
  assert(FindPatch(first, "created_at"));
  assert(!FindPatch(first, "updated_at"));

  event.after->frontmatter.Set("created_at", std::string("2024-01-01T00:00:00Z"));
  auto second = observer.Process(event);
  assert(second.status == ObserverStatus::kUnchanged);
  assert(second.metadata.empty());

  assert(observer.Process(Event(EventKind::kDeleted, "/notes/a.md")).status == ObserverStatus::kUnchanged);
}

// ------------------------------------------------------------
// table of contents
// ------------------------------------------------------------

void TestTocIsInsertedAfterTitle() {
  const std::string body = "# Guide\n\nIntro text.\n\n## Install\n\nsteps\n\n### From source\n\nmore\n\n## Usage\n";
  const auto        out  = notewatch::observers::TocObserver::Rebuild(body);

  assert(out ==
         "# Guide\n\n## Contents\n\n- [Install](#install)\n  - [From source](#from-source)\n- [Usage](#usage)\n\n"
         "Intro text.\n\n## Install\n\nsteps\n\n### From source\n\nmore\n\n## Usage\n");

  // rebuilding replaces the section instead of stacking another one
  assert(notewatch::observers::TocObserver::Rebuild(out) == out);
}

void TestTocSkipsHeadingsInFences() {
  const std::string body = "## Real heading here\n\n```sh\n# not a heading\n```\n\nsome padding text for length\n";
  const auto        out  = notewatch::observers::TocObserver::Rebuild(body);

  assert(out.find("- [Real heading here](#real-heading-here)") != std::string::npos);
  assert(out.find("not-a-heading") == std::string::npos);
}

void TestShortNotesAreLeftAlone() {
  notewatch::observers::TocObserver observer;

  auto result = observer.Process(Event(EventKind::kUpdated, "/notes/a.md", "# T\n\n## A\n"));
  assert(result.status == ObserverStatus::kUnchanged);
  assert(!result.body);
}

void TestAnchor() {
  assert(notewatch::observers::TocObserver::Anchor("Hello, World!") == "hello-world");
  assert(notewatch::observers::TocObserver::Anchor("  snake_case and-dash ") == "snake_case-and-dash");
}

// ------------------------------------------------------------
// tag index
// ------------------------------------------------------------

void TestNormalizeTags() {
  const auto from_string = notewatch::observers::TagIndexObserver::NormalizeTags(MetaValue(std::string("b, #a, ,b")));
  assert((from_string == std::vector<std::string>{"a", "b"}));

  const auto from_list = notewatch::observers::TagIndexObserver::NormalizeTags(MetaValue(std::vector<std::string>{" z", "#y", "z"}));
  assert((from_list == std::vector<std::string>{"y", "z"}));
}

void TestTagIndexIsWrittenAndTagsNormalized() {
  const auto root  = FreshDir("index");
  auto       store = std::make_shared<notewatch::store::NoteStore>(
      notewatch::store::NoteStoreOptions{root, "md", false, {"Tag Index.md"}});

  {
    std::ofstream out(root / "other note.md");
    out << "---\ntags: [work]\n---\nother\n";
  }

  notewatch::observers::TagIndexObserver observer(store, "Tag Index.md", false);

  auto event = Event(EventKind::kCreated, root / "plan.md");
  event.after->frontmatter.Set("tags", std::string("#work, home, work"));

  auto result = observer.Process(event);
  assert(result.status == ObserverStatus::kModified);
  const auto* tags = FindPatch(result, "tags");
  assert(tags && std::get<std::string>(*tags) == "home, work");

  assert(ReadFile(root / "Tag Index.md") ==
         "# Tag Index\n\n## home\n\n- [plan](plan.md)\n\n## work\n\n- [other note](other%20note.md)\n- [plan](plan.md)\n");

  // deleting the note drops it from the index
  observer.Process(Event(EventKind::kDeleted, root / "plan.md"));
  assert(ReadFile(root / "Tag Index.md") == "# Tag Index\n\n## work\n\n- [other note](other%20note.md)\n");
}

void TestNormalizedTagsAreUnchanged() {
  const auto root  = FreshDir("normalized");
  auto       store = std::make_shared<notewatch::store::NoteStore>(notewatch::store::NoteStoreOptions{root});
  notewatch::observers::TagIndexObserver observer(store, "Tag Index.md", false);

  auto event = Event(EventKind::kSynced, root / "a.md");
  event.after->frontmatter.Set("tags", std::vector<std::string>{"a", "b"});

  auto result = observer.Process(event);
  assert(result.status == ObserverStatus::kUnchanged);
  assert(result.metadata.empty());
}

void TestCancelledTagIndexWritesNothing() {
  const auto root  = FreshDir("cancelled");
  auto       store = std::make_shared<notewatch::store::NoteStore>(notewatch::store::NoteStoreOptions{root});
  notewatch::observers::TagIndexObserver observer(store, "Tag Index.md", false);

  auto event = Event(EventKind::kCreated, root / "a.md");
  event.after->frontmatter.Set("tags", std::string("work"));

  std::stop_source stop;
  stop.request_stop();

  auto result = observer.Process(event, stop.get_token());
  assert(result.status == ObserverStatus::kFailed);
  assert(!fs::exists(root / "Tag Index.md"));
}

void TestNestedTagsAreLeftAlone() {
  const auto root  = FreshDir("nested_tags");
  auto       store = std::make_shared<notewatch::store::NoteStore>(notewatch::store::NoteStoreOptions{root});
  notewatch::observers::TagIndexObserver observer(store, "Tag Index.md", false);

  auto event = Event(EventKind::kUpdated, root / "a.md");
  event.after->frontmatter.Set("tags", notewatch::model::NestedValue{"primary: work"});

  auto result = observer.Process(event);
  assert(result.status == ObserverStatus::kUnchanged);
  assert(ReadFile(root / "Tag Index.md") == "# Tag Index\n");
}

} // namespace

int main() {
  TestTimestampsOnCreate();
  TestSyncOnlyFillsMissingCreatedAt();
  TestTocIsInsertedAfterTitle();
  TestTocSkipsHeadingsInFences();
  TestShortNotesAreLeftAlone();
  TestAnchor();
  TestNormalizeTags();
  TestTagIndexIsWrittenAndTagsNormalized();
  TestNormalizedTagsAreUnchanged();
  TestCancelledTagIndexWritesNothing();
  TestNestedTagsAreLeftAlone();

  std::cout << "notewatch_unit_builtin_observers: pass\n";
  return 0;
}
