#include "internal/dispatch/dispatcher.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/runtime/native_runtime.hpp"

namespace {

using namespace std::chrono_literals;
using notewatch::model::EventKind;
using notewatch::model::MetaValue;
using notewatch::model::NoteEvent;
using notewatch::model::NoticeKind;
using notewatch::model::ObserverDescriptor;
using notewatch::model::ObserverResult;
using notewatch::model::ObserverStatus;

using Handler = notewatch::runtime::NativeRuntime::SimpleHandler;

void Add(notewatch::registry::ObserverRegistry& registry, const std::string& name, int priority, Handler handler) {
  ObserverDescriptor descriptor;
  descriptor.name     = name;
  descriptor.priority = priority;
  descriptor.timeout  = 1s;
  registry.Register(descriptor, std::make_shared<notewatch::runtime::NativeRuntime>(std::move(handler)));
}

NoteEvent Event(EventKind kind, const std::string& body = "body\n") {
  notewatch::model::Note note;
  note.path         = "/notes/a.md";
  note.title        = "a";
  note.body         = body;
  note.content_hash = "0000000000000001";

  NoteEvent event;
  event.kind = kind;
  event.path = note.path;
  if (kind == EventKind::kDeleted)
    event.before = note;
  else
    event.after = note;
  return event;
}

ObserverResult SetKey(const std::string& key, const std::string& value) {
  ObserverResult result;
  result.status = ObserverStatus::kModified;
  result.metadata.emplace_back(key, MetaValue(value));
  return result;
}

void TestFailingObserverIsIsolated() {
  auto registry = std::make_shared<notewatch::registry::ObserverRegistry>();
  Add(*registry, "broken", 10, [](const ObserverDescriptor&, const NoteEvent&) -> ObserverResult { throw std::runtime_error("crash"); });
  Add(*registry, "ok", 0, [](const ObserverDescriptor&, const NoteEvent&) { return SetKey("checked", "yes"); });

  notewatch::dispatch::Dispatcher dispatcher(registry);
  auto                            merged = dispatcher.Dispatch(Event(EventKind::kUpdated));

  assert(merged.changed);
  assert(merged.note.frontmatter.Contains("checked"));
  assert(merged.notices.size() == 1);
  assert(merged.notices[0].observer == "broken");
  assert(merged.notices[0].kind == NoticeKind::kFailed);
  assert(merged.notices[0].detail == "crash");
}

void TestLaterObserversSeeFoldedNote() {
  auto registry = std::make_shared<notewatch::registry::ObserverRegistry>();
  Add(*registry, "upper", 10, [](const ObserverDescriptor&, const NoteEvent& event) {
    ObserverResult result;
    result.status = ObserverStatus::kModified;
    result.body   = event.after->body + "appended\n";
    return result;
  });
  Add(*registry, "counter", 0, [](const ObserverDescriptor&, const NoteEvent& event) {
    return SetKey("length", std::to_string(event.after->body.size()));
  });

  notewatch::dispatch::Dispatcher dispatcher(registry);
  auto                            merged = dispatcher.Dispatch(Event(EventKind::kCreated));

  assert(merged.note.body == "body\nappended\n");
  assert(*merged.note.frontmatter.Find("length") == MetaValue(std::string("14")));
  assert(merged.notices.empty());
}

void TestSkipObservers() {
  auto             registry = std::make_shared<notewatch::registry::ObserverRegistry>();
  std::atomic<int> calls{0};
  Add(*registry, "tagger", 0, [&](const ObserverDescriptor&, const NoteEvent&) {
    ++calls;
    return SetKey("tagged", "yes");
  });
  Add(*registry, "stamper", 0, [&](const ObserverDescriptor&, const NoteEvent&) {
    ++calls;
    return SetKey("stamped", "yes");
  });

  notewatch::dispatch::Dispatcher dispatcher(registry);

  auto one = Event(EventKind::kUpdated);
  one.after->frontmatter.Set("skip_observers", std::string("tagger"));
  auto merged = dispatcher.Dispatch(one);
  assert(calls == 1);
  assert(!merged.note.frontmatter.Contains("tagged"));
  assert(merged.note.frontmatter.Contains("stamped"));

  auto all = Event(EventKind::kUpdated);
  all.after->frontmatter.Set("skip_observers", std::vector<std::string>{"all"});
  auto untouched = dispatcher.Dispatch(all);
  assert(calls == 1);
  assert(!untouched.changed);
}

void TestDeletedIsNeverPersisted() {
  auto             registry = std::make_shared<notewatch::registry::ObserverRegistry>();
  std::atomic<int> calls{0};
  Add(*registry, "cleanup", 0, [&](const ObserverDescriptor&, const NoteEvent& event) {
    ++calls;
    assert(event.kind == EventKind::kDeleted);
    assert(event.before->body == "body\n");
    return SetKey("deleted", "yes");
  });

  notewatch::dispatch::Dispatcher dispatcher(registry);
  auto                            merged = dispatcher.Dispatch(Event(EventKind::kDeleted));

  assert(calls == 1);
  assert(merged.deleted);
  assert(!merged.changed);
}

void TestNoObserversMeansNoChange() {
  auto                            registry = std::make_shared<notewatch::registry::ObserverRegistry>();
  notewatch::dispatch::Dispatcher dispatcher(registry);

  auto merged = dispatcher.Dispatch(Event(EventKind::kSynced));
  assert(!merged.changed);
  assert(merged.base_hash == "0000000000000001");
}

} // namespace

int main() {
  TestFailingObserverIsIsolated();
  TestLaterObserversSeeFoldedNote();
  TestSkipObservers();
  TestDeletedIsNeverPersisted();
  TestNoObserversMeansNoChange();

  std::cout << "notewatch_unit_dispatcher: pass\n";
  return 0;
}
