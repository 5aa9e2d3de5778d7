#include "internal/observers/code_fence_observer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/util/hash.hpp"

namespace {

using namespace std::chrono_literals;
using notewatch::model::EventKind;
using notewatch::model::NoteEvent;
using notewatch::model::ObserverStatus;

constexpr const char* kSource    = "# Math\n\n```lua\nprint(1+1)\n```";
constexpr const char* kAnnotated = "# Math\n\n```lua\nprint(1+1)\n```\n\n> Output:\n> 2\n";

notewatch::model::ObserverDescriptor Descriptor() {
  notewatch::model::ObserverDescriptor descriptor;
  descriptor.name    = "code_fence";
  descriptor.runtime = notewatch::model::RuntimeKind::kRestrictedScript;
  descriptor.timeout = 2s;
  return descriptor;
}

NoteEvent Event(EventKind kind, const std::string& body) {
  notewatch::model::Note note;
  note.path  = "/notes/math.md";
  note.title = "math";
  note.body  = body;

  NoteEvent event;
  event.kind  = kind;
  event.path  = note.path;
  event.after = note;
  return event;
}

std::string Marker(const std::string& code) {
  return "code_fence:" + notewatch::util::ContentHash(code);
}

void TestBlockOutputIsAppended() {
  notewatch::observers::CodeFenceObserver observer(std::make_shared<notewatch::runtime::LuaRuntime>(1));

  auto result = observer.Invoke(Descriptor(), Event(EventKind::kCreated, kSource));
  assert(result.status == ObserverStatus::kModified);
  assert(result.body && *result.body == kAnnotated);
  assert(result.markers && result.markers->size() == 1);
  assert(result.markers->count(notewatch::util::ContentHash("print(1+1)")) == 1);
}

void TestRerunIsIdempotent() {
  notewatch::observers::CodeFenceObserver observer(std::make_shared<notewatch::runtime::LuaRuntime>(1));

  auto event = Event(EventKind::kSynced, kAnnotated);
  event.after->processed_markers.insert(Marker("print(1+1)"));

  auto result = observer.Invoke(Descriptor(), event);
  assert(result.status == ObserverStatus::kUnchanged);
  assert(!result.body);
  assert(!result.markers);
}

void TestStaleAnnotationIsReplaced() {
  notewatch::observers::CodeFenceObserver observer(std::make_shared<notewatch::runtime::LuaRuntime>(1));

  auto result = observer.Invoke(Descriptor(), Event(EventKind::kSynced, "```lua\nprint(1+1)\n```\n\n> Output:\n> 3\n\nafter\n"));
  assert(result.body);
  assert(*result.body == "```lua\nprint(1+1)\n```\n\n> Output:\n> 2\n\nafter\n");
}

void TestKnownBlockKeepsAnnotationOnUpdate() {
  notewatch::observers::CodeFenceObserver observer(std::make_shared<notewatch::runtime::LuaRuntime>(1));

  // annotation edited by hand; the block itself is unchanged
  const std::string body  = "```lua\nprint(1+1)\n```\n\n> Output:\n> two\n";
  auto              event = Event(EventKind::kUpdated, body);
  event.after->processed_markers.insert(Marker("print(1+1)"));

  auto result = observer.Invoke(Descriptor(), event);
  assert(!result.body);

  // the same note on a sync re-runs everything
  event.kind = EventKind::kSynced;
  result     = observer.Invoke(Descriptor(), event);
  assert(result.body && *result.body == "```lua\nprint(1+1)\n```\n\n> Output:\n> 2\n");
}

void TestScriptErrorIsAnnotated() {
  notewatch::observers::CodeFenceObserver observer(std::make_shared<notewatch::runtime::LuaRuntime>(1));

  auto result = observer.Invoke(Descriptor(), Event(EventKind::kCreated, "```lua\nprint('a')\nerror('boom')\n```\n"));
  assert(result.status == ObserverStatus::kModified);
  assert(result.body);
  assert(result.body->find("> Output:\n> a\n> Error: ") != std::string::npos);
  assert(result.body->find("boom") != std::string::npos);
}

void TestNotesWithoutBlocksAreUntouched() {
  notewatch::observers::CodeFenceObserver observer(std::make_shared<notewatch::runtime::LuaRuntime>(1));

  auto result = observer.Invoke(Descriptor(), Event(EventKind::kCreated, "plain\n\n```python\nprint(1)\n```\n"));
  assert(result.status == ObserverStatus::kUnchanged);
  assert(!result.body);

  NoteEvent deleted;
  deleted.kind   = EventKind::kDeleted;
  deleted.before = Event(EventKind::kCreated, kSource).after;
  assert(observer.Invoke(Descriptor(), deleted).status == ObserverStatus::kUnchanged);
}

void TestRenderAnnotationMarksEmptyLines() {
  notewatch::runtime::SnippetResult result;
  result.output = "a\n\nb\n";
  assert(notewatch::observers::CodeFenceObserver::RenderAnnotation(result) == "\n\n> Output:\n> a\n>\n> b\n");

  result.output.clear();
  assert(notewatch::observers::CodeFenceObserver::RenderAnnotation(result) == "\n\n> Output:\n>\n");
}

} // namespace

int main() {
  TestBlockOutputIsAppended();
  TestRerunIsIdempotent();
  TestStaleAnnotationIsReplaced();
  TestKnownBlockKeepsAnnotationOnUpdate();
  TestScriptErrorIsAnnotated();
  TestNotesWithoutBlocksAreUntouched();
  TestRenderAnnotationMarksEmptyLines();

  std::cout << "notewatch_unit_code_fence_observer: pass\n";
  return 0;
}
