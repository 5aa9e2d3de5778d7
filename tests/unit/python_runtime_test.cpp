#include "internal/runtime/python_runtime.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/runtime/script_observer.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono_literals;
using notewatch::runtime::PythonRuntime;

// shared host process, started once
std::shared_ptr<PythonRuntime> Runtime() {
  static auto runtime = std::make_shared<PythonRuntime>();
  return runtime;
}

void TestEntryPointReply() {
  const std::string source = R"(
import json

def process_event(event_json):
    event = json.loads(event_json)
    note = event.get("Created") or event.get("Updated")
    if note is None:
        return None
    return json.dumps({"metadata": {"words": len(note["content"].split())}})
)";

  auto reply = Runtime()->CallEntry("words", source, "process_event", R"({"Updated": {"title": "a", "content": "one two three"}})", 2s);
  assert(reply.has_value());
  assert(reply->find("\"words\": 3") != std::string::npos);

  auto none = Runtime()->CallEntry("words", source, "process_event", R"({"Synced": {"title": "a", "content": ""}})", 2s);
  assert(!none.has_value());
}

void TestScriptErrorsAreExecutionErrors() {
  bool threw = false;
  try {
    (void)Runtime()->CallEntry("broken", "def process_event(e):\n    raise ValueError('bad note')\n", "process_event", "{}", 2s);
  } catch (const notewatch::util::ObserverExecutionError& e) {
    threw = std::string(e.what()).find("bad note") != std::string::npos;
  }
  assert(threw);

  threw = false;
  try {
    (void)Runtime()->CallEntry("wrong_type", "def process_event(e):\n    return 42\n", "process_event", "{}", 2s);
  } catch (const notewatch::util::ObserverExecutionError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    (void)Runtime()->CallEntry("no_entry", "x = 1\n", "process_event", "{}", 2s);
  } catch (const notewatch::util::ObserverExecutionError&) {
    threw = true;
  }
  assert(threw);
}

void TestTimeoutStopsBusyScript() {
  const auto started = std::chrono::steady_clock::now();

  bool timed_out = false;
  try {
    (void)Runtime()->CallEntry("spin", "def process_event(e):\n    while True:\n        pass\n", "process_event", "{}", 200ms);
  } catch (const notewatch::util::ObserverExecutionError& e) {
    timed_out = std::string(e.what()) == "timeout";
  }
  assert(timed_out);
  assert(std::chrono::steady_clock::now() - started < 2s);

  // the interpreter is usable again
  auto reply = Runtime()->CallEntry("after", "def process_event(e):\n    return 'null'\n", "process_event", "{}", 2s);
  assert(reply == std::string("null"));
}

void TestScriptBlockedInNativeCodeIsReplaced() {
  const auto hosts   = Runtime()->HostsStarted();
  const auto started = std::chrono::steady_clock::now();

  bool timed_out = false;
  try {
    (void)Runtime()->CallEntry("sleeper", "import time\ndef process_event(e):\n    time.sleep(3)\n    return 'late'\n", "process_event",
                               "{}", 100ms);
  } catch (const notewatch::util::ObserverExecutionError& e) {
    timed_out = std::string(e.what()) == "timeout";
  }
  assert(timed_out);
  assert(std::chrono::steady_clock::now() - started < 1500ms);
  assert(Runtime()->HostsStarted() == hosts + 1);

  // a healthy call right after gets a working interpreter within its own budget
  auto reply = Runtime()->CallEntry("healthy", "def process_event(e):\n    return 'ok'\n", "process_event", "{}", 500ms);
  assert(reply == std::string("ok"));
}

void TestExitedHostIsReplaced() {
  bool threw = false;
  try {
    (void)Runtime()->CallEntry("quitter", "import os\ndef process_event(e):\n    os._exit(3)\n", "process_event", "{}", 2s);
  } catch (const notewatch::util::ObserverExecutionError& e) {
    threw = std::string(e.what()).find("exited") != std::string::npos;
  }
  assert(threw);

  auto reply = Runtime()->CallEntry("after_exit", "def process_event(e):\n    return 'ok'\n", "process_event", "{}", 2s);
  assert(reply == std::string("ok"));
}

void TestMissingHostProgram() {
  bool threw = false;
  try {
    PythonRuntime missing("/nonexistent/notewatch-python-host");
  } catch (const notewatch::util::ObserverExecutionError&) {
    threw = true;
  }
  assert(threw);
}

void TestGlobalsDoNotLeakBetweenCalls() {
  (void)Runtime()->CallEntry("first", "leaked = 1\ndef process_event(e):\n    return None\n", "process_event", "{}", 2s);

  auto reply = Runtime()->CallEntry("second", "def process_event(e):\n    return str('leaked' in globals())\n", "process_event", "{}", 2s);
  assert(reply == std::string("False"));
}

void TestScriptObserverDecodesReply() {
  notewatch::runtime::ScriptObserver observer(Runtime(), notewatch::model::RuntimeKind::kInterpreter, notewatch::runtime::kPythonEntryPoint,
                                              "import logging_utils\n"
                                              "def process_event(e):\n"
                                              "    logging_utils.info('called')\n"
                                              "    return '{\"content\": \"rewritten\"}'\n");

  notewatch::model::ObserverDescriptor descriptor;
  descriptor.name    = "rewrite";
  descriptor.timeout = 2s;

  notewatch::model::NoteEvent event;
  event.kind  = notewatch::model::EventKind::kUpdated;
  event.after = notewatch::model::Note{};

  auto result = observer.Invoke(descriptor, event);
  assert(result.status == notewatch::model::ObserverStatus::kModified);
  assert(result.body == std::string("rewritten"));
  assert(observer.Kind() == notewatch::model::RuntimeKind::kInterpreter);
}

} // namespace

int main() {
  TestEntryPointReply();
  TestScriptErrorsAreExecutionErrors();
  TestTimeoutStopsBusyScript();
  TestScriptBlockedInNativeCodeIsReplaced();
  TestExitedHostIsReplaced();
  TestMissingHostProgram();
  TestGlobalsDoNotLeakBetweenCalls();
  TestScriptObserverDecodesReply();

  Runtime()->Stop();

  std::cout << "notewatch_unit_python_runtime: pass\n";
  return 0;
}
