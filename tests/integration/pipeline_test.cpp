#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/runtime/native_runtime.hpp"

namespace {

namespace fs = std::filesystem;

using namespace std::chrono_literals;
using notewatch::model::EventKind;
using notewatch::model::ObserverResult;
using notewatch::watch::ChangeKind;

fs::path FreshDir(const std::string& test_name) {
  const auto dir = fs::temp_directory_path() / "notewatch_pipeline_tests" / test_name;
  fs::remove_all(dir);
  fs::create_directories(dir / "notes");
  fs::create_directories(dir / "scripts" / "lua");
  return dir;
}

void WriteFile(const fs::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary);
  out << contents;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream      in(path, std::ios::binary);
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

bool Contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

notewatch::runtime::config::RuntimeConfig Config(const fs::path& dir) {
  notewatch::runtime::config::RuntimeConfig config;
  notewatch::config::ConfigLoader::ApplyDefaults(config);
  config.mutable_notes()->set_directory((dir / "notes").string());
  config.mutable_scripts()->set_directory((dir / "scripts").string());
  config.mutable_scripts()->set_python(false);
  config.mutable_dispatch()->set_worker_threads(2);
  return config;
}

void TestSyncConvergesAndIsIdempotent() {
  const auto dir = FreshDir("sync");
  WriteFile(dir / "notes" / "calc.md", "# Calc\n\n```lua\nprint(1+1)\n```\n");
  WriteFile(dir / "notes" / "plain.md", "nothing to run\n");

  auto app = notewatch::factory::Build(Config(dir));
  app.normalizer->Prime();
  app.pipeline->Start();

  assert(app.pipeline->SyncAll() == 2);
  app.pipeline->WaitIdle();

  const auto calc = ReadFile(dir / "notes" / "calc.md");
  assert(Contains(calc, "created_at: "));
  assert(!Contains(calc, "updated_at: "));
  assert(Contains(calc, "code_fence:"));
  assert(Contains(calc, "```lua\nprint(1+1)\n```\n\n> Output:\n> 2\n"));
  assert(Contains(ReadFile(dir / "notes" / "plain.md"), "created_at: "));
  assert(app.pipeline->Stats().commits == 2);

  // a second sync finds nothing left to do
  app.pipeline->SyncAll();
  app.pipeline->WaitIdle();
  assert(app.pipeline->Stats().commits == 2);
  assert(ReadFile(dir / "notes" / "calc.md") == calc);

  app.pipeline->Stop();
}

void TestFileChangesAndEchoSuppression() {
  const auto dir = FreshDir("changes");

  auto app = notewatch::factory::Build(Config(dir));
  app.normalizer->Prime();
  app.pipeline->Start();

  const auto path = dir / "notes" / "plan.md";
  WriteFile(path, "plan\n");
  app.pipeline->Submit({path, ChangeKind::kCreate});
  app.pipeline->WaitIdle();

  const auto written = ReadFile(path);
  assert(Contains(written, "created_at: "));
  assert(Contains(written, "updated_at: "));
  assert(app.pipeline->Stats().commits == 1);

  // the watcher reports our own write back; it must not start another round
  app.pipeline->Submit({path, ChangeKind::kModify});
  app.pipeline->WaitIdle();
  assert(app.pipeline->Stats().commits == 1);
  assert(ReadFile(path) == written);

  app.pipeline->Stop();
}

void TestFailingScriptIsIsolated() {
  const auto dir = FreshDir("failing_script");
  WriteFile(dir / "scripts" / "lua" / "broken.lua", "function on_event(event_json)\n  error('boom')\nend\n");
  WriteFile(dir / "notes" / "a.md", "a\n");

  auto app = notewatch::factory::Build(Config(dir));
  assert(app.registry->Find("broken"));
  app.normalizer->Prime();
  app.pipeline->Start();

  app.pipeline->SyncAll();
  app.pipeline->WaitIdle();

  const auto stats = app.pipeline->Stats();
  assert(stats.failures == 1);
  assert(stats.commits == 1);
  assert(Contains(ReadFile(dir / "notes" / "a.md"), "created_at: "));

  app.pipeline->Stop();
}

void TestExternalEditDuringDispatchWins() {
  const auto dir  = FreshDir("conflict");
  const auto path = dir / "notes" / "race.md";
  WriteFile(path, "draft\n");

  auto app = notewatch::factory::Build(Config(dir));

  // edits the note on disk while its first dispatch is still running
  auto calls = std::make_shared<std::atomic<int>>(0);
  notewatch::model::ObserverDescriptor descriptor;
  descriptor.name     = "racer";
  descriptor.priority = 50;
  descriptor.timeout  = 1s;
  app.registry->Register(descriptor, std::make_shared<notewatch::runtime::NativeRuntime>(
                                         [calls, path](const notewatch::model::ObserverDescriptor&, const notewatch::model::NoteEvent&) {
                                           if (calls->fetch_add(1) == 0) WriteFile(path, "edited by hand\n");
                                           return ObserverResult::Unchanged();
                                         }));

  app.normalizer->Prime();
  app.pipeline->Start();
  app.pipeline->SubmitSync(path);
  app.pipeline->WaitIdle();

  const auto stats = app.pipeline->Stats();
  assert(stats.conflicts == 1);
  assert(stats.commits == 1);
  assert(calls->load() == 2);

  const auto contents = ReadFile(path);
  assert(Contains(contents, "edited by hand\n"));
  assert(!Contains(contents, "draft"));
  assert(Contains(contents, "updated_at: "));

  app.pipeline->Stop();
}

void TestNothingIsQueuedAfterStop() {
  const auto dir = FreshDir("stopped");
  WriteFile(dir / "notes" / "a.md", "a\n");

  auto app = notewatch::factory::Build(Config(dir));
  app.pipeline->Start();
  app.pipeline->Stop();

  assert(!app.pipeline->SubmitSync(dir / "notes" / "a.md"));
  assert(ReadFile(dir / "notes" / "a.md") == "a\n");
}

} // namespace

int main() {
  TestSyncConvergesAndIsIdempotent();
  TestFileChangesAndEchoSuppression();
  TestFailingScriptIsIsolated();
  TestExternalEditDuringDispatchWins();
  TestNothingIsQueuedAfterStop();

  std::cout << "notewatch_integration_pipeline: pass\n";
  return 0;
}
