#include "python_runtime.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::runtime {

namespace {

// the worker kills a running call at its deadline; this bounds the wait
// for that to be reported
constexpr std::chrono::milliseconds kKillGrace{1000};

} // namespace

std::filesystem::path DefaultPythonHost() {
  std::error_code ec;
  const auto      self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec) {
    auto sibling = self.parent_path() / kPythonHostProgram;
    if (std::filesystem::exists(sibling, ec)) return sibling;
  }
  return kPythonHostProgram;
}

PythonRuntime::PythonRuntime(std::filesystem::path host_program, std::vector<std::filesystem::path> module_paths)
    : queue_(std::make_shared<InterpreterQueue>()), worker_(queue_, std::move(host_program), std::move(module_paths)) {
  worker_.Start();
}

PythonRuntime::~PythonRuntime() {
  Stop();
}

void PythonRuntime::Stop() {
  worker_.Stop();
}

std::uint64_t PythonRuntime::HostsStarted() const {
  return worker_.HostsStarted();
}

std::optional<std::string> PythonRuntime::CallEntry(const std::string&        script_name,
                                                    const std::string&        source,
                                                    const std::string&        entry,
                                                    const std::string&        argument,
                                                    std::chrono::milliseconds timeout) {
  auto task         = std::make_shared<InterpreterTask>();
  task->id          = next_task_id_++;
  task->script_name = script_name;
  task->source      = source;
  task->entry       = entry;
  task->argument    = argument;
  task->deadline    = std::chrono::steady_clock::now() + timeout;

  auto future = task->promise.get_future();
  if (!queue_->Enqueue(task)) {
    throw util::ObserverExecutionError("python interpreter is stopped");
  }

  if (future.wait_until(task->deadline) == std::future_status::timeout) {
    task->cancelled = true;
    if (task->started && future.wait_for(kKillGrace) == std::future_status::timeout) {
      NOTEWATCH_LOG_WARN("Python host did not stop after timeout", {observability::StringField("script", script_name)});
    }
    throw util::ObserverExecutionError("timeout");
  }

  auto outcome = future.get();
  switch (outcome.status) {
    case InterpreterOutcome::Status::kOk:
      return outcome.value;
    case InterpreterOutcome::Status::kTimeout:
      throw util::ObserverExecutionError("timeout");
    case InterpreterOutcome::Status::kCancelled:
    case InterpreterOutcome::Status::kError:
      break;
  }
  throw util::ObserverExecutionError(outcome.error);
}

} // namespace notewatch::runtime
