#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/runtime/interpreter_queue.hpp"
#include "internal/runtime/interpreter_worker.hpp"
#include "internal/runtime/script_engine.hpp"

namespace notewatch::runtime {

inline constexpr char kPythonHostProgram[] = "notewatch-python-host";

// notewatch-python-host next to the running executable, else the bare
// name for a PATH lookup.
std::filesystem::path DefaultPythonHost();

/*
  General-purpose interpreter (Python), hosted in a child process.

  Calls are serialized onto one worker; callers queue behind each other
  and wait for their own result. A call that is still queued at its
  timeout is dropped. A call that is running at its timeout has its
  interpreter process killed and replaced, so a script blocked in native
  code cannot hold up later calls.
*/
class PythonRuntime : public ScriptEngine {
 public:
  explicit PythonRuntime(std::filesystem::path              host_program = DefaultPythonHost(),
                         std::vector<std::filesystem::path> module_paths = {});
  ~PythonRuntime();

  PythonRuntime(const PythonRuntime&)            = delete;
  PythonRuntime& operator=(const PythonRuntime&) = delete;

  std::optional<std::string> CallEntry(const std::string&        script_name,
                                       const std::string&        source,
                                       const std::string&        entry,
                                       const std::string&        argument,
                                       std::chrono::milliseconds timeout) override;

  void Stop();

  std::uint64_t HostsStarted() const;

 private:
  std::shared_ptr<InterpreterQueue> queue_;
  InterpreterWorker                 worker_;
  std::atomic<std::uint64_t>        next_task_id_{1};
};

} // namespace notewatch::runtime
