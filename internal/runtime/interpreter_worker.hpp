#pragma once

#include <sys/types.h>

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include "internal/runtime/interpreter_queue.hpp"

namespace notewatch::runtime {

/*
  The thread that feeds queued tasks to the interpreter host process.

  The host (notewatch-python-host) is spawned on Start and talks over a
  socket pair. Tasks run one at a time; a task still running at its
  deadline gets the host killed, and a new host is started right away.
  A host that exits on its own is replaced the same way.
*/
class InterpreterWorker {
 public:
  InterpreterWorker(std::shared_ptr<InterpreterQueue>  queue,
                    std::filesystem::path              host_program,
                    std::vector<std::filesystem::path> module_paths);
  ~InterpreterWorker();

  InterpreterWorker(const InterpreterWorker&)            = delete;
  InterpreterWorker& operator=(const InterpreterWorker&) = delete;

  // Returns once the first host is ready; throws ObserverExecutionError
  // if it cannot be started.
  void Start();
  void Stop();

  // Host processes started so far, restarts included.
  std::uint64_t HostsStarted() const;

 private:
  void               Run();
  InterpreterOutcome Execute(InterpreterTask& task);

  void Spawn();
  void Recycle();
  // Closes the channel and waits for the host; `kill` does not wait for
  // it to finish on its own.
  void Reap(bool kill);

  std::shared_ptr<InterpreterQueue>  queue_;
  std::filesystem::path              host_program_;
  std::vector<std::filesystem::path> module_paths_;

  std::thread       thread_;
  std::atomic<bool> running_{false};

  // owned by the worker thread once started
  pid_t pid_     = -1;
  int   channel_ = -1;

  std::atomic<std::uint64_t> hosts_started_{0};
};

} // namespace notewatch::runtime
