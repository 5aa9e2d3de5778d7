#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace notewatch::runtime {

struct InterpreterOutcome {
  enum class Status { kOk, kError, kTimeout, kCancelled };

  Status                     status = Status::kOk;
  std::optional<std::string> value;
  std::string                error;
};

struct InterpreterTask {
  std::uint64_t id = 0;
  std::string   script_name;
  std::string   source;
  std::string   entry;
  std::string   argument;

  std::chrono::steady_clock::time_point deadline;

  // set by the worker when it picks the task up
  std::atomic<bool> started{false};
  // set by a caller that stopped waiting
  std::atomic<bool> cancelled{false};

  std::promise<InterpreterOutcome> promise;
};

using InterpreterTaskPtr = std::shared_ptr<InterpreterTask>;

/*
  Thread-safe blocking queue feeding the interpreter worker.
*/
class InterpreterQueue {
 public:
  // false once the queue is shut down
  bool Enqueue(InterpreterTaskPtr task);

  // blocking wait; drains remaining tasks after shutdown
  std::optional<InterpreterTaskPtr> Dequeue();

  void Shutdown();

 private:
  std::mutex                     mutex_;
  std::condition_variable        cv_;
  std::queue<InterpreterTaskPtr> queue_;
  bool                           shutdown_ = false;
};

} // namespace notewatch::runtime
