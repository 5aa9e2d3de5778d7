#include "interpreter_worker.hpp"

#include <signal.h>
#include <spawn.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/runtime/host_channel.hpp"
#include "internal/util/errors.hpp"
#include "notewatch/host/v1/python_host.pb.h"

extern char** environ;

namespace notewatch::runtime {

namespace {

// fd the host reads its channel from
constexpr int kChannelFd = 3;

constexpr std::chrono::seconds      kStartupTimeout{10};
constexpr std::chrono::milliseconds kExitGrace{500};

spdlog::level::level_enum ToSpdlog(host::v1::ScriptLog::Level level) {
  switch (level) {
    case host::v1::ScriptLog::LEVEL_DEBUG:
      return spdlog::level::debug;
    case host::v1::ScriptLog::LEVEL_WARNING:
      return spdlog::level::warn;
    case host::v1::ScriptLog::LEVEL_ERROR:
      return spdlog::level::err;
    default:
      return spdlog::level::info;
  }
}

} // namespace

InterpreterWorker::InterpreterWorker(std::shared_ptr<InterpreterQueue>  queue,
                                     std::filesystem::path              host_program,
                                     std::vector<std::filesystem::path> module_paths)
    : queue_(std::move(queue)), host_program_(std::move(host_program)), module_paths_(std::move(module_paths)) {
}

InterpreterWorker::~InterpreterWorker() {
  Stop();
}

void InterpreterWorker::Start() {
  if (running_.exchange(true)) return;
  try {
    Spawn();
  } catch (const util::ObserverExecutionError&) {
    running_ = false;
    throw;
  }
  thread_ = std::thread(&InterpreterWorker::Run, this);
}

void InterpreterWorker::Stop() {
  queue_->Shutdown();
  if (thread_.joinable()) thread_.join();
  Reap(false);
  running_ = false;
}

std::uint64_t InterpreterWorker::HostsStarted() const {
  return hosts_started_;
}

void InterpreterWorker::Spawn() {
  int fds[2];
  if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
    throw util::ObserverExecutionError(std::string("cannot create python host channel: ") + std::strerror(errno));
  }

  std::vector<std::string> args{host_program_.string()};
  for (const auto& path : module_paths_) args.push_back(path.string());
  std::vector<char*> argv;
  for (auto& arg : args) argv.push_back(arg.data());
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, fds[1], kChannelFd);

  pid_t     pid = -1;
  const int rc  = ::posix_spawnp(&pid, host_program_.c_str(), &actions, nullptr, argv.data(), environ);
  posix_spawn_file_actions_destroy(&actions);
  ::close(fds[1]);

  if (rc != 0) {
    ::close(fds[0]);
    throw util::ObserverExecutionError("cannot start " + host_program_.string() + ": " + std::strerror(rc));
  }

  pid_     = pid;
  channel_ = fds[0];
  ++hosts_started_;

  host::v1::HostFrame frame;
  const auto          status = ReadFrame(channel_, frame, std::chrono::steady_clock::now() + kStartupTimeout);
  if (status != ReadStatus::kOk || !frame.has_ready()) {
    Reap(true);
    throw util::ObserverExecutionError("python host did not start: " + host_program_.string());
  }

  NOTEWATCH_LOG_INFO("Python interpreter started",
                     {observability::StringField("version", frame.ready().version()), observability::IntField("pid", pid)});
}

void InterpreterWorker::Recycle() {
  Reap(true);
  try {
    Spawn();
  } catch (const util::ObserverExecutionError& e) {
    // the next task tries again
    NOTEWATCH_LOG_WARN("Python host restart failed", {observability::StringField("error", e.what())});
  }
}

void InterpreterWorker::Reap(bool kill) {
  if (pid_ < 0) return;

  if (kill) ::kill(pid_, SIGKILL);
  // end of input stops a host that is waiting for work
  ::close(channel_);
  channel_ = -1;

  const auto deadline = std::chrono::steady_clock::now() + kExitGrace;
  int        status   = 0;
  while (::waitpid(pid_, &status, WNOHANG) == 0) {
    if (std::chrono::steady_clock::now() >= deadline) {
      ::kill(pid_, SIGKILL);
      while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
      }
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  pid_ = -1;
}

void InterpreterWorker::Run() {
  while (true) {
    auto task = queue_->Dequeue();
    if (!task) break;

    auto& current   = **task;
    current.started = true;
    if (current.cancelled || std::chrono::steady_clock::now() >= current.deadline) {
      current.promise.set_value({InterpreterOutcome::Status::kCancelled, std::nullopt, "cancelled"});
      continue;
    }

    current.promise.set_value(Execute(current));
  }
}

InterpreterOutcome InterpreterWorker::Execute(InterpreterTask& task) {
  if (pid_ < 0) {
    try {
      Spawn();
    } catch (const util::ObserverExecutionError& e) {
      return {InterpreterOutcome::Status::kError, std::nullopt, e.what()};
    }
  }

  host::v1::CallRequest request;
  request.set_script_name(task.script_name);
  request.set_source(task.source);
  request.set_entry(task.entry);
  request.set_argument(task.argument);

  try {
    WriteFrame(channel_, request);

    while (true) {
      host::v1::HostFrame frame;
      switch (ReadFrame(channel_, frame, task.deadline)) {
        case ReadStatus::kOk:
          break;
        case ReadStatus::kTimeout:
          NOTEWATCH_LOG_WARN("Python script timed out, restarting interpreter", {observability::StringField("script", task.script_name)});
          Recycle();
          return {InterpreterOutcome::Status::kTimeout, std::nullopt, "timeout"};
        case ReadStatus::kClosed:
          Recycle();
          return {InterpreterOutcome::Status::kError, std::nullopt, "python host exited while running " + task.script_name};
      }

      if (frame.has_log()) {
        observability::Log(ToSpdlog(frame.log().level()), "Script log",
                           {observability::StringField("script", frame.log().script()),
                            observability::StringField("message", frame.log().message())});
        continue;
      }
      if (!frame.has_result()) continue;

      const auto& result = frame.result();
      if (!result.ok()) return {InterpreterOutcome::Status::kError, std::nullopt, result.error()};

      InterpreterOutcome outcome;
      if (result.has_value()) outcome.value = result.value();
      return outcome;
    }
  } catch (const util::ObserverExecutionError& e) {
    Recycle();
    return {InterpreterOutcome::Status::kError, std::nullopt, e.what()};
  }
}

} // namespace notewatch::runtime
