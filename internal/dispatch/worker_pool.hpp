#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

#include "internal/dispatch/path_scheduler.hpp"

namespace notewatch::dispatch {

/*
  Background workers draining the path scheduler.

  Executes:
      normalize -> dispatch -> merge -> persist
  for one path at a time per worker.
*/
class WorkerPool {
 public:
  using Handler = std::function<void(const WorkItem&)>;

  WorkerPool(std::shared_ptr<PathScheduler> scheduler, Handler handler, std::size_t threads);
  ~WorkerPool();

  void Start();

  // Shuts the scheduler down and joins the workers.
  void Stop(bool drop_pending);

 private:
  void Run();

  std::shared_ptr<PathScheduler> scheduler_;
  Handler                        handler_;
  std::size_t                    thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace notewatch::dispatch
