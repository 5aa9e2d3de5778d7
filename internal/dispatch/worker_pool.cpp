#include "worker_pool.hpp"

#include "internal/observability/logging.hpp"

namespace notewatch::dispatch {

WorkerPool::WorkerPool(std::shared_ptr<PathScheduler> scheduler, Handler handler, std::size_t threads)
    : scheduler_(std::move(scheduler)), handler_(std::move(handler)), thread_count_(threads == 0 ? 1 : threads) {
}

WorkerPool::~WorkerPool() {
  Stop(true);
}

void WorkerPool::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&WorkerPool::Run, this);
  }
}

void WorkerPool::Stop(bool drop_pending) {
  scheduler_->Shutdown(drop_pending);
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void WorkerPool::Run() {
  while (true) {
    auto item = scheduler_->Dequeue();
    if (!item) break;

    try {
      handler_(*item);
    } catch (const std::exception& e) {
      NOTEWATCH_LOG_ERROR("Work item failed", {observability::StringField("path", item->path.string()), observability::StringField("error", e.what())});
    }

    scheduler_->Complete(item->path);
  }
}

} // namespace notewatch::dispatch
