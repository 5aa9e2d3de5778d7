#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/dispatch/path_scheduler.hpp"
#include "internal/dispatch/worker_pool.hpp"
#include "internal/persist/note_committer.hpp"
#include "internal/store/note_store.hpp"
#include "internal/util/time.hpp"
#include "internal/watch/change_watcher.hpp"
#include "internal/watch/event_normalizer.hpp"

namespace notewatch::core {

struct PipelineOptions {
  std::size_t               worker_threads = 4;
  std::chrono::milliseconds shutdown_grace{3000};

  std::chrono::milliseconds retry_initial_backoff{500};
  std::chrono::milliseconds retry_max_backoff{30000};
  std::uint32_t             retry_max_attempts = 0; // 0 retries forever
};

struct PipelineStats {
  std::uint64_t events    = 0;
  std::uint64_t commits   = 0;
  std::uint64_t conflicts = 0;
  std::uint64_t failures  = 0;
};

/*
  Pipeline.

  Wires the stages together for one note at a time per path:

      change -> normalize -> dispatch -> merge -> commit

  A conflicting external edit discards the merge and re-queues the path,
  so the edit comes back as a fresh Updated event. After Stop() only
  in-flight work runs, and nothing is written once the grace period ends.
*/
class Pipeline {
 public:
  Pipeline(std::shared_ptr<const store::NoteStore>       store,
           std::shared_ptr<watch::EventNormalizer>       normalizer,
           std::shared_ptr<const dispatch::Dispatcher>   dispatcher,
           std::shared_ptr<const persist::NoteCommitter> committer,
           PipelineOptions                               options);
  ~Pipeline();

  Pipeline(const Pipeline&)            = delete;
  Pipeline& operator=(const Pipeline&) = delete;

  void Start();

  // false once stopped
  bool Submit(const watch::FileChange& change);
  bool SubmitSync(const std::filesystem::path& path);

  // Queues a Synced event for every note. Returns the count queued.
  std::size_t SyncAll();

  // Blocks until every queued item has been processed.
  void WaitIdle();

  // Blocks on the watcher until Stop(), restarting it with backoff after a
  // WatchError. Rethrows once retry_max_attempts is exhausted.
  void Watch(std::shared_ptr<watch::ChangeWatcher> watcher);

  void Stop();

  PipelineStats Stats() const;

 private:
  void Process(const dispatch::WorkItem& item);
  bool PastDeadline() const;
  void Rescan();

  std::shared_ptr<const store::NoteStore>       store_;
  std::shared_ptr<watch::EventNormalizer>       normalizer_;
  std::shared_ptr<const dispatch::Dispatcher>   dispatcher_;
  std::shared_ptr<const persist::NoteCommitter> committer_;
  PipelineOptions                               options_;

  std::shared_ptr<dispatch::PathScheduler> scheduler_;
  std::unique_ptr<dispatch::WorkerPool>    pool_;

  mutable std::mutex                    mutex_;
  std::condition_variable               cv_;
  std::shared_ptr<watch::ChangeWatcher> watcher_;
  util::SteadyTimePoint                 deadline_{};
  std::atomic<bool>                     stopping_{false};

  std::atomic<std::uint64_t> events_{0};
  std::atomic<std::uint64_t> commits_{0};
  std::atomic<std::uint64_t> conflicts_{0};
  std::atomic<std::uint64_t> failures_{0};
};

} // namespace notewatch::core
