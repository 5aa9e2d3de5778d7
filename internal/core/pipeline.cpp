#include "pipeline.hpp"

#include <algorithm>
#include <optional>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::core {

using observability::IntField;
using observability::StringField;

Pipeline::Pipeline(std::shared_ptr<const store::NoteStore>       store,
                   std::shared_ptr<watch::EventNormalizer>       normalizer,
                   std::shared_ptr<const dispatch::Dispatcher>   dispatcher,
                   std::shared_ptr<const persist::NoteCommitter> committer,
                   PipelineOptions                               options)
    : store_(std::move(store)),
      normalizer_(std::move(normalizer)),
      dispatcher_(std::move(dispatcher)),
      committer_(std::move(committer)),
      options_(options),
      scheduler_(std::make_shared<dispatch::PathScheduler>()) {
  pool_ = std::make_unique<dispatch::WorkerPool>(
      scheduler_, [this](const dispatch::WorkItem& item) { Process(item); }, options_.worker_threads);
}

Pipeline::~Pipeline() {
  Stop();
}

void Pipeline::Start() {
  pool_->Start();
  NOTEWATCH_LOG_INFO("Pipeline started", {IntField("workers", static_cast<std::int64_t>(options_.worker_threads))});
}

bool Pipeline::Submit(const watch::FileChange& change) {
  return scheduler_->Enqueue({change.path, dispatch::WorkKind::kChange, change.kind});
}

bool Pipeline::SubmitSync(const std::filesystem::path& path) {
  return scheduler_->Enqueue({store_->Resolve(path), dispatch::WorkKind::kSync, watch::ChangeKind::kModify});
}

std::size_t Pipeline::SyncAll() {
  std::size_t count = 0;
  for (const auto& path : store_->List()) {
    if (SubmitSync(path)) ++count;
  }
  NOTEWATCH_LOG_INFO("Sync queued", {IntField("notes", static_cast<std::int64_t>(count))});
  return count;
}

void Pipeline::WaitIdle() {
  scheduler_->WaitIdle();
}

bool Pipeline::PastDeadline() const {
  if (!stopping_) return false;
  std::lock_guard lock(mutex_);
  return util::SteadyClock::now() > deadline_;
}

void Pipeline::Process(const dispatch::WorkItem& item) {
  std::optional<model::NoteEvent> event;

  if (item.kind == dispatch::WorkKind::kSync) {
    try {
      event = normalizer_->Sync(store_->Read(item.path));
    } catch (const util::NotFound&) {
      // removed after the sync was queued; the watcher reports the removal
      NOTEWATCH_LOG_DEBUG("Sync target vanished", {StringField("path", item.path.string())});
      return;
    }
  } else {
    event = normalizer_->Normalize({item.path, item.change});
  }
  if (!event) return;

  ++events_;
  NOTEWATCH_LOG_DEBUG("Dispatching event", {StringField("path", event->path.string()), StringField("kind", model::EventKindName(event->kind))});

  auto merged = dispatcher_->Dispatch(*event);
  for (const auto& notice : merged.notices) {
    if (notice.kind == model::NoticeKind::kFailed) ++failures_;
  }
  if (merged.deleted || !merged.changed) return;

  if (PastDeadline()) {
    NOTEWATCH_LOG_WARN("Shutdown grace elapsed, note left unmodified", {StringField("path", event->path.string())});
    return;
  }

  try {
    auto committed = committer_->Commit(merged);
    normalizer_->Remember(committed);
    ++commits_;
    NOTEWATCH_LOG_INFO("Note updated", {StringField("path", committed.path.string()), StringField("hash", committed.content_hash)});
  } catch (const util::MergeConflictError& e) {
    ++conflicts_;
    NOTEWATCH_LOG_WARN("Merge discarded, note changed on disk", {StringField("path", event->path.string()), StringField("error", e.what())});
    if (!scheduler_->Enqueue({event->path, dispatch::WorkKind::kChange, watch::ChangeKind::kModify})) {
      NOTEWATCH_LOG_DEBUG("Re-queue skipped, pipeline stopping", {StringField("path", event->path.string())});
    }
  } catch (const util::PersistenceError& e) {
    NOTEWATCH_LOG_ERROR("Note write failed", {StringField("path", event->path.string()), StringField("error", e.what())});
  }
}

void Pipeline::Rescan() {
  std::size_t count = 0;
  for (const auto& path : store_->List()) {
    if (Submit({path, watch::ChangeKind::kModify})) ++count;
  }
  NOTEWATCH_LOG_INFO("Rescanned note directory", {IntField("notes", static_cast<std::int64_t>(count))});
}

void Pipeline::Watch(std::shared_ptr<watch::ChangeWatcher> watcher) {
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    watcher_ = watcher;
  }

  auto          backoff  = options_.retry_initial_backoff;
  std::uint32_t failures = 0;

  while (!stopping_) {
    const auto started = util::SteadyClock::now();
    try {
      watcher->Run([this](const watch::FileChange& change) { Submit(change); });
      break;
    } catch (const util::WatchError& e) {
      if (util::SteadyClock::now() - started > options_.retry_max_backoff) {
        // the watcher ran fine for a while, start over
        failures = 0;
        backoff  = options_.retry_initial_backoff;
      }
      ++failures;

      NOTEWATCH_LOG_ERROR("Watcher failed",
                          {StringField("error", e.what()), IntField("attempt", failures), IntField("backoff_ms", backoff.count())});

      if (options_.retry_max_attempts > 0 && failures >= options_.retry_max_attempts) throw;
    }

    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_for(lock, backoff, [this] { return stopping_.load(); })) break;
    }
    backoff = std::min(backoff * 2, options_.retry_max_backoff);

    try {
      Rescan();
    } catch (const std::exception& e) {
      NOTEWATCH_LOG_WARN("Rescan failed", {StringField("error", e.what())});
    }
  }

  std::lock_guard lock(mutex_);
  watcher_.reset();
}

void Pipeline::Stop() {
  std::shared_ptr<watch::ChangeWatcher> watcher;
  {
    std::lock_guard lock(mutex_);
    if (stopping_) return;
    deadline_ = util::SteadyClock::now() + options_.shutdown_grace;
    stopping_ = true;
    watcher   = watcher_;
  }
  cv_.notify_all();

  if (watcher) watcher->Stop();
  pool_->Stop(true);

  NOTEWATCH_LOG_INFO("Pipeline stopped", {IntField("commits", static_cast<std::int64_t>(commits_.load()))});
}

PipelineStats Pipeline::Stats() const {
  PipelineStats stats;
  stats.events    = events_;
  stats.commits   = commits_;
  stats.conflicts = conflicts_;
  stats.failures  = failures_;
  return stats;
}

} // namespace notewatch::core
