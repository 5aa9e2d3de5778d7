#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>

#include "internal/store/note_store.hpp"
#include "internal/watch/change_debouncer.hpp"
#include "internal/watch/file_change.hpp"

namespace notewatch::watch {

/*
  Change Watcher.

  inotify subscription over the whole note tree. Emits debounced
  (path, kind) notifications for note files; never reads contents.
  Directories created later are watched as they appear.
*/
class ChangeWatcher {
 public:
  using Callback = std::function<void(const FileChange&)>;

  ChangeWatcher(std::shared_ptr<const store::NoteStore> store, std::chrono::milliseconds debounce);
  ~ChangeWatcher();

  ChangeWatcher(const ChangeWatcher&)            = delete;
  ChangeWatcher& operator=(const ChangeWatcher&) = delete;

  // Blocks until Stop(). Throws WatchError when the tree cannot be watched,
  // the root disappears or the kernel queue overflowed; Run may be called
  // again afterwards.
  void Run(const Callback& callback);

  // Safe from any thread.
  void Stop();

 private:
  void Open();
  void Close();
  void AddWatchRecursive(const std::filesystem::path& dir, bool report_existing, util::SteadyTimePoint now);
  void HandleEvents(util::SteadyTimePoint now);

  std::shared_ptr<const store::NoteStore> store_;
  ChangeDebouncer                         debouncer_;

  int                                  inotify_fd_ = -1;
  int                                  wake_fd_    = -1;
  int                                  root_wd_    = -1;
  std::map<int, std::filesystem::path> watches_;
  std::atomic<bool>                    stop_{false};
};

} // namespace notewatch::watch
