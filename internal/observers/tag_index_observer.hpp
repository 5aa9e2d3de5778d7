#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

#include "internal/model/note_event.hpp"
#include "internal/model/observer.hpp"
#include "internal/store/note_store.hpp"

namespace notewatch::observers {

/*
  Tag index.

  Normalizes the `tags` key of the note (sorted, no duplicates) and keeps
  a single index note listing every tag with links to the notes that
  carry it. The index file is written only when its content changes.
*/
class TagIndexObserver {
 public:
  TagIndexObserver(std::shared_ptr<const store::NoteStore> store, std::string file_name, bool fsync);

  // The index file is not written once `stop` is signalled.
  model::ObserverResult Process(const model::NoteEvent& event, std::stop_token stop = {});

  // tag -> (title, relative path), both sorted
  using Index = std::map<std::string, std::vector<std::pair<std::string, std::string>>>;

  static std::string Render(const Index& index);

  static std::vector<std::string> NormalizeTags(const model::MetaValue& value);

 private:
  Index BuildIndex(const model::NoteEvent& event, const std::stop_token& stop) const;
  void  WriteIndex(const std::string& contents);

  std::shared_ptr<const store::NoteStore> store_;
  std::string                             file_name_;
  bool                                    fsync_;

  std::mutex  mutex_;
  std::string last_written_;
};

} // namespace notewatch::observers
