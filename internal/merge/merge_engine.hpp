#pragma once

#include <map>
#include <set>
#include <string>
#include <vector>

#include "internal/model/note.hpp"
#include "internal/model/observer.hpp"

namespace notewatch::merge {

struct FoldInput {
  model::ObserverDescriptor descriptor;
  model::ObserverResult     result;
};

/*
  Merge Engine.

  Folds observer results, highest priority first, into the candidate next
  state of one note. Rules:

    - a metadata key belongs to the first observer that sets or deletes it;
      a later observer proposing something else for it is Shadowed
    - "tags" and "topics" proposals are unioned into the current list
      (trimmed, without a leading '#', sorted, deduplicated), so several
      observers can contribute; a delete still takes the key over
    - an existing "created_at" is kept; "timestamp" is never stored
    - a body replacement applies only if it was computed from the current
      folded body, otherwise it is Shadowed
    - mutations outside the observer's capabilities are Rejected
    - Failed results contribute nothing but a notice

  One engine per dispatch; not thread-safe.
*/
class MergeEngine {
 public:
  explicit MergeEngine(model::Note base);

  const model::Note& Current() const {
    return current_;
  }

  // `view` is the note the observer computed its result from.
  void Apply(const model::ObserverDescriptor& descriptor, const model::ObserverResult& result, const model::Note& view);

  // changed is false when the folded note has the same content as the base.
  model::MergedNote Finish() const;

  // Folds results that were all computed from `base`. Inputs are ordered
  // by priority here; equal priorities keep their given order.
  static model::MergedNote Fold(const model::Note& base, std::vector<FoldInput> inputs);

 private:
  void Notice(const std::string& observer, model::NoticeKind kind, std::string detail);
  void ApplyMetadata(const model::ObserverDescriptor& descriptor, const std::string& key, const std::optional<model::MetaValue>& value);

  model::Note                        base_;
  model::Note                        current_;
  std::map<std::string, std::string> key_owner_;
  std::set<std::string>              unioned_;
  std::vector<model::MergeNotice>    notices_;
};

} // namespace notewatch::merge
