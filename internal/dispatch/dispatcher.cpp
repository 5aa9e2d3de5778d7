#include "dispatcher.hpp"

#include <set>
#include <string>

#include "internal/merge/merge_engine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace notewatch::dispatch {

using observability::StringField;

namespace {

struct SkipList {
  bool                  all = false;
  std::set<std::string> names;

  bool Contains(const std::string& name) const {
    return all || names.count(name) > 0;
  }
};

SkipList ReadSkipList(const model::Note& note) {
  SkipList skip;
  if (const auto* value = note.frontmatter.Find(kSkipObserversKey)) {
    for (const auto& name : model::MetaValueToList(*value)) {
      if (name == "all") skip.all = true;
      skip.names.insert(name);
    }
  }
  return skip;
}

} // namespace

Dispatcher::Dispatcher(std::shared_ptr<const registry::ObserverRegistry> registry) : registry_(std::move(registry)) {
  if (!registry_) {
    throw util::InvalidArgument("dispatcher requires a registry");
  }
}

model::MergedNote Dispatcher::Dispatch(const model::NoteEvent& event) const {
  const auto& subject = event.Subject();
  const auto  skip    = ReadSkipList(subject);
  const auto  path    = event.path.string();

  merge::MergeEngine engine(subject);

  for (const auto& observer : registry_->ListFor(event.kind)) {
    const auto& descriptor = observer.descriptor;
    if (skip.Contains(descriptor.name)) {
      NOTEWATCH_LOG_DEBUG("Observer skipped by note", {StringField("path", path), StringField("observer", descriptor.name)});
      continue;
    }

    model::NoteEvent view = event;
    if (view.after) view.after = engine.Current();

    model::ObserverResult result;
    try {
      result = observer.binding->Invoke(descriptor, view);
    } catch (const std::exception& e) {
      result = model::ObserverResult::Failed(e.what());
    }

    if (result.status == model::ObserverStatus::kFailed) {
      NOTEWATCH_LOG_WARN("Observer failed",
                         {StringField("path", path), StringField("observer", descriptor.name), StringField("event", model::EventKindName(event.kind)),
                          StringField("reason", result.reason)});
    }

    engine.Apply(descriptor, result, view.Subject());
  }

  auto merged = engine.Finish();
  if (event.kind == model::EventKind::kDeleted) {
    merged.deleted = true;
    merged.changed = false;
  }

  for (const auto& notice : merged.notices) {
    if (notice.kind == model::NoticeKind::kFailed) continue;
    NOTEWATCH_LOG_INFO("Observer result discarded",
                       {StringField("path", path), StringField("observer", notice.observer), StringField("notice", model::NoticeKindName(notice.kind)),
                        StringField("detail", notice.detail)});
  }

  return merged;
}

} // namespace notewatch::dispatch
