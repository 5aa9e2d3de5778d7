#include "timestamp_observer.hpp"

namespace notewatch::observers {

TimestampObserver::TimestampObserver(ClockFn clock) : clock_(std::move(clock)) {
}

model::ObserverResult TimestampObserver::Process(const model::NoteEvent& event) const {
  if (event.kind == model::EventKind::kDeleted || !event.after) {
    return model::ObserverResult::Unchanged();
  }

  const auto& frontmatter = event.after->frontmatter;
  const auto  now         = util::FormatTimestamp(clock_());

  model::ObserverResult result;
  if (!frontmatter.Contains("created_at")) {
    result.metadata.emplace_back("created_at", model::MetaValue(now));
  }
  if (event.kind != model::EventKind::kSynced) {
    result.metadata.emplace_back("updated_at", model::MetaValue(now));
  }

  if (!result.metadata.empty()) result.status = model::ObserverStatus::kModified;
  return result;
}

} // namespace notewatch::observers
