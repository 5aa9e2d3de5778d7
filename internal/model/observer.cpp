#include "observer.hpp"

#include <algorithm>

namespace notewatch::model {

std::string_view RuntimeKindName(RuntimeKind kind) {
  switch (kind) {
    case RuntimeKind::kRestrictedScript:
      return "restricted-script";
    case RuntimeKind::kInterpreter:
      return "interpreter";
    case RuntimeKind::kNative:
      return "native";
  }
  return "unknown";
}

std::optional<Capability> ParseCapability(std::string_view name) {
  if (name == "add_metadata") return kAddMetadata;
  if (name == "write_metadata") return kWriteMetadata;
  if (name == "delete_metadata") return kDeleteMetadata;
  if (name == "rewrite_body") return kRewriteBody;
  return std::nullopt;
}

bool ObserverDescriptor::InterestedIn(EventKind kind) const {
  return events.empty() || std::find(events.begin(), events.end(), kind) != events.end();
}

std::string_view NoticeKindName(NoticeKind kind) {
  switch (kind) {
    case NoticeKind::kFailed:
      return "failed";
    case NoticeKind::kShadowed:
      return "shadowed";
    case NoticeKind::kRejected:
      return "rejected";
  }
  return "unknown";
}

} // namespace notewatch::model
