#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/model/note.hpp"
#include "internal/model/note_event.hpp"

namespace notewatch::model {

enum class RuntimeKind : std::uint8_t {
  kRestrictedScript = 0,
  kInterpreter      = 1,
  kNative           = 2,
};

std::string_view RuntimeKindName(RuntimeKind kind);

// Bit set of what an observer is allowed to change.
enum Capability : std::uint32_t {
  kAddMetadata    = 1u << 0, // set keys that are not present yet
  kWriteMetadata  = 1u << 1, // set or overwrite any key
  kDeleteMetadata = 1u << 2,
  kRewriteBody    = 1u << 3,
};

using CapabilitySet = std::uint32_t;

constexpr CapabilitySet kAllCapabilities = kAddMetadata | kWriteMetadata | kDeleteMetadata | kRewriteBody;

// Parses "add_metadata", "write_metadata", "delete_metadata", "rewrite_body".
std::optional<Capability> ParseCapability(std::string_view name);

struct ObserverDescriptor {
  std::string               name;
  RuntimeKind               runtime      = RuntimeKind::kNative;
  CapabilitySet             capabilities = kAllCapabilities;
  std::chrono::milliseconds timeout{5000};
  std::int32_t              priority = 0;

  // empty means every event kind
  std::vector<EventKind> events;

  bool InterestedIn(EventKind kind) const;
  bool Allows(Capability capability) const {
    return (capabilities & capability) != 0;
  }
};

enum class ObserverStatus : std::uint8_t {
  kUnchanged = 0,
  kModified  = 1,
  kFailed    = 2,
};

// nullopt value is a tombstone: delete the key.
using MetadataPatch = std::vector<std::pair<std::string, std::optional<MetaValue>>>;

struct ObserverResult {
  ObserverStatus status = ObserverStatus::kUnchanged;
  std::string    reason;

  MetadataPatch              metadata;
  std::optional<std::string> body;

  // Replaces every marker this observer owns. Tokens are stored as "<observer>:<token>".
  std::optional<std::set<std::string>> markers;

  static ObserverResult Unchanged() {
    return {};
  }
  static ObserverResult Failed(std::string reason) {
    ObserverResult result;
    result.status = ObserverStatus::kFailed;
    result.reason = std::move(reason);
    return result;
  }
};

enum class NoticeKind : std::uint8_t {
  kFailed   = 0,
  kShadowed = 1,
  kRejected = 2,
};

std::string_view NoticeKindName(NoticeKind kind);

struct MergeNotice {
  std::string observer;
  NoticeKind  kind = NoticeKind::kFailed;
  std::string detail;
};

struct MergedNote {
  Note note;

  // hash of the note the dispatch started from
  std::string base_hash;

  bool changed = false;
  bool deleted = false;

  std::vector<MergeNotice> notices;
};

} // namespace notewatch::model
