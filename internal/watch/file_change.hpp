#pragma once

#include <cstdint>
#include <filesystem>
#include <string_view>

namespace notewatch::watch {

enum class ChangeKind : std::uint8_t {
  kCreate = 0,
  kModify = 1,
  kRemove = 2,
  kRename = 3,
};

inline std::string_view ChangeKindName(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kCreate:
      return "create";
    case ChangeKind::kModify:
      return "modify";
    case ChangeKind::kRemove:
      return "remove";
    case ChangeKind::kRename:
      return "rename";
  }
  return "unknown";
}

// Raw notification: no file contents are read at this stage.
struct FileChange {
  std::filesystem::path path;
  ChangeKind            kind = ChangeKind::kModify;
};

} // namespace notewatch::watch
