#pragma once

#include <filesystem>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/model/note.hpp"

namespace notewatch::store {

struct NoteStoreOptions {
  std::filesystem::path root;
  std::string           extension = "md";
  bool                  fsync     = false;

  // file names that live in the note directory but are not notes
  std::set<std::string> ignored_files;
};

// Writes `contents` next to `path` under a hidden temp name, then renames it over `path`.
void WriteFileAtomic(const std::filesystem::path& path, const std::string& contents, bool fsync);

/*
  Note Store Access.

  The note directory is the only shared mutable resource. Every write goes
  through a temp file and rename so readers never see a partial note.
*/
class NoteStore {
 public:
  explicit NoteStore(NoteStoreOptions options);

  const std::filesystem::path& Root() const {
    return options_.root;
  }
  const std::string& Extension() const {
    return options_.extension;
  }

  // Absolute path for a path relative to the root.
  std::filesystem::path Resolve(const std::filesystem::path& path) const;

  // True for visible files with the note extension that are not ignored.
  bool IsNotePath(const std::filesystem::path& path) const;

  // Throws NotFound when the file is missing, PersistenceError when unreadable.
  model::Note Read(const std::filesystem::path& path) const;

  // Hash of the bytes currently on disk, nullopt when the file is missing.
  std::optional<std::string> CurrentHash(const std::filesystem::path& path) const;

  // Atomic replace. Returns the hash of the written bytes. Throws PersistenceError.
  std::string Write(const model::Note& note) const;

  // Every note under the root, recursively, in path order.
  std::vector<std::filesystem::path> List() const;

  static std::string Serialize(const model::Note& note);

 private:
  std::optional<std::string> ReadBytes(const std::filesystem::path& path) const;

  NoteStoreOptions options_;
};

} // namespace notewatch::store
