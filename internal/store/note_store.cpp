#include "note_store.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>

#include "internal/store/frontmatter.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace notewatch::store {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kTempSuffix = ".notewatch.tmp";

bool IsHidden(const fs::path& path) {
  const auto name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

void SyncFile(const fs::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw util::PersistenceError("open for fsync failed: " + path.string() + ": " + std::strerror(errno));
  }
  const int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) {
    throw util::PersistenceError("fsync failed: " + path.string() + ": " + std::strerror(errno));
  }
}

} // namespace

void WriteFileAtomic(const fs::path& path, const std::string& contents, bool fsync) {
  const auto tmp = path.parent_path() / ("." + path.filename().string() + std::string(kTempSuffix));

  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw util::PersistenceError("cannot open temp file: " + tmp.string());
    }
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    out.flush();
    if (!out) {
      std::error_code ignored;
      fs::remove(tmp, ignored);
      throw util::PersistenceError("write failed: " + tmp.string());
    }
  }

  if (fsync) SyncFile(tmp);

  std::error_code ec;
  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    throw util::PersistenceError("rename failed: " + path.string() + ": " + ec.message());
  }
}

NoteStore::NoteStore(NoteStoreOptions options) : options_(std::move(options)) {
  if (!options_.extension.empty() && options_.extension.front() == '.') {
    options_.extension.erase(0, 1);
  }
  std::error_code ec;
  auto            absolute = fs::absolute(options_.root, ec);
  if (!ec) options_.root = absolute.lexically_normal();
}

fs::path NoteStore::Resolve(const fs::path& path) const {
  if (path.is_absolute()) return path.lexically_normal();
  return (options_.root / path).lexically_normal();
}

bool NoteStore::IsNotePath(const fs::path& path) const {
  const auto resolved = Resolve(path);
  const auto relative = resolved.lexically_relative(options_.root);
  if (relative.empty() || *relative.begin() == "..") return false;

  for (const auto& part : relative) {
    if (IsHidden(part)) return false;
  }
  if (options_.ignored_files.count(resolved.filename().string()) > 0) return false;

  return resolved.extension() == "." + options_.extension;
}

std::optional<std::string> NoteStore::ReadBytes(const fs::path& path) const {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return std::nullopt;
    throw util::PersistenceError("cannot open note: " + path.string());
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

model::Note NoteStore::Read(const fs::path& path) const {
  const auto resolved = Resolve(path);
  auto       bytes    = ReadBytes(resolved);
  if (!bytes) {
    throw util::NotFound("note not found: " + resolved.string());
  }

  auto doc = ParseDocument(*bytes);

  model::Note note;
  note.path              = resolved;
  note.title             = model::TitleFromPath(resolved);
  note.frontmatter       = std::move(doc.frontmatter);
  note.body              = std::move(doc.body);
  note.processed_markers = std::move(doc.markers);
  note.content_hash      = util::ContentHash(*bytes);
  return note;
}

std::optional<std::string> NoteStore::CurrentHash(const fs::path& path) const {
  auto bytes = ReadBytes(Resolve(path));
  if (!bytes) return std::nullopt;
  return util::ContentHash(*bytes);
}

std::string NoteStore::Serialize(const model::Note& note) {
  return SerializeDocument(note.frontmatter, note.processed_markers, note.body);
}

std::string NoteStore::Write(const model::Note& note) const {
  const auto resolved = Resolve(note.path);
  const auto bytes    = Serialize(note);
  WriteFileAtomic(resolved, bytes, options_.fsync);
  return util::ContentHash(bytes);
}

std::vector<fs::path> NoteStore::List() const {
  std::vector<fs::path> notes;

  std::error_code ec;
  if (!fs::is_directory(options_.root, ec)) {
    throw util::NotFound("note directory not found: " + options_.root.string());
  }

  fs::recursive_directory_iterator it(options_.root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    throw util::PersistenceError("cannot list notes: " + ec.message());
  }

  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    if (it->is_directory() && IsHidden(it->path())) {
      it.disable_recursion_pending();
      continue;
    }
    if (it->is_regular_file() && IsNotePath(it->path())) {
      notes.push_back(it->path().lexically_normal());
    }
  }

  std::sort(notes.begin(), notes.end());
  return notes;
}

} // namespace notewatch::store
