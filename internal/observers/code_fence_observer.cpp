#include "code_fence_observer.hpp"

#include <optional>
#include <vector>

#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace notewatch::observers {

namespace {

constexpr std::string_view kOpenFence       = "```lua\n";
constexpr std::string_view kCloseFence      = "\n```";
constexpr std::string_view kAnnotationStart = "\n\n> Output:\n";

struct FenceBlock {
  std::size_t begin          = 0; // opening fence
  std::size_t code_begin     = 0;
  std::size_t code_end       = 0;
  std::size_t end            = 0; // just past the closing fence
  std::size_t annotation_end = 0;
  bool        has_annotation = false;
};

std::optional<FenceBlock> FindBlock(std::string_view body, std::size_t from) {
  std::size_t pos = from;
  while (true) {
    const auto open = body.find(kOpenFence, pos);
    if (open == std::string_view::npos) return std::nullopt;
    if (open != 0 && body[open - 1] != '\n') {
      pos = open + 1;
      continue;
    }

    FenceBlock block;
    block.begin      = open;
    block.code_begin = open + kOpenFence.size();

    // search from the opening newline so an empty block closes immediately
    const auto close = body.find(kCloseFence, block.code_begin - 1);
    if (close == std::string_view::npos) return std::nullopt;

    block.code_end = close < block.code_begin ? block.code_begin : close;
    block.end      = close + kCloseFence.size();

    block.annotation_end = block.end;
    if (body.compare(block.end, kAnnotationStart.size(), kAnnotationStart) == 0) {
      std::size_t p = block.end + kAnnotationStart.size();
      while (p < body.size() && body[p] == '>') {
        const auto nl = body.find('\n', p);
        p             = nl == std::string_view::npos ? body.size() : nl + 1;
      }
      block.has_annotation = true;
      block.annotation_end = p;
    }
    return block;
  }
}

} // namespace

CodeFenceObserver::CodeFenceObserver(std::shared_ptr<runtime::LuaRuntime> lua) : lua_(std::move(lua)) {
  if (!lua_) {
    throw util::InvalidArgument("code fence observer requires a Lua runtime");
  }
}

std::string CodeFenceObserver::RenderAnnotation(const runtime::SnippetResult& result) {
  std::string text = result.output;
  if (!text.empty() && text.back() == '\n') text.pop_back();

  std::vector<std::string> lines;
  if (!text.empty()) {
    std::size_t start = 0;
    while (true) {
      const auto nl = text.find('\n', start);
      lines.push_back(text.substr(start, nl == std::string::npos ? std::string::npos : nl - start));
      if (nl == std::string::npos) break;
      start = nl + 1;
    }
  }
  if (!result.ok) lines.push_back("Error: " + result.error);
  if (lines.empty()) lines.emplace_back();

  std::string annotation(kAnnotationStart);
  for (const auto& line : lines) {
    annotation += line.empty() ? ">" : "> " + line;
    annotation += '\n';
  }
  return annotation;
}

model::ObserverResult CodeFenceObserver::Invoke(const model::ObserverDescriptor& descriptor, const model::NoteEvent& event) {
  if (event.kind == model::EventKind::kDeleted || !event.after) {
    return model::ObserverResult::Unchanged();
  }

  const auto&      note = *event.after;
  std::string_view body = note.body;
  const auto       deadline = util::SteadyClock::now() + descriptor.timeout;
  const auto       prefix   = descriptor.name + ":";

  std::string           rewritten;
  std::set<std::string> tokens;
  std::size_t           cursor = 0;
  bool                  found  = false;

  while (auto block = FindBlock(body, cursor)) {
    found = true;
    const auto code  = std::string(body.substr(block->code_begin, block->code_end - block->code_begin));
    const auto token = util::ContentHash(code);
    tokens.insert(token);

    rewritten.append(body.substr(cursor, block->end - cursor));

    const bool known = note.processed_markers.count(prefix + token) > 0;
    if (event.kind == model::EventKind::kUpdated && block->has_annotation && known) {
      rewritten.append(body.substr(block->end, block->annotation_end - block->end));
    } else {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - util::SteadyClock::now());
      if (remaining.count() <= 0) {
        return model::ObserverResult::Failed("timeout");
      }
      try {
        rewritten += RenderAnnotation(lua_->RunSnippet(code, remaining));
      } catch (const util::ObserverExecutionError& e) {
        return model::ObserverResult::Failed(e.what());
      }
    }

    cursor = block->annotation_end;
  }

  model::ObserverResult result;

  std::set<std::string> previous;
  for (const auto& marker : note.processed_markers) {
    if (util::StartsWith(marker, prefix)) previous.insert(marker.substr(prefix.size()));
  }
  if (previous != tokens) {
    result.markers = tokens;
    result.status  = model::ObserverStatus::kModified;
  }

  if (found) {
    rewritten.append(body.substr(cursor));
    rewritten = util::CollapseBlankLines(rewritten);
    if (rewritten != note.body) {
      result.body   = std::move(rewritten);
      result.status = model::ObserverStatus::kModified;
    }
  }

  return result;
}

} // namespace notewatch::observers
