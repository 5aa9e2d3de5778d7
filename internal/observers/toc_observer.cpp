#include "toc_observer.hpp"

#include <cctype>
#include <optional>
#include <vector>

#include "internal/util/strings.hpp"

namespace notewatch::observers {

namespace {

constexpr std::size_t      kMinimumLength = 50;
constexpr std::string_view kContentsTitle = "## Contents";

std::vector<std::string> SplitLines(std::string_view text) {
  std::vector<std::string> lines;
  std::size_t              start = 0;
  while (true) {
    const auto nl = text.find('\n', start);
    if (nl == std::string_view::npos) {
      lines.emplace_back(text.substr(start));
      return lines;
    }
    lines.emplace_back(text.substr(start, nl - start));
    start = nl + 1;
  }
}

bool IsBlank(const std::string& line) {
  return util::Trim(line).empty();
}

bool IsFence(const std::string& line) {
  return util::StartsWith(line, "```");
}

struct Heading {
  int         level = 0;
  std::string text;
};

std::optional<Heading> ParseHeading(const std::string& line) {
  std::size_t level = 0;
  while (level < line.size() && line[level] == '#') ++level;
  if (level == 0 || level > 6 || level >= line.size() || line[level] != ' ') return std::nullopt;

  auto text = util::Trim(std::string_view(line).substr(level + 1));
  if (text.empty()) return std::nullopt;
  return Heading{static_cast<int>(level), std::move(text)};
}

bool IsContentsItem(const std::string& line) {
  return util::StartsWith(util::Trim(line), "- [");
}

} // namespace

std::string TocObserver::Anchor(std::string_view heading) {
  std::string anchor;
  for (char c : util::ToLower(util::Trim(heading))) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == ' ') {
      anchor.push_back('-');
    } else if (std::isalnum(uc) || c == '-' || c == '_' || uc >= 0x80) {
      anchor.push_back(c);
    }
  }
  return anchor;
}

std::string TocObserver::Rebuild(std::string_view body) {
  if (body.size() < kMinimumLength || body.find('#') == std::string_view::npos) {
    return std::string(body);
  }

  auto lines = SplitLines(body);

  // drop an existing contents section
  bool in_fence = false;
  bool removed  = false;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (IsFence(lines[i])) in_fence = !in_fence;
    if (in_fence || lines[i] != kContentsTitle) continue;

    std::size_t j = i + 1;
    while (j < lines.size() && (IsBlank(lines[j]) || IsContentsItem(lines[j]))) ++j;
    lines.erase(lines.begin() + i, lines.begin() + j);
    removed = true;
    break;
  }

  std::vector<Heading>       headings;
  std::optional<std::size_t> first_h1;
  in_fence = false;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (IsFence(lines[i])) in_fence = !in_fence;
    if (in_fence) continue;

    auto heading = ParseHeading(lines[i]);
    if (!heading) continue;
    if (heading->level == 1 && !first_h1) {
      first_h1 = i;
      continue;
    }
    headings.push_back(std::move(*heading));
  }

  if (headings.empty()) {
    return removed ? util::Join(lines, "\n") : std::string(body);
  }

  std::vector<std::string> out;
  std::size_t              rest = 0;
  if (first_h1) {
    out.assign(lines.begin(), lines.begin() + *first_h1 + 1);
    out.emplace_back();
    rest = *first_h1 + 1;
  }
  while (rest < lines.size() && IsBlank(lines[rest]) && rest + 1 < lines.size()) ++rest;

  out.emplace_back(kContentsTitle);
  out.emplace_back();
  for (const auto& heading : headings) {
    const std::size_t indent = heading.level > 2 ? static_cast<std::size_t>(heading.level - 2) * 2 : 0;
    out.push_back(std::string(indent, ' ') + "- [" + heading.text + "](#" + Anchor(heading.text) + ")");
  }
  out.emplace_back();
  out.insert(out.end(), lines.begin() + rest, lines.end());

  return util::Join(out, "\n");
}

model::ObserverResult TocObserver::Process(const model::NoteEvent& event) const {
  if (event.kind == model::EventKind::kDeleted || !event.after) {
    return model::ObserverResult::Unchanged();
  }

  auto body = Rebuild(event.after->body);
  if (body == event.after->body) {
    return model::ObserverResult::Unchanged();
  }

  model::ObserverResult result;
  result.status = model::ObserverStatus::kModified;
  result.body   = std::move(body);
  return result;
}

} // namespace notewatch::observers
