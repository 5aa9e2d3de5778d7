#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace notewatch::util {

std::string Trim(std::string_view text);

// Splits on `separator`, trims every piece and drops empty ones.
std::vector<std::string> SplitList(std::string_view text, char separator = ',');

std::string Join(const std::vector<std::string>& parts, std::string_view separator);

bool StartsWith(std::string_view text, std::string_view prefix);

std::string ToLower(std::string_view text);

// Replaces every run of three or more newlines with exactly two.
std::string CollapseBlankLines(std::string_view text);

} // namespace notewatch::util
