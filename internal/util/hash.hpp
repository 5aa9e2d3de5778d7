#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace notewatch::util {

uint64_t Fnv1a64(std::string_view bytes);

// 16 lowercase hex digits of Fnv1a64(bytes).
std::string ContentHash(std::string_view bytes);

} // namespace notewatch::util
