#include "hash.hpp"

namespace notewatch::util {

uint64_t Fnv1a64(std::string_view bytes) {
  constexpr uint64_t kOffsetBasis = 14695981039346656037ULL;
  constexpr uint64_t kPrime       = 1099511628211ULL;

  uint64_t hash = kOffsetBasis;
  for (unsigned char c : bytes) {
    hash ^= c;
    hash *= kPrime;
  }
  return hash;
}

std::string ContentHash(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";

  uint64_t    hash = Fnv1a64(bytes);
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[i] = kHex[hash & 0x0F];
    hash >>= 4;
  }
  return out;
}

} // namespace notewatch::util
