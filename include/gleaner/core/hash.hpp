#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace gleaner::core {

/** \brief 64-bit FNV-1a; stable across platforms and runs. */
constexpr std::uint64_t fnv1a64(std::string_view bytes) noexcept {
  std::uint64_t h = 0xcbf29ce484222325ull;
  for (unsigned char c : bytes) {
    h ^= c;
    h *= 0x100000001b3ull;
  }
  return h;
}

/** \brief 16 lower-case hex digits of fnv1a64(bytes). */
inline std::string hex_digest(std::string_view bytes) {
  static constexpr char digits[] = "0123456789abcdef";
  std::uint64_t h = fnv1a64(bytes);
  std::string out(16, '0');
  for (int i = 15; i >= 0; --i) {
    out[static_cast<std::size_t>(i)] = digits[h & 0xF];
    h >>= 4;
  }
  return out;
}

} // namespace gleaner::core
