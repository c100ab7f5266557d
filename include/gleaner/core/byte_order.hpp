#pragma once

/** \file byte_order.hpp
 *  \brief Little-endian load/store for on-disk integers, independent of host order.
 */

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace gleaner::core {

template <class T>
constexpr T load_le(const std::uint8_t* p) noexcept {
  static_assert(std::is_unsigned_v<T>);
  T v{};
  for (std::size_t i = 0; i < sizeof(T); ++i) v |= static_cast<T>(static_cast<T>(p[i]) << (8 * i));
  return v;
}

/** \brief Writes v at p; returns the byte after it. */
template <class T>
constexpr std::uint8_t* store_le(std::uint8_t* p, T v) noexcept {
  static_assert(std::is_unsigned_v<T>);
  for (std::size_t i = 0; i < sizeof(T); ++i) p[i] = static_cast<std::uint8_t>(v >> (8 * i));
  return p + sizeof(T);
}

} // namespace gleaner::core
