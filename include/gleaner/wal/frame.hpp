#pragma once

/** \file frame.hpp
 *  \brief Collection log frames: little-endian header, payload, CRC32C trailer.
 *
 * Layout:
 *   u32 magic | u32 len | u16 type | u16 reserved(0) | u64 lsn | payload | u32 crc32c
 * len counts the whole frame; the CRC covers every byte before it.
 * Functions here are pure and thread-safe.
 */

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "gleaner/error.hpp"

namespace gleaner::wal {

constexpr std::uint32_t WAL_MAGIC = 0x47574C31u; // "GWL1"
constexpr std::size_t WAL_HEADER_SIZE = 20;
constexpr std::size_t WAL_TRAILER_SIZE = 4;
constexpr std::uint32_t MAX_FRAME_LEN = 64u * 1024u * 1024u;

/** \brief Frame types. Every payload starts with the u64 transaction id. */
enum class frame_type : std::uint16_t {
  op = 1,      /**< one staged operation of a transaction */
  commit = 2,  /**< transaction becomes durable and visible */
  abort = 3,   /**< transaction is discarded */
};

/** \brief Fixed-size prefix of a frame, enough to size the rest of the read. */
struct frame_header {
  std::uint32_t len{};
  frame_type type{frame_type::op};
  std::uint64_t lsn{};

  std::size_t payload_size() const noexcept { return len - WAL_HEADER_SIZE - WAL_TRAILER_SIZE; }
};

/** \brief A decoded frame; payload points into the caller's buffer. */
struct frame {
  frame_type type{frame_type::op};
  std::uint64_t lsn{};
  std::span<const std::uint8_t> payload;
};

/** \brief CRC-32C (Castagnoli, reflected). */
auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t;

/** \brief Parses and range-checks the first WAL_HEADER_SIZE bytes. */
auto parse_header(std::span<const std::uint8_t> bytes) -> std::expected<frame_header, core::error>;

auto encode_frame(std::uint64_t lsn, frame_type type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

/** \brief Decodes a complete frame; data_integrity on a checksum or type error. */
auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<frame, core::error>;

} // namespace gleaner::wal
