#include "gleaner/wal/frame.hpp"

#include <array>
#include <cstring>

#include "gleaner/core/byte_order.hpp"

namespace gleaner::wal {

namespace {

using core::error_code;

constexpr auto make_crc_table() {
  std::array<std::uint32_t, 256> table{};
  for (std::uint32_t n = 0; n < table.size(); ++n) {
    std::uint32_t r = n;
    for (int bit = 0; bit < 8; ++bit) r = (r >> 1) ^ (0x82F63B78u & (0u - (r & 1u)));
    table[n] = r;
  }
  return table;
}

constexpr auto CRC_TABLE = make_crc_table();

auto frame_error(error_code code, const char* what) -> std::unexpected<core::error> {
  return core::make_unexpected(code, what, "index.wal.frame");
}

bool known_type(std::uint16_t t) noexcept {
  return t >= static_cast<std::uint16_t>(frame_type::op) && t <= static_cast<std::uint16_t>(frame_type::abort);
}

} // namespace

auto crc32c(std::span<const std::uint8_t> bytes) -> std::uint32_t {
  std::uint32_t r = 0xFFFFFFFFu;
  for (std::uint8_t b : bytes) r = CRC_TABLE[(r ^ b) & 0xFFu] ^ (r >> 8);
  return r ^ 0xFFFFFFFFu;
}

auto parse_header(std::span<const std::uint8_t> bytes) -> std::expected<frame_header, core::error> {
  if (bytes.size() < WAL_HEADER_SIZE) return frame_error(error_code::precondition_failed, "short header");
  const auto* p = bytes.data();
  if (core::load_le<std::uint32_t>(p) != WAL_MAGIC) return frame_error(error_code::data_integrity, "bad magic");
  frame_header h;
  h.len = core::load_le<std::uint32_t>(p + 4);
  const auto type = core::load_le<std::uint16_t>(p + 8);
  if (h.len < WAL_HEADER_SIZE + WAL_TRAILER_SIZE || h.len > MAX_FRAME_LEN) {
    return frame_error(error_code::data_integrity, "frame length out of range");
  }
  if (core::load_le<std::uint16_t>(p + 10) != 0) return frame_error(error_code::data_integrity, "reserved bits set");
  if (!known_type(type)) return frame_error(error_code::data_integrity, "unknown frame type");
  h.type = static_cast<frame_type>(type);
  h.lsn = core::load_le<std::uint64_t>(p + 12);
  return h;
}

auto encode_frame(std::uint64_t lsn, frame_type type, std::span<const std::uint8_t> payload)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  if (payload.size() > MAX_FRAME_LEN - WAL_HEADER_SIZE - WAL_TRAILER_SIZE) {
    return frame_error(error_code::invalid_argument, "payload too large");
  }
  const auto len = static_cast<std::uint32_t>(WAL_HEADER_SIZE + payload.size() + WAL_TRAILER_SIZE);
  std::vector<std::uint8_t> out(len);
  auto* p = core::store_le(out.data(), WAL_MAGIC);
  p = core::store_le(p, len);
  p = core::store_le(p, static_cast<std::uint16_t>(type));
  p = core::store_le(p, std::uint16_t{0});
  p = core::store_le(p, lsn);
  if (!payload.empty()) std::memcpy(p, payload.data(), payload.size());
  core::store_le(out.data() + len - WAL_TRAILER_SIZE, crc32c(std::span(out).first(len - WAL_TRAILER_SIZE)));
  return out;
}

auto decode_frame(std::span<const std::uint8_t> bytes) -> std::expected<frame, core::error> {
  auto h = parse_header(bytes);
  if (!h) return std::unexpected(h.error());
  if (h->len != bytes.size()) return frame_error(error_code::precondition_failed, "length does not match buffer");
  const auto body = bytes.first(h->len - WAL_TRAILER_SIZE);
  if (core::load_le<std::uint32_t>(bytes.data() + body.size()) != crc32c(body)) {
    return frame_error(error_code::data_integrity, "crc mismatch");
  }
  return frame{h->type, h->lsn, bytes.subspan(WAL_HEADER_SIZE, h->payload_size())};
}

} // namespace gleaner::wal
