#pragma once

/** \file codec.hpp
 *  \brief Internal binary codec for WAL op bodies and collection snapshots.
 *
 * Little-endian; strings are u32 length + bytes; vectors are u32 count + f32[].
 *
 * Op bodies (after the WAL transaction id):
 *   u8 kind=1 upsert_record   record
 *   u8 kind=2 remove_document str document_id
 *   u8 kind=3 replace_document str document_id, str fingerprint
 *
 * Snapshot file:
 *   "GLSNAP01" u32 version=1 u64 last_lsn u64 next_seq u64 next_txn
 *   u32 ndocs { str document_id, str fingerprint }
 *   u64 nrecords { u64 seq, record }
 *   u32 crc32c over every preceding byte
 */

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "gleaner/error.hpp"
#include "gleaner/types.hpp"

namespace gleaner::detail {

class byte_writer {
public:
  void put_u8(std::uint8_t v) { buf_.push_back(v); }
  void put_u32(std::uint32_t v);
  void put_u64(std::uint64_t v);
  void put_str(const std::string& s);
  void put_floats(std::span<const float> v);
  void put_record(const record& r);

  std::vector<std::uint8_t>& bytes() noexcept { return buf_; }

private:
  void put_raw(const void* p, std::size_t n);
  std::vector<std::uint8_t> buf_;
};

class byte_reader {
public:
  explicit byte_reader(std::span<const std::uint8_t> bytes) : bytes_(bytes) {}

  bool get_u8(std::uint8_t& v);
  bool get_u32(std::uint32_t& v);
  bool get_u64(std::uint64_t& v);
  bool get_str(std::string& s);
  bool get_floats(std::vector<float>& v);
  bool get_record(record& r);

  bool done() const noexcept { return pos_ == bytes_.size(); }

private:
  bool get_raw(void* p, std::size_t n);
  std::span<const std::uint8_t> bytes_;
  std::size_t pos_{0};
};

enum class op_kind : std::uint8_t { upsert_record = 1, remove_document = 2, replace_document = 3 };

struct upsert_op { record rec; };
struct remove_document_op { std::string document_id; };
struct replace_document_op { std::string document_id; std::string fingerprint; };
using index_op = std::variant<upsert_op, remove_document_op, replace_document_op>;

auto encode_op(const index_op& op) -> std::vector<std::uint8_t>;
auto decode_op(std::span<const std::uint8_t> body) -> std::expected<index_op, core::error>;

struct snapshot_image {
  std::uint64_t last_lsn{};
  std::uint64_t next_seq{1};
  std::uint64_t next_txn{1};
  std::vector<std::pair<std::string, std::string>> documents;   /**< (document_id, fingerprint) */
  std::vector<std::pair<std::uint64_t, record>> records;        /**< (insertion seq, record) */
};

auto encode_snapshot(const snapshot_image& img) -> std::vector<std::uint8_t>;
auto decode_snapshot(std::span<const std::uint8_t> bytes) -> std::expected<snapshot_image, core::error>;

} // namespace gleaner::detail
