#include "codec.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

#include "gleaner/core/byte_order.hpp"
#include "gleaner/wal/frame.hpp"

namespace gleaner::detail {

namespace {
constexpr char SNAPSHOT_MAGIC[8] = {'G', 'L', 'S', 'N', 'A', 'P', '0', '1'};
constexpr std::uint32_t SNAPSHOT_VERSION = 1;
}

void byte_writer::put_raw(const void* p, std::size_t n) {
  const auto* b = static_cast<const std::uint8_t*>(p);
  buf_.insert(buf_.end(), b, b + n);
}

void byte_writer::put_u32(std::uint32_t v) {
  std::uint8_t b[4];
  core::store_le(b, v);
  put_raw(b, sizeof(b));
}

void byte_writer::put_u64(std::uint64_t v) {
  std::uint8_t b[8];
  core::store_le(b, v);
  put_raw(b, sizeof(b));
}

void byte_writer::put_str(const std::string& s) {
  put_u32(static_cast<std::uint32_t>(s.size()));
  put_raw(s.data(), s.size());
}

void byte_writer::put_floats(std::span<const float> v) {
  put_u32(static_cast<std::uint32_t>(v.size()));
  for (float f : v) put_u32(std::bit_cast<std::uint32_t>(f));
}

void byte_writer::put_record(const record& r) {
  put_str(r.chunk_id);
  put_str(r.document_id);
  put_u32(r.sequence_index);
  put_u64(r.start_offset);
  put_u64(r.end_offset);
  put_str(r.text);
  put_str(r.model_id);
  put_floats(r.vector);
  // Sorted so identical records encode to identical bytes.
  std::vector<std::pair<std::string, std::string>> tags(r.tags.begin(), r.tags.end());
  std::sort(tags.begin(), tags.end());
  put_u32(static_cast<std::uint32_t>(tags.size()));
  for (const auto& [k, v] : tags) { put_str(k); put_str(v); }
}

bool byte_reader::get_raw(void* p, std::size_t n) {
  if (bytes_.size() - pos_ < n) return false;
  std::memcpy(p, bytes_.data() + pos_, n);
  pos_ += n;
  return true;
}

bool byte_reader::get_u8(std::uint8_t& v) { return get_raw(&v, 1); }
bool byte_reader::get_u32(std::uint32_t& v) {
  if (bytes_.size() - pos_ < 4) return false;
  v = core::load_le<std::uint32_t>(bytes_.data() + pos_);
  pos_ += 4;
  return true;
}

bool byte_reader::get_u64(std::uint64_t& v) {
  if (bytes_.size() - pos_ < 8) return false;
  v = core::load_le<std::uint64_t>(bytes_.data() + pos_);
  pos_ += 8;
  return true;
}

bool byte_reader::get_str(std::string& s) {
  std::uint32_t n = 0;
  if (!get_u32(n) || bytes_.size() - pos_ < n) return false;
  s.assign(reinterpret_cast<const char*>(bytes_.data() + pos_), n);
  pos_ += n;
  return true;
}

bool byte_reader::get_floats(std::vector<float>& v) {
  std::uint32_t n = 0;
  if (!get_u32(n) || (bytes_.size() - pos_) / sizeof(float) < n) return false;
  v.resize(n);
  for (auto& f : v) {
    std::uint32_t bits = 0;
    if (!get_u32(bits)) return false;
    f = std::bit_cast<float>(bits);
  }
  return true;
}

bool byte_reader::get_record(record& r) {
  std::uint32_t ntags = 0;
  if (!get_str(r.chunk_id) || !get_str(r.document_id) || !get_u32(r.sequence_index) ||
      !get_u64(r.start_offset) || !get_u64(r.end_offset) || !get_str(r.text) ||
      !get_str(r.model_id) || !get_floats(r.vector) || !get_u32(ntags)) {
    return false;
  }
  r.tags.clear();
  for (std::uint32_t i = 0; i < ntags; ++i) {
    std::string k, v;
    if (!get_str(k) || !get_str(v)) return false;
    r.tags.emplace(std::move(k), std::move(v));
  }
  return true;
}

auto encode_op(const index_op& op) -> std::vector<std::uint8_t> {
  byte_writer w;
  if (const auto* u = std::get_if<upsert_op>(&op)) {
    w.put_u8(static_cast<std::uint8_t>(op_kind::upsert_record));
    w.put_record(u->rec);
  } else if (const auto* rm = std::get_if<remove_document_op>(&op)) {
    w.put_u8(static_cast<std::uint8_t>(op_kind::remove_document));
    w.put_str(rm->document_id);
  } else if (const auto* rp = std::get_if<replace_document_op>(&op)) {
    w.put_u8(static_cast<std::uint8_t>(op_kind::replace_document));
    w.put_str(rp->document_id);
    w.put_str(rp->fingerprint);
  }
  return std::move(w.bytes());
}

auto decode_op(std::span<const std::uint8_t> body) -> std::expected<index_op, core::error> {
  auto corrupt = [](const char* what) {
    return core::make_unexpected(core::error_code::data_integrity, what, "index.codec");
  };
  byte_reader r(body);
  std::uint8_t kind = 0;
  if (!r.get_u8(kind)) return corrupt("empty op");
  switch (static_cast<op_kind>(kind)) {
    case op_kind::upsert_record: {
      upsert_op op;
      if (!r.get_record(op.rec) || !r.done()) return corrupt("malformed upsert op");
      return op;
    }
    case op_kind::remove_document: {
      remove_document_op op;
      if (!r.get_str(op.document_id) || !r.done()) return corrupt("malformed remove op");
      return op;
    }
    case op_kind::replace_document: {
      replace_document_op op;
      if (!r.get_str(op.document_id) || !r.get_str(op.fingerprint) || !r.done()) {
        return corrupt("malformed replace op");
      }
      return op;
    }
  }
  return corrupt("unknown op kind");
}

auto encode_snapshot(const snapshot_image& img) -> std::vector<std::uint8_t> {
  byte_writer w;
  for (char c : SNAPSHOT_MAGIC) w.put_u8(static_cast<std::uint8_t>(c));
  w.put_u32(SNAPSHOT_VERSION);
  w.put_u64(img.last_lsn);
  w.put_u64(img.next_seq);
  w.put_u64(img.next_txn);
  w.put_u32(static_cast<std::uint32_t>(img.documents.size()));
  for (const auto& [id, fp] : img.documents) { w.put_str(id); w.put_str(fp); }
  w.put_u64(img.records.size());
  for (const auto& [seq, rec] : img.records) { w.put_u64(seq); w.put_record(rec); }
  const std::uint32_t crc = wal::crc32c(w.bytes());
  w.put_u32(crc);
  return std::move(w.bytes());
}

auto decode_snapshot(std::span<const std::uint8_t> bytes) -> std::expected<snapshot_image, core::error> {
  auto corrupt = [](const char* what) {
    return core::make_unexpected(core::error_code::data_integrity, what, "index.snapshot");
  };
  if (bytes.size() < sizeof(SNAPSHOT_MAGIC) + 4 + 4) return corrupt("snapshot too short");
  const auto stored_crc = core::load_le<std::uint32_t>(bytes.data() + bytes.size() - 4);
  const auto body = bytes.first(bytes.size() - 4);
  if (wal::crc32c(body) != stored_crc) return corrupt("snapshot crc mismatch");
  if (std::memcmp(body.data(), SNAPSHOT_MAGIC, sizeof(SNAPSHOT_MAGIC)) != 0) return corrupt("bad snapshot magic");

  byte_reader r(body.subspan(sizeof(SNAPSHOT_MAGIC)));
  snapshot_image img;
  std::uint32_t version = 0, ndocs = 0;
  std::uint64_t nrecords = 0;
  if (!r.get_u32(version) || version != SNAPSHOT_VERSION) return corrupt("unsupported snapshot version");
  if (!r.get_u64(img.last_lsn) || !r.get_u64(img.next_seq) || !r.get_u64(img.next_txn) || !r.get_u32(ndocs)) {
    return corrupt("truncated snapshot header");
  }
  for (std::uint32_t i = 0; i < ndocs; ++i) {
    std::string id, fp;
    if (!r.get_str(id) || !r.get_str(fp)) return corrupt("truncated document table");
    img.documents.emplace_back(std::move(id), std::move(fp));
  }
  if (!r.get_u64(nrecords)) return corrupt("truncated record count");
  for (std::uint64_t i = 0; i < nrecords; ++i) {
    std::uint64_t seq = 0;
    record rec;
    if (!r.get_u64(seq) || !r.get_record(rec)) return corrupt("truncated record");
    img.records.emplace_back(seq, std::move(rec));
  }
  if (!r.done()) return corrupt("trailing bytes in snapshot");
  return img;
}

} // namespace gleaner::detail
