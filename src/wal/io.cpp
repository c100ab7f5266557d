#include "gleaner/wal/io.hpp"

#include <algorithm>
#include <charconv>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string_view>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#elif defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace gleaner::wal {

namespace detail {

auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, core::error> {
  using core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return core::make_unexpected(error_code::io_failed, "fsync open failed", "index.wal.io");
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return core::make_unexpected(error_code::io_failed, "fsync failed", "index.wal.io");
  }
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h == INVALID_HANDLE_VALUE) {
    return core::make_unexpected(error_code::io_failed, "fsync open failed", "index.wal.io");
  }
  BOOL ok = ::FlushFileBuffers(h);
  ::CloseHandle(h);
  if (!ok) {
    return core::make_unexpected(error_code::io_failed, "FlushFileBuffers failed", "index.wal.io");
  }
#endif
  return {};
}

// Best-effort: directory metadata durability is not portable.
void fsync_dir_path(const std::filesystem::path& dir) noexcept {
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(dir.string().c_str(), O_RDONLY);
  if (fd < 0) return;
  (void)::fsync(fd);
  (void)::close(fd);
#else
  (void)dir;
#endif
}

} // namespace detail

namespace {

constexpr std::string_view LOG_SUFFIX = ".log";
constexpr std::size_t SEQ_DIGITS = 8;

// <prefix><8 digits>.log
auto parse_seq(std::string_view name, std::string_view prefix) -> std::optional<std::uint64_t> {
  if (name.size() != prefix.size() + SEQ_DIGITS + LOG_SUFFIX.size()) return std::nullopt;
  if (!name.starts_with(prefix) || !name.ends_with(LOG_SUFFIX)) return std::nullopt;
  const auto digits = name.substr(prefix.size(), SEQ_DIGITS);
  std::uint64_t seq = 0;
  const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), seq);
  if (ec != std::errc{} || end != digits.data() + digits.size()) return std::nullopt;
  return seq;
}

auto file_name(std::string_view prefix, std::uint64_t seq) -> std::string {
  std::ostringstream oss;
  oss << prefix << std::setw(static_cast<int>(SEQ_DIGITS)) << std::setfill('0') << seq << LOG_SUFFIX;
  return oss.str();
}

auto ignore_frame(const frame&) -> std::expected<void, core::error> { return {}; }

auto read_exact(std::ifstream& in, std::vector<std::uint8_t>& buf, std::size_t n) -> bool {
  buf.resize(n);
  in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(n));
  return static_cast<std::size_t>(in.gcount()) == n;
}

} // namespace

WalWriter::~WalWriter() {
  if (out_.is_open()) {
    out_.flush();
    out_.close();
  }
}

auto WalWriter::open(const WalWriterOptions& opts) -> std::expected<WalWriter, core::error> {
  using core::error_code;
  WalWriter w;
  w.dir_ = opts.dir;
  w.prefix_ = opts.prefix;
  w.max_file_bytes_ = opts.max_file_bytes;
  w.fsync_on_rotation_ = opts.durability == DurabilityProfile::Rotation ||
                         opts.durability == DurabilityProfile::RotationAndFlush;
  w.fsync_on_flush_ = opts.durability == DurabilityProfile::Flush ||
                      opts.durability == DurabilityProfile::RotationAndFlush;
  std::error_code ec;
  std::filesystem::create_directories(w.dir_, ec);
  if (ec) return core::make_unexpected(error_code::io_failed, "mkdir failed: " + ec.message(), "index.wal.io");

  std::uint64_t max_seq = 0;
  for (const auto& [seq, p] : list_wal_files(w.dir_, w.prefix_)) max_seq = std::max(max_seq, seq);
  if (auto r = w.open_seq(max_seq + 1); !r) return std::unexpected(r.error());
  return w;
}

auto WalWriter::open_seq(std::uint64_t seq) -> std::expected<void, core::error> {
  using core::error_code;
  if (out_.is_open()) {
    out_.flush();
    out_.close();
    if (fsync_on_rotation_) {
      if (auto r = detail::fsync_file_path(path_); !r) return std::unexpected(r.error());
      stats_.syncs++;
    }
    stats_.rotations++;
  }
  seq_index_ = seq;
  path_ = dir_ / file_name(prefix_, seq);
  out_.open(path_, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!out_.good()) return core::make_unexpected(error_code::io_failed, "open seq failed", "index.wal.io");
  if (fsync_on_rotation_) detail::fsync_dir_path(dir_);
  cur_bytes_ = 0;
  return {};
}

auto WalWriter::rotate() -> std::expected<void, core::error> {
  return open_seq(seq_index_ + 1);
}

auto WalWriter::append(std::uint64_t lsn, frame_type type, std::span<const std::uint8_t> payload)
    -> std::expected<void, core::error> {
  using core::error_code;
  auto enc = encode_frame(lsn, type, payload);
  if (!enc) return std::unexpected(enc.error());
  const auto& bytes = *enc;
  if (max_file_bytes_ > 0 && cur_bytes_ > 0 && cur_bytes_ + bytes.size() > max_file_bytes_) {
    if (auto r = open_seq(seq_index_ + 1); !r) return std::unexpected(r.error());
  }
  if (!out_.good()) return core::make_unexpected(error_code::io_failed, "writer closed", "index.wal.io");
  out_.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  if (!out_.good()) return core::make_unexpected(error_code::io_failed, "write failed", "index.wal.io");
  cur_bytes_ += bytes.size();
  stats_.bytes += bytes.size();
  stats_.frames++;
  return {};
}

auto WalWriter::flush(bool sync) -> std::expected<void, core::error> {
  using core::error_code;
  if (!out_.good()) return core::make_unexpected(error_code::io_failed, "writer closed", "index.wal.io");
  out_.flush();
  if (!out_.good()) return core::make_unexpected(error_code::io_failed, "flush failed", "index.wal.io");
  stats_.flushes++;
  if (sync || fsync_on_flush_) {
    if (auto r = detail::fsync_file_path(path_); !r) return std::unexpected(r.error());
    stats_.syncs++;
  }
  return {};
}

auto list_wal_files(const std::filesystem::path& dir, const std::string& prefix)
    -> std::vector<std::pair<std::uint64_t, std::filesystem::path>> {
  std::vector<std::pair<std::uint64_t, std::filesystem::path>> files;
  std::error_code ec;
  for (auto it = std::filesystem::directory_iterator(dir, ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file()) continue;
    if (auto seq = parse_seq(it->path().filename().string(), prefix)) files.emplace_back(*seq, it->path());
  }
  std::sort(files.begin(), files.end(), [](const auto& a, const auto& b){ return a.first < b.first; });
  return files;
}

auto recover_scan(const std::filesystem::path& p, const FrameCallback& on_frame)
    -> std::expected<RecoveryStats, core::error> {
  using core::error_code;
  RecoveryStats stats{};
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) return core::make_unexpected(error_code::not_found, "open failed", "index.wal.io");
  std::error_code fec;
  const auto file_sz = std::filesystem::file_size(p, fec);
  if (fec) return core::make_unexpected(error_code::io_failed, "stat failed", "index.wal.io");

  std::vector<std::uint8_t> buf;
  while (stats.bytes < file_sz) {
    // Anything that fails to parse from here on is a torn tail.
    stats.torn_tail = true;
    if (!read_exact(in, buf, WAL_HEADER_SIZE)) break;
    auto hdr = parse_header(buf);
    if (!hdr || hdr->len > file_sz - stats.bytes) break;
    buf.resize(hdr->len);
    const auto rest = hdr->len - WAL_HEADER_SIZE;
    in.read(reinterpret_cast<char*>(buf.data() + WAL_HEADER_SIZE), static_cast<std::streamsize>(rest));
    if (static_cast<std::size_t>(in.gcount()) != rest) break;
    auto f = decode_frame(buf);
    if (!f) break;
    stats.torn_tail = false;

    if (auto r = on_frame(*f); !r) return std::unexpected(r.error());
    ++stats.frames;
    stats.bytes += hdr->len;
    stats.last_lsn = f->lsn;
  }
  return stats;
}

auto recover_scan_dir(const std::filesystem::path& dir, std::uint64_t cutoff_lsn,
                      const FrameCallback& on_frame, const std::string& prefix)
    -> std::expected<RecoveryStats, core::error> {
  using core::error_code;
  RecoveryStats agg{};
  const auto files = list_wal_files(dir, prefix);
  for (std::size_t i = 0; i < files.size(); ++i) {
    auto s = recover_scan(files[i].second, [&](const frame& f) -> std::expected<void, core::error> {
      if (f.lsn <= cutoff_lsn) return {};
      agg.frames += 1;
      return on_frame(f);
    });
    if (!s) return std::unexpected(s.error());
    if (s->torn_tail && i + 1 < files.size()) {
      return core::make_unexpected(error_code::data_integrity,
                                   "torn middle file " + files[i].second.filename().string(), "index.wal.io");
    }
    agg.bytes += s->bytes;
    if (s->last_lsn != 0) agg.last_lsn = std::max(agg.last_lsn, s->last_lsn);
    agg.torn_tail = s->torn_tail;
  }
  return agg;
}

auto repair_torn_tail(const std::filesystem::path& dir, const std::string& prefix)
    -> std::expected<bool, core::error> {
  using core::error_code;
  const auto files = list_wal_files(dir, prefix);
  if (files.empty()) return false;
  const auto& last = files.back().second;
  auto s = recover_scan(last, ignore_frame);
  if (!s) return std::unexpected(s.error());
  if (!s->torn_tail) return false;
  std::error_code ec;
  std::filesystem::resize_file(last, s->bytes, ec);
  if (ec) return core::make_unexpected(error_code::io_failed, "truncate torn tail failed", "index.wal.io");
  return true;
}

auto purge_wal(const std::filesystem::path& dir, std::uint64_t up_to_lsn,
               std::uint64_t before_seq, const std::string& prefix)
    -> std::expected<std::size_t, core::error> {
  using core::error_code;
  std::size_t removed = 0;
  for (const auto& [seq, p] : list_wal_files(dir, prefix)) {
    if (seq >= before_seq) break;
    auto s = recover_scan(p, ignore_frame);
    if (!s) return std::unexpected(s.error());
    if (s->last_lsn > up_to_lsn) continue;
    std::error_code ec;
    std::filesystem::remove(p, ec);
    if (ec) return core::make_unexpected(error_code::io_failed, "purge failed: " + ec.message(), "index.wal.io");
    ++removed;
  }
  if (removed > 0) detail::fsync_dir_path(dir);
  return removed;
}

} // namespace gleaner::wal
