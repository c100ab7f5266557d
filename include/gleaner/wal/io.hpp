#pragma once

/** \file io.hpp
 *  \brief WAL writer and recovery scan (binary file IO). Little-endian framing.
 *
 * Notes
 * - The writer is not thread-safe; the owner serializes appends.
 * - Files are named <prefix><8-digit seq>.log; a writer always starts a fresh
 *   file on open, so an existing tail is never appended to.
 * - recover_scan is read-only and reentrant for independent paths.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <fstream>
#include <functional>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "gleaner/error.hpp"
#include "gleaner/wal/frame.hpp"

namespace gleaner::wal {

struct RecoveryStats {
  std::size_t frames{};        /**< number of delivered frames */
  std::size_t bytes{};         /**< bytes of valid frames scanned */
  std::uint64_t last_lsn{};    /**< LSN of the last valid frame */
  bool torn_tail{false};       /**< trailing bytes that do not form a valid frame */
};

struct WalWriterStats {
  std::uint64_t frames{};
  std::uint64_t rotations{};
  std::uint64_t flushes{};
  std::uint64_t syncs{};
  std::uint64_t bytes{};       /**< bytes appended since open */
};

/** Durability profiles map to fsync knobs. */
enum class DurabilityProfile { None, Rotation, Flush, RotationAndFlush };

struct WalWriterOptions {
  std::filesystem::path dir;       /**< directory holding the log files */
  std::string prefix{"wal-"};
  std::uint64_t max_file_bytes{16ull * 1024 * 1024}; /**< rotate before exceeding; 0 disables */
  DurabilityProfile durability{DurabilityProfile::RotationAndFlush};
};

class WalWriter {
public:
  WalWriter() = default;
  ~WalWriter();
  WalWriter(WalWriter&&) noexcept = default;
  WalWriter& operator=(WalWriter&&) noexcept = default;
  WalWriter(const WalWriter&) = delete;
  WalWriter& operator=(const WalWriter&) = delete;

  static auto open(const WalWriterOptions& opts) -> std::expected<WalWriter, core::error>;

  auto append(std::uint64_t lsn, frame_type type, std::span<const std::uint8_t> payload)
      -> std::expected<void, core::error>;

  /** Flush buffered data; syncs when sync=true or the profile asks for it. */
  auto flush(bool sync = false) -> std::expected<void, core::error>;

  /** Close the current file and continue in a new one. */
  auto rotate() -> std::expected<void, core::error>;

  const std::filesystem::path& path() const noexcept { return path_; }
  std::uint64_t index() const noexcept { return seq_index_; }
  const WalWriterStats& stats() const noexcept { return stats_; }

private:
  std::filesystem::path dir_;
  std::filesystem::path path_;
  std::string prefix_{"wal-"};
  std::uint64_t max_file_bytes_{};
  bool fsync_on_rotation_{};
  bool fsync_on_flush_{};
  std::uint64_t seq_index_{};
  std::uint64_t cur_bytes_{};
  WalWriterStats stats_{};
  std::ofstream out_;

  auto open_seq(std::uint64_t seq) -> std::expected<void, core::error>;
};

using FrameCallback = std::function<std::expected<void, core::error>(const frame&)>;

/** Log files in dir with the given prefix, ascending by sequence number. */
auto list_wal_files(const std::filesystem::path& dir, const std::string& prefix = "wal-")
    -> std::vector<std::pair<std::uint64_t, std::filesystem::path>>;

// Sequentially scans a WAL file and invokes on_frame for each valid frame.
// Stops on a torn/truncated tail without error; a callback error stops the scan.
[[nodiscard]] auto recover_scan(const std::filesystem::path& path, const FrameCallback& on_frame)
    -> std::expected<RecoveryStats, core::error>;

// Scans every log file of dir in sequence order, delivering frames with lsn > cutoff_lsn.
// A torn file that is not the last one is a data_integrity error.
[[nodiscard]] auto recover_scan_dir(const std::filesystem::path& dir, std::uint64_t cutoff_lsn,
                                    const FrameCallback& on_frame, const std::string& prefix = "wal-")
    -> std::expected<RecoveryStats, core::error>;

// Truncates a torn tail off the newest log file. Returns true if bytes were removed.
[[nodiscard]] auto repair_torn_tail(const std::filesystem::path& dir, const std::string& prefix = "wal-")
    -> std::expected<bool, core::error>;

// Deletes log files with sequence < before_seq whose frames all have lsn <= up_to_lsn.
[[nodiscard]] auto purge_wal(const std::filesystem::path& dir, std::uint64_t up_to_lsn,
                             std::uint64_t before_seq, const std::string& prefix = "wal-")
    -> std::expected<std::size_t, core::error>;

namespace detail {
auto fsync_file_path(const std::filesystem::path& p) -> std::expected<void, core::error>;
void fsync_dir_path(const std::filesystem::path& dir) noexcept;
} // namespace detail

} // namespace gleaner::wal
