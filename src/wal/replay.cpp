#include "gleaner/wal/replay.hpp"

#include <algorithm>
#include <cstring>
#include <map>

#include "gleaner/core/byte_order.hpp"

namespace gleaner::wal {

auto txn_payload(std::uint64_t txn_id, std::span<const std::uint8_t> body) -> std::vector<std::uint8_t> {
  std::vector<std::uint8_t> out(8 + body.size());
  core::store_le(out.data(), txn_id);
  if (!body.empty()) std::memcpy(out.data() + 8, body.data(), body.size());
  return out;
}

auto replay_committed(const std::filesystem::path& dir, std::uint64_t cutoff_lsn, const TxnCallback& on_txn)
    -> std::expected<ReplayStats, core::error> {
  using core::error_code;
  ReplayStats stats{};
  // Ordered so leftovers are reported deterministically.
  std::map<std::uint64_t, std::vector<std::vector<std::uint8_t>>> open;

  auto scan = recover_scan_dir(dir, cutoff_lsn, [&](const frame& f) -> std::expected<void, core::error> {
    if (f.payload.size() < 8) {
      return core::make_unexpected(error_code::data_integrity, "frame without transaction id", "index.wal.replay");
    }
    const auto txn = core::load_le<std::uint64_t>(f.payload.data());
    stats.max_txn_id = std::max(stats.max_txn_id, txn);
    const auto body = f.payload.subspan(8);
    switch (f.type) {
      case frame_type::op:
        open[txn].emplace_back(body.begin(), body.end());
        return {};
      case frame_type::commit: {
        committed_txn t{txn, f.lsn, {}};
        if (auto it = open.find(txn); it != open.end()) {
          t.ops = std::move(it->second);
          open.erase(it);
        }
        stats.committed++;
        return on_txn(t);
      }
      case frame_type::abort:
        open.erase(txn);
        stats.aborted++;
        return {};
    }
    return core::make_unexpected(error_code::data_integrity, "unknown frame type", "index.wal.replay");
  });
  if (!scan) return std::unexpected(scan.error());
  stats.scan = *scan;
  stats.incomplete = open.size();
  return stats;
}

} // namespace gleaner::wal
