#pragma once

/** \file replay.hpp
 *  \brief Transaction-aware recovery replay built atop directory scanning.
 *
 * Every frame payload starts with a little-endian u64 transaction id. Op frames
 * are buffered per transaction; a commit frame delivers the transaction's ops
 * in log order; an abort frame, or the end of the log, discards them. Delivery
 * order is commit order, which is the order the live index applied them in.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

#include "gleaner/error.hpp"
#include "gleaner/wal/io.hpp"

namespace gleaner::wal {

struct committed_txn {
  std::uint64_t txn_id{};
  std::uint64_t commit_lsn{};
  std::vector<std::vector<std::uint8_t>> ops; /**< op bodies, transaction id stripped */
};

struct ReplayStats {
  RecoveryStats scan{};
  std::size_t committed{};
  std::size_t aborted{};
  std::size_t incomplete{};    /**< transactions with ops but no commit/abort */
  std::uint64_t max_txn_id{};
};

using TxnCallback = std::function<std::expected<void, core::error>(const committed_txn&)>;

/** \brief Prefixes an op body (or an empty body for commit/abort) with its transaction id. */
auto txn_payload(std::uint64_t txn_id, std::span<const std::uint8_t> body = {}) -> std::vector<std::uint8_t>;

/** \brief Replays committed transactions with frames newer than cutoff_lsn. */
[[nodiscard]] auto replay_committed(const std::filesystem::path& dir, std::uint64_t cutoff_lsn,
                                    const TxnCallback& on_txn)
    -> std::expected<ReplayStats, core::error>;

} // namespace gleaner::wal
