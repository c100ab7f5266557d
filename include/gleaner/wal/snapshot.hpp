#pragma once

/** \file snapshot.hpp
 *  \brief Atomic whole-file replacement used for snapshots and collection metadata.
 *
 * Atomic, durable save:
 * - Write contents to a temporary sibling file (<name>.tmp) in the same directory
 * - Flush and fsync the temporary file
 * - Atomically replace the destination with rename(2)
 * - Best-effort fsync of the parent directory
 * On failure the temporary file is removed and io_failed is returned; the
 * destination keeps its previous contents.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <span>
#include <vector>

#include "gleaner/error.hpp"

namespace gleaner::wal {

auto write_file_atomic(const std::filesystem::path& dst, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error>;

/** Reads a whole file; not_found if it does not exist. */
auto read_file(const std::filesystem::path& src)
    -> std::expected<std::vector<std::uint8_t>, core::error>;

} // namespace gleaner::wal
