#pragma once

/** \file chunker.hpp
 *  \brief Splits normalized document text into overlapping passages.
 *
 * Break policy: the chunk end is searched in the last 20% of the size window
 * (at least one byte). A paragraph break wins over a sentence end, which wins
 * over a word boundary; within a class the candidate nearest chunk_size wins.
 * Without any candidate the chunk is cut hard at chunk_size. Chunk text is
 * trimmed of surrounding whitespace and offsets describe the trimmed span.
 *
 * Sizes and offsets are in bytes of the UTF-8 input ("characters" for ASCII).
 * Pure function of (text, config): no randomness, no global state.
 */

#include <cstddef>
#include <expected>
#include <string_view>
#include <vector>

#include "gleaner/error.hpp"
#include "gleaner/types.hpp"

namespace gleaner {

struct chunker_config {
  std::size_t chunk_size{1000};   /**< max characters per chunk, > 0 */
  std::size_t overlap{200};       /**< characters shared by consecutive chunks, < chunk_size */
  std::size_t min_chunk_size{0};  /**< trailing fragments below this are dropped unless alone */
};

/** \brief config_invalid when the configuration cannot produce chunks. */
auto validate(const chunker_config& cfg) -> std::expected<void, core::error>;

/** \brief Chunks text; empty or whitespace-only text yields an empty sequence. */
auto chunk_text(std::string_view text, const chunker_config& cfg)
    -> std::expected<std::vector<chunk>, core::error>;

} // namespace gleaner
