#pragma once

/** \file config.hpp
 *  \brief Library settings: defaults, YAML file loading, environment overrides, validation.
 *
 * File layout (every key optional, unknown keys ignored):
 *   store:     { path, durability, wal_max_file_bytes, checkpoint_wal_bytes, lock_timeout_ms }
 *   chunking:  { chunk_size, overlap, min_chunk_size }
 *   embedding: { model_id, dimension, max_batch_size, timeout_ms, normalize }
 *   ingestion: { max_attempts, initial_backoff_ms, multiplier, max_backoff_ms,
 *                embed_batch_size, default_collection }
 *   retrieval: { top_k, overfetch_factor, max_chunks_per_document, min_score }
 *   logging:   { level, file }
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <optional>

#include "gleaner/chunker.hpp"
#include "gleaner/embedder.hpp"
#include "gleaner/error.hpp"
#include "gleaner/index_store.hpp"
#include "gleaner/ingestion.hpp"
#include "gleaner/logging.hpp"
#include "gleaner/retriever.hpp"

namespace gleaner {

/** \brief Which local model to build and how to drive it. */
struct embedding_settings {
  std::string model_id{"gleaner-hashing-v1"};
  std::uint32_t dimension{384};
  embedder_options options{};
};

struct settings {
  store_settings store{};
  chunker_config chunking{};
  embedding_settings embedding{};
  retry_policy retry{};
  ingestion_options ingestion{};
  retriever_options retrieval{};
  log::logging_settings logging{};
};

auto parse_durability(std::string_view name) -> std::optional<wal::DurabilityProfile>;

/** \brief Defaults overlaid with the YAML file at path; config_invalid if missing or malformed. */
auto load_settings(const std::filesystem::path& path) -> std::expected<settings, core::error>;

/** \brief Applies GLEANER_* environment variables; config_invalid on unparsable numbers. */
auto apply_env_overrides(settings& s) -> std::expected<void, core::error>;

/** \brief config_invalid naming the first inconsistent setting. */
auto validate(const settings& s) -> std::expected<void, core::error>;

} // namespace gleaner
