#pragma once

/**
 * \file ingestion.hpp
 * \brief Document ingestion: chunk, embed and index one document all-or-nothing.
 *
 * State machine per document: pending -> chunked -> indexed, or pending|chunked -> failed.
 * A document is either fully indexed or has no chunks in the index at all:
 * records are staged into an index transaction and become visible together on
 * commit; any failure aborts the transaction and removes the document while
 * the document lock is still held.
 *
 * Expected failures (empty text, embedding unavailable after retries, index
 * mismatch) are reported through the returned document's status. Only
 * unclassified failures surface as an ingestion_failed error.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "gleaner/chunker.hpp"
#include "gleaner/embedder.hpp"
#include "gleaner/error.hpp"
#include "gleaner/index_store.hpp"

namespace gleaner {

enum class ingest_stage : std::uint8_t { chunk, embed, index };

auto to_string(ingest_stage s) noexcept -> std::string_view;

struct pending_status {};
struct chunked_status { std::size_t chunk_count{}; };
struct indexed_status { std::size_t chunk_count{}; std::string model_id; };
struct failed_status {
  core::error_code code{core::error_code::internal};
  std::string message;
  ingest_stage stage{ingest_stage::chunk};
};

using document_status = std::variant<pending_status, chunked_status, indexed_status, failed_status>;

/** \brief "pending", "chunked", "indexed" or "failed". */
auto status_name(const document_status& s) noexcept -> std::string_view;

/** \brief An uploaded source document with already-extracted text. */
struct document {
  std::string id;            /**< empty: derived from filename */
  std::string filename;
  std::string collection;    /**< empty: the pipeline's default collection */
  std::string text;
  std::string content_hash;  /**< empty: computed from text */
  std::chrono::system_clock::time_point uploaded_at{};
  document_status status{pending_status{}};

  bool indexed() const noexcept { return std::holds_alternative<indexed_status>(status); }
  bool failed() const noexcept { return std::holds_alternative<failed_status>(status); }
};

/** \brief Bounded retry with exponential backoff for transient embedding and index failures. */
struct retry_policy {
  std::uint32_t max_attempts{3};                    /**< total attempts, >= 1 */
  std::chrono::milliseconds initial_backoff{200};
  double multiplier{2.0};
  std::chrono::milliseconds max_backoff{5000};

  /** Delay after failed attempt `attempt` (1-based). */
  auto backoff(std::uint32_t attempt) const -> std::chrono::milliseconds;
};

struct ingestion_options {
  std::size_t embed_batch_size{32};   /**< chunks per embedding call; retried as a unit */
  std::string default_collection{"faculty_documents"};
};

class ingestion_pipeline {
public:
  using sleep_fn = std::function<void(std::chrono::milliseconds)>;
  using status_listener = std::function<void(const document&)>;

  ingestion_pipeline(index_store& index, embedder emb, chunker_config chunking = {},
                     retry_policy retry = {}, ingestion_options opts = {});

  /** \brief Replaces the sleep used between retries (tests pass a recorder). */
  void set_sleep(sleep_fn fn) { sleep_ = std::move(fn); }

  /** \brief Called on every status transition. */
  void set_status_listener(status_listener fn) { listener_ = std::move(fn); }

  /**
   * \brief Ingests one document and returns it with its final status.
   * Re-ingesting unchanged content of an indexed document is a no-op; changed
   * content replaces the previous chunk set.
   */
  auto ingest(document doc) -> std::expected<document, core::error>;

  /** \brief Removes the document's chunks from its collection; returns how many. */
  auto remove(const document& doc) -> std::expected<std::size_t, core::error>;

  const chunker_config& chunking() const noexcept { return chunking_; }
  const retry_policy& retry() const noexcept { return retry_; }

private:
  struct stage_failure {
    ingest_stage stage;
    core::error error;
  };

  auto run(document& doc) -> std::expected<void, core::error>;
  auto write_document(const document& doc, const std::vector<chunk>& chunks, std::vector<record>& prepared,
                      document_writer& writer) -> std::expected<std::size_t, stage_failure>;
  void wait_before_retry(const document& doc, std::uint32_t attempt, const core::error& e);
  auto embed_with_retry(const std::string& doc_id, std::span<const std::string> texts)
      -> std::expected<std::vector<embedding>, core::error>;
  void transition(document& doc, document_status s);
  void fail(document& doc, ingest_stage stage, const core::error& e);
  auto resolve(document& doc) const -> std::expected<void, core::error>;
  auto rollback(document& doc, document_writer& writer) -> std::expected<void, core::error>;

  index_store& index_;
  embedder embedder_;
  chunker_config chunking_;
  retry_policy retry_;
  ingestion_options opts_;
  sleep_fn sleep_;
  status_listener listener_;
};

} // namespace gleaner
