#pragma once

/**
 * \file index_store.hpp
 * \brief Durable vector index: named collections of embedded chunk records.
 *
 * Each collection lives in its own directory under the store path:
 *   collection.meta    model identity the collection was created with
 *   records.snapshot   last checkpointed image of all records
 *   wal-XXXXXXXX.log   transactions committed since that image
 *
 * Thread-safety: every member is safe to call concurrently. Queries take a
 * shared lock on the collection and never observe a half-applied document.
 * Writers of the same document are serialized; writers of different documents
 * hold independent per-document locks and only serialize on the short log
 * append and commit steps. Errors are propagated via
 * std::expected; no exceptions escape the public API.
 *
 * Lock order: document lock, then WAL mutex, then collection state lock.
 */

#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "gleaner/error.hpp"
#include "gleaner/filter_expr.hpp"
#include "gleaner/types.hpp"
#include "gleaner/wal/io.hpp"

namespace gleaner {

/** \brief Storage knobs for an index_store. */
struct store_settings {
  std::filesystem::path path{"gleaner-data"};
  wal::DurabilityProfile durability{wal::DurabilityProfile::RotationAndFlush};
  std::uint64_t wal_max_file_bytes{16ull * 1024 * 1024};
  /** WAL bytes written since the last checkpoint that trigger a new one; 0 disables. */
  std::uint64_t checkpoint_wal_bytes{64ull * 1024 * 1024};
  /** Upper bound on waiting for any index lock; expiry yields error_code::timeout. */
  std::chrono::milliseconds lock_timeout{10'000};
};

struct collection_stats {
  model_identity identity;
  std::size_t chunks{};
  std::size_t documents{};
  std::uint64_t last_lsn{};
};

/** \brief A ranked record, copied out of the index together with its score. */
struct scored_record {
  record rec;
  float score{};
};

class index_store;

namespace detail { struct collection_state; }

/**
 * \brief All-or-nothing replacement of one document's chunk set.
 *
 * Staged records are written to the log but stay invisible until commit().
 * Commit replaces every chunk the document had before with the staged set in
 * one step. A writer destroyed without commit() aborts.
 */
class document_writer {
public:
  document_writer(document_writer&&) noexcept;
  document_writer& operator=(document_writer&&) noexcept;
  document_writer(const document_writer&) = delete;
  document_writer& operator=(const document_writer&) = delete;
  ~document_writer();

  /** \brief Validates and logs records; on error nothing is staged. */
  auto stage(std::span<const record> records) -> std::expected<void, core::error>;

  /** \brief Publishes the staged set; returns the document's chunk count. */
  auto commit() -> std::expected<std::size_t, core::error>;

  /** \brief Discards the staged set; the previous version stays untouched. */
  auto abort() -> std::expected<void, core::error>;

  /**
   * \brief Discards the staged set and deletes the previously committed version
   * before the document lock is released; returns how many chunks were removed.
   */
  auto retract() -> std::expected<std::size_t, core::error>;

  const std::string& document_id() const noexcept;
  std::size_t staged() const noexcept;

private:
  friend class index_store;
  struct impl;
  explicit document_writer(std::unique_ptr<impl> p);
  std::unique_ptr<impl> impl_;
};

/** \brief Persistent multi-collection vector index. */
class index_store {
public:
  /**
   * \brief Open or create a store; recovers every collection found on disk.
   * Recovery loads the snapshot, truncates a torn log tail and replays only
   * committed transactions.
   */
  static auto open(store_settings settings) -> std::expected<std::unique_ptr<index_store>, core::error>;

  ~index_store();
  index_store(const index_store&) = delete;
  index_store& operator=(const index_store&) = delete;

  /** \brief Flushes and closes every collection log; further calls fail with precondition_failed. */
  auto close() -> std::expected<void, core::error>;

  /**
   * \brief Creates the collection bound to identity, or verifies that an existing
   * one was created with the same identity (dimension_mismatch otherwise).
   */
  auto ensure_collection(const std::string& name, const model_identity& identity)
      -> std::expected<void, core::error>;

  auto has_collection(const std::string& name) const -> bool;
  auto list_collections() const -> std::vector<std::string>;
  auto drop_collection(const std::string& name) -> std::expected<void, core::error>;

  /** \brief Inserts or replaces one record by chunk_id. */
  auto upsert(const std::string& collection, const record& rec) -> std::expected<void, core::error>;

  /** \brief Starts replacing a document; blocks while another writer holds the same document. */
  auto begin_document(const std::string& collection, const std::string& document_id,
                      const std::string& fingerprint) -> std::expected<document_writer, core::error>;

  /** \brief Deletes every chunk of a document; returns how many were removed. */
  auto remove_document(const std::string& collection, const std::string& document_id)
      -> std::expected<std::size_t, core::error>;

  /**
   * \brief Top-k records by similarity, highest score first.
   * Scores: cosine similarity, inner product, or negated squared L2 distance.
   * Equal scores keep insertion order.
   */
  auto query(const std::string& collection, std::span<const float> vector, std::size_t k,
             const filter_expr* filter = nullptr) const
      -> std::expected<std::vector<hit>, core::error>;

  /**
   * \brief Like query(), but returns full records ranked and copied under the
   * same lock, so every record belongs to one committed image of the collection.
   */
  auto search(const std::string& collection, std::span<const float> vector, std::size_t k,
              const filter_expr* filter = nullptr) const
      -> std::expected<std::vector<scored_record>, core::error>;

  auto get(const std::string& collection, const std::string& chunk_id) const
      -> std::expected<record, core::error>;

  /** \brief Chunks of the given documents in document then sequence order; limit 0 means all. */
  auto document_chunks(const std::string& collection, const std::vector<std::string>& document_ids,
                       std::size_t limit = 0) const
      -> std::expected<std::vector<record>, core::error>;

  /** \brief Fingerprint the document was last committed with; nullopt if absent. */
  auto document_fingerprint(const std::string& collection, const std::string& document_id) const
      -> std::expected<std::optional<std::string>, core::error>;

  auto stats(const std::string& collection) const -> std::expected<collection_stats, core::error>;

  /**
   * \brief Writes a snapshot and purges the log it covers.
   * precondition_failed while a document writer is open on the collection.
   */
  auto checkpoint(const std::string& collection) -> std::expected<void, core::error>;

  const store_settings& settings() const noexcept { return settings_; }

private:
  explicit index_store(store_settings settings);

  auto find(const std::string& name) const
      -> std::expected<std::shared_ptr<detail::collection_state>, core::error>;

  using ranked_fn = std::function<void(const record&, float)>;
  auto rank(const std::string& collection, std::span<const float> vector, std::size_t k,
            const filter_expr* filter, const ranked_fn& emit) const -> std::expected<void, core::error>;

  store_settings settings_;
  mutable std::shared_mutex catalog_mu_;
  std::unordered_map<std::string, std::shared_ptr<detail::collection_state>> collections_;
  bool closed_{false};
};

} // namespace gleaner
