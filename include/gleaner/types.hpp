#pragma once

/**
 * \file types.hpp
 * \brief Value types shared by the chunker, embedder, index and retriever.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gleaner {

/** \brief Similarity metric a collection compares vectors with. */
enum class metric : std::uint8_t { cosine = 0, inner_product = 1, euclidean = 2 };

auto to_string(metric m) noexcept -> std::string_view;
auto parse_metric(std::string_view name) -> std::optional<metric>;

/** \brief Identity of an embedding model: vectors from different identities are never compared. */
struct model_identity {
  std::string model_id;
  std::uint32_t dimension{};
  metric native_metric{metric::cosine};

  friend bool operator==(const model_identity&, const model_identity&) = default;
};

/** \brief A contiguous passage of a document sized for embedding. */
struct chunk {
  std::uint32_t sequence_index{};  /**< position within the document, 0-based */
  std::string text;
  std::size_t start_offset{};      /**< byte offset into the source text (inclusive) */
  std::size_t end_offset{};        /**< byte offset into the source text (exclusive) */

  std::size_t length() const noexcept { return end_offset - start_offset; }
  friend bool operator==(const chunk&, const chunk&) = default;
};

/** \brief Stable chunk key inside a collection: "<document_id>#<sequence_index>". */
auto make_chunk_id(std::string_view document_id, std::uint32_t sequence_index) -> std::string;

/** \brief One persisted entry of the vector index. */
struct record {
  std::string chunk_id;
  std::string document_id;
  std::uint32_t sequence_index{};
  std::uint64_t start_offset{};
  std::uint64_t end_offset{};
  std::string text;
  std::string model_id;
  std::vector<float> vector;
  std::unordered_map<std::string, std::string> tags;  /**< filterable string attributes */
};

/** \brief One query hit: higher score is more relevant. */
struct hit {
  std::string chunk_id;
  float score{};
};

/** \brief One ranked grounding passage handed to a generator. */
struct passage {
  std::string chunk_id;
  std::string document_id;
  std::string filename;
  std::uint32_t sequence_index{};
  std::string text;
  float score{};
};

/** \brief Ranked passages for one query; never persisted. */
struct retrieval_result {
  std::string collection;
  std::vector<passage> passages;

  bool empty() const noexcept { return passages.empty(); }
  std::size_t size() const noexcept { return passages.size(); }
};

} // namespace gleaner
