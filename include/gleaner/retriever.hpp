#pragma once

/**
 * \file retriever.hpp
 * \brief Query path: embed the question, rank indexed passages, assemble grounding context.
 *
 * Ranking: the index is asked for top_k * overfetch_factor candidates; the
 * per-document cap and the score floor are applied in index order; the
 * survivors are truncated to top_k. The result order is the index order, so it
 * is descending by score with insertion order breaking ties.
 *
 * An unknown or empty collection yields an empty result. An embedding failure
 * is returned as an error, never as an empty result.
 */

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "gleaner/embedder.hpp"
#include "gleaner/error.hpp"
#include "gleaner/index_store.hpp"
#include "gleaner/types.hpp"

namespace gleaner {

struct retriever_options {
  std::size_t top_k{4};
  std::size_t overfetch_factor{2};           /**< >= 1 */
  std::size_t max_chunks_per_document{0};    /**< 0: unlimited */
  std::optional<float> min_score;
};

class retriever {
public:
  retriever(const index_store& index, embedder emb, retriever_options opts = {});

  /** \brief Ranked passages for query in collection, using the configured top_k and min_score. */
  auto retrieve(const std::string& query, const std::string& collection) const
      -> std::expected<retrieval_result, core::error>;

  auto retrieve(const std::string& query, const std::string& collection, std::size_t top_k,
                std::optional<float> min_score = std::nullopt) const
      -> std::expected<retrieval_result, core::error>;

  /** \brief Stored chunks of the given documents joined by blank lines, at most max_chunks of them. */
  auto document_context(const std::string& collection, const std::vector<std::string>& document_ids,
                        std::size_t max_chunks = 20) const -> std::expected<std::string, core::error>;

  const retriever_options& options() const noexcept { return opts_; }

private:
  const index_store& index_;
  embedder embedder_;
  retriever_options opts_;
};

/** \brief Passages joined by blank lines in rank order; stops before exceeding max_chars (0: unlimited). */
auto assemble_context(const retrieval_result& result, std::size_t max_chars = 0) -> std::string;

/** \brief Distinct source filenames in rank order. */
auto sources(const retrieval_result& result) -> std::vector<std::string>;

/** \brief The downstream text generation capability. */
class generation_model {
public:
  virtual ~generation_model() = default;
  virtual auto generate(const std::string& query, const std::vector<passage>& passages)
      -> std::expected<std::string, core::error> = 0;
};

struct answer {
  std::string text;
  std::vector<std::string> sources;
  retrieval_result grounding;
};

/** \brief Retrieves grounding passages and hands them to the generator. */
auto answer_query(const retriever& r, generation_model& generator, const std::string& query,
                  const std::string& collection) -> std::expected<answer, core::error>;

} // namespace gleaner
