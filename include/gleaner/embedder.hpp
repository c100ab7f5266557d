#pragma once

/** \file embedder.hpp
 *  \brief Adapter over an external embedding capability.
 *
 * The adapter batches, validates result shapes and enforces the caller's
 * deadline. It never retries: a failure is reported once as
 * embedding_unavailable or timeout and the caller owns the retry policy.
 * Thread-safety: embed() is safe to call concurrently if the model is.
 */

#include <chrono>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "gleaner/error.hpp"
#include "gleaner/types.hpp"

namespace gleaner {

using embedding = std::vector<float>;

/** \brief The external embedding capability: a fixed (model_id, dimension, metric). */
class embedding_model {
public:
  virtual ~embedding_model() = default;

  virtual auto identity() const -> const model_identity& = 0;

  /** One output vector per input text, in input order. The model should give up
   *  and report timeout once `timeout` has elapsed. */
  virtual auto embed_batch(std::span<const std::string> texts, std::chrono::milliseconds timeout)
      -> std::expected<std::vector<embedding>, core::error> = 0;
};

struct embedder_options {
  std::size_t max_batch_size{32};
  std::chrono::milliseconds timeout{30000};  /**< per embed() call, across all batches */
  bool normalize{true};                      /**< L2-normalize when the metric is cosine */
};

class embedder {
public:
  explicit embedder(std::shared_ptr<embedding_model> model, embedder_options opts = {});

  auto identity() const -> const model_identity& { return model_->identity(); }
  auto options() const -> const embedder_options& { return opts_; }

  auto embed(std::span<const std::string> texts) const
      -> std::expected<std::vector<embedding>, core::error>;
  auto embed(std::span<const std::string> texts, std::chrono::milliseconds timeout) const
      -> std::expected<std::vector<embedding>, core::error>;

  auto embed_one(std::string_view text) const -> std::expected<embedding, core::error>;

private:
  std::shared_ptr<embedding_model> model_;
  embedder_options opts_;
};

/**
 * \brief Deterministic local model: signed feature hashing of lower-cased
 *        alphanumeric tokens into `dimension` buckets, L2-normalized.
 */
class hashing_embedding_model final : public embedding_model {
public:
  explicit hashing_embedding_model(std::uint32_t dimension = 384,
                                   std::string model_id = "gleaner-hashing-v1");

  auto identity() const -> const model_identity& override { return identity_; }
  auto embed_batch(std::span<const std::string> texts, std::chrono::milliseconds timeout)
      -> std::expected<std::vector<embedding>, core::error> override;

  auto embed_text(std::string_view text) const -> embedding;

private:
  model_identity identity_;
};

} // namespace gleaner
