#include "gleaner/embedder.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <utility>

#include "gleaner/core/hash.hpp"
#include "gleaner/kernels/distance.hpp"
#include "gleaner/logging.hpp"

namespace gleaner {

embedder::embedder(std::shared_ptr<embedding_model> model, embedder_options opts)
    : model_(std::move(model)), opts_(opts) {
  if (opts_.max_batch_size == 0) opts_.max_batch_size = 1;
}

auto embedder::embed(std::span<const std::string> texts) const
    -> std::expected<std::vector<embedding>, core::error> {
  return embed(texts, opts_.timeout);
}

auto embedder::embed(std::span<const std::string> texts, std::chrono::milliseconds timeout) const
    -> std::expected<std::vector<embedding>, core::error> {
  using core::error_code;
  using clock = std::chrono::steady_clock;
  const auto& id = model_->identity();
  const auto deadline = clock::now() + timeout;

  std::vector<embedding> out;
  out.reserve(texts.size());
  for (std::size_t off = 0; off < texts.size(); off += opts_.max_batch_size) {
    const auto batch = texts.subspan(off, std::min(opts_.max_batch_size, texts.size() - off));
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
    if (remaining.count() <= 0) {
      return core::make_unexpected(error_code::timeout, "embedding deadline exceeded", "embedder");
    }

    std::expected<std::vector<embedding>, core::error> r;
    try {
      r = model_->embed_batch(batch, remaining);
    } catch (const std::exception& e) {
      return core::make_unexpected(error_code::embedding_unavailable,
                                   std::string("model threw: ") + e.what(), "embedder");
    }
    if (!r) {
      // Anything but a timeout is a service failure from the caller's point of view.
      if (r.error().code == error_code::timeout) return std::unexpected(r.error());
      return core::make_unexpected(error_code::embedding_unavailable, r.error().message, "embedder");
    }
    if (clock::now() > deadline) {
      return core::make_unexpected(error_code::timeout, "embedding deadline exceeded", "embedder");
    }
    if (r->size() != batch.size()) {
      return core::make_unexpected(error_code::embedding_unavailable,
          "model returned " + std::to_string(r->size()) + " vectors for " + std::to_string(batch.size()) + " texts",
          "embedder");
    }
    for (auto& v : *r) {
      if (v.size() != id.dimension) {
        return core::make_unexpected(error_code::embedding_unavailable,
            "model returned dimension " + std::to_string(v.size()) + ", declared " + std::to_string(id.dimension),
            "embedder");
      }
      for (float x : v) {
        if (!std::isfinite(x)) {
          return core::make_unexpected(error_code::embedding_unavailable, "model returned non-finite value", "embedder");
        }
      }
      if (opts_.normalize && id.native_metric == metric::cosine) kernels::l2_normalize(v);
      out.push_back(std::move(v));
    }
  }
  log::get()->debug("[embedder] model={} embedded {} texts", id.model_id, texts.size());
  return out;
}

auto embedder::embed_one(std::string_view text) const -> std::expected<embedding, core::error> {
  const std::string one(text);
  auto r = embed(std::span<const std::string>(&one, 1));
  if (!r) return std::unexpected(r.error());
  return std::move(r->front());
}

hashing_embedding_model::hashing_embedding_model(std::uint32_t dimension, std::string model_id)
    : identity_{std::move(model_id), dimension == 0 ? 1u : dimension, metric::cosine} {}

auto hashing_embedding_model::embed_text(std::string_view text) const -> embedding {
  embedding v(identity_.dimension, 0.0f);
  std::string token;
  auto flush = [&] {
    if (token.empty()) return;
    const std::uint64_t h = core::fnv1a64(token);
    const float sign = (h >> 63) ? -1.0f : 1.0f;
    v[h % identity_.dimension] += sign;
    token.clear();
  };
  for (char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) || uc >= 0x80) {
      token.push_back(static_cast<char>(std::tolower(uc)));
    } else {
      flush();
    }
  }
  flush();
  kernels::l2_normalize(v);
  return v;
}

auto hashing_embedding_model::embed_batch(std::span<const std::string> texts, std::chrono::milliseconds)
    -> std::expected<std::vector<embedding>, core::error> {
  std::vector<embedding> out;
  out.reserve(texts.size());
  for (const auto& t : texts) out.push_back(embed_text(t));
  return out;
}

} // namespace gleaner
