#pragma once

/** \file distance.hpp
 *  \brief Scalar similarity kernels (L2^2, Inner Product, Cosine) and the
 *         score convention used by the index: higher is more relevant.
 *
 * Preconditions
 * - a.size() == b.size() > 0
 * - All inputs are finite
 * Determinism: pure functions, no allocations, fixed summation order, so the
 * same inputs always produce bit-identical scores.
 */

#include <cmath>
#include <cstddef>
#include <span>

namespace gleaner::kernels {

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    const float d0 = a[i] - b[i];
    const float d1 = a[i + 1] - b[i + 1];
    const float d2 = a[i + 2] - b[i + 2];
    const float d3 = a[i + 3] - b[i + 3];
    s0 += d0 * d0; s1 += d1 * d1; s2 += d2 * d2; s3 += d3 * d3;
  }
  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) { const float d = a[i] - b[i]; s += d * d; }
  return s;
}

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;
  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    s0 += a[i] * b[i];
    s1 += a[i + 1] * b[i + 1];
    s2 += a[i + 2] * b[i + 2];
    s3 += a[i + 3] * b[i + 3];
  }
  float s = s0 + s1 + s2 + s3;
  for (; i < n; ++i) s += a[i] * b[i];
  return s;
}

/** \brief Cosine similarity; 0 when either norm is zero. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  float dot = 0.0f, na = 0.0f, nb = 0.0f;
  for (std::size_t i = 0; i < n; ++i) {
    dot += a[i] * b[i];
    na += a[i] * a[i];
    nb += b[i] * b[i];
  }
  const float denom = std::sqrt(na) * std::sqrt(nb);
  if (denom == 0.0f) return 0.0f;
  return dot / denom;
}

/** \brief Scales v to unit length in place; zero vectors are left untouched. */
inline void l2_normalize(std::span<float> v) noexcept {
  float n = 0.0f;
  for (float x : v) n += x * x;
  if (n == 0.0f) return;
  const float inv = 1.0f / std::sqrt(n);
  for (float& x : v) x *= inv;
}

} // namespace gleaner::kernels
