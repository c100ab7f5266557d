#include "gleaner/chunker.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace gleaner {

namespace {

enum class boundary : int { none = 0, word = 1, sentence = 2, paragraph = 3 };

bool is_space(char c) noexcept { return std::isspace(static_cast<unsigned char>(c)) != 0; }

// Class of a cut placed right before position p (0 < p < text.size()).
boundary classify(std::string_view text, std::size_t p) noexcept {
  if (text.compare(p, 2, "\n\n") == 0) return boundary::paragraph;
  const char prev = text[p - 1];
  if (text[p] == '\n') return boundary::sentence;
  if ((prev == '.' || prev == '!' || prev == '?') && is_space(text[p])) return boundary::sentence;
  if (is_space(text[p])) return boundary::word;
  return boundary::none;
}

std::size_t find_end(std::string_view text, std::size_t start, const chunker_config& cfg) noexcept {
  const std::size_t hard_end = start + cfg.chunk_size;
  const std::size_t tolerance = std::max<std::size_t>(1, cfg.chunk_size / 5);
  const std::size_t lo = std::max(start + 1, hard_end - tolerance);
  std::size_t best = hard_end;
  boundary best_class = boundary::none;
  for (std::size_t p = hard_end; p >= lo; --p) {
    const boundary b = classify(text, p);
    if (static_cast<int>(b) > static_cast<int>(best_class)) {
      best = p;
      best_class = b;
      if (b == boundary::paragraph) break;
    }
  }
  return best;
}

} // namespace

auto validate(const chunker_config& cfg) -> std::expected<void, core::error> {
  using core::error_code;
  if (cfg.chunk_size == 0) {
    return core::make_unexpected(error_code::config_invalid, "chunk_size must be > 0", "chunker");
  }
  if (cfg.overlap >= cfg.chunk_size) {
    return core::make_unexpected(error_code::config_invalid,
        "overlap (" + std::to_string(cfg.overlap) + ") must be < chunk_size (" + std::to_string(cfg.chunk_size) + ")",
        "chunker");
  }
  if (cfg.min_chunk_size > cfg.chunk_size) {
    return core::make_unexpected(error_code::config_invalid, "min_chunk_size must be <= chunk_size", "chunker");
  }
  return {};
}

auto chunk_text(std::string_view text, const chunker_config& cfg)
    -> std::expected<std::vector<chunk>, core::error> {
  if (auto v = validate(cfg); !v) return std::unexpected(v.error());
  std::vector<chunk> out;
  const std::size_t n = text.size();
  std::size_t start = 0;
  while (start < n && is_space(text[start])) ++start;

  while (start < n) {
    const std::size_t end = (n - start <= cfg.chunk_size) ? n : find_end(text, start, cfg);
    std::size_t trimmed = end;
    while (trimmed > start && is_space(text[trimmed - 1])) --trimmed;
    if (trimmed > start) {
      chunk c;
      c.sequence_index = static_cast<std::uint32_t>(out.size());
      c.start_offset = start;
      c.end_offset = trimmed;
      c.text = std::string(text.substr(start, trimmed - start));
      out.push_back(std::move(c));
    }
    if (end >= n) break;
    std::size_t next = (end > cfg.overlap) ? end - cfg.overlap : 0;
    next = std::max(next, start + 1);
    while (next < n && is_space(text[next])) ++next;
    start = next;
  }

  if (out.size() > 1 && out.back().length() < cfg.min_chunk_size) out.pop_back();
  return out;
}

} // namespace gleaner
