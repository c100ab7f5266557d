#include "gleaner/types.hpp"

namespace gleaner {

auto to_string(metric m) noexcept -> std::string_view {
  switch (m) {
    case metric::cosine: return "cosine";
    case metric::inner_product: return "ip";
    case metric::euclidean: return "l2";
  }
  return "cosine";
}

auto parse_metric(std::string_view name) -> std::optional<metric> {
  if (name == "cosine") return metric::cosine;
  if (name == "ip" || name == "inner_product") return metric::inner_product;
  if (name == "l2" || name == "euclidean") return metric::euclidean;
  return std::nullopt;
}

auto make_chunk_id(std::string_view document_id, std::uint32_t sequence_index) -> std::string {
  std::string id;
  id.reserve(document_id.size() + 12);
  id.append(document_id);
  id.push_back('#');
  id.append(std::to_string(sequence_index));
  return id;
}

} // namespace gleaner
