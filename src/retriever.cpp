#include "gleaner/retriever.hpp"

#include <algorithm>
#include <unordered_map>
#include <unordered_set>

#include "gleaner/logging.hpp"

namespace gleaner {

using core::error_code;

retriever::retriever(const index_store& index, embedder emb, retriever_options opts)
    : index_(index), embedder_(std::move(emb)), opts_(opts) {
  if (opts_.overfetch_factor == 0) opts_.overfetch_factor = 1;
}

auto retriever::retrieve(const std::string& query, const std::string& collection) const
    -> std::expected<retrieval_result, core::error> {
  return retrieve(query, collection, opts_.top_k, opts_.min_score);
}

auto retriever::retrieve(const std::string& query, const std::string& collection, std::size_t top_k,
                         std::optional<float> min_score) const -> std::expected<retrieval_result, core::error> {
  retrieval_result result{collection, {}};
  if (top_k == 0) return result;

  auto stats = index_.stats(collection);
  if (!stats) {
    if (stats.error().code == error_code::not_found) {
      log::get()->debug("[retrieve] collection '{}' does not exist", collection);
      return result;
    }
    return std::unexpected(stats.error());
  }
  if (stats->chunks == 0) return result;
  if (stats->identity.model_id != embedder_.identity().model_id) {
    return core::make_unexpected(error_code::dimension_mismatch,
                                 "collection '" + collection + "' was indexed with " + stats->identity.model_id +
                                     ", queries use " + embedder_.identity().model_id,
                                 "retrieve");
  }

  auto qvec = embedder_.embed_one(query);
  if (!qvec) return std::unexpected(qvec.error());

  auto hits = index_.search(collection, *qvec, top_k * opts_.overfetch_factor);
  if (!hits) return std::unexpected(hits.error());

  std::unordered_map<std::string, std::size_t> per_document;
  for (auto& h : *hits) {
    if (result.passages.size() >= top_k) break;
    if (min_score && h.score < *min_score) continue;
    auto& rec = h.rec;
    if (opts_.max_chunks_per_document != 0 &&
        per_document[rec.document_id] >= opts_.max_chunks_per_document) {
      continue;
    }
    ++per_document[rec.document_id];
    const auto fname = rec.tags.find("filename");
    result.passages.push_back(passage{rec.chunk_id, rec.document_id,
                                      fname != rec.tags.end() ? fname->second : std::string{},
                                      rec.sequence_index, std::move(rec.text), h.score});
  }
  log::get()->debug("[retrieve] collection={} candidates={} returned={}", collection, hits->size(),
                    result.passages.size());
  return result;
}

auto retriever::document_context(const std::string& collection, const std::vector<std::string>& document_ids,
                                 std::size_t max_chunks) const -> std::expected<std::string, core::error> {
  auto chunks = index_.document_chunks(collection, document_ids, max_chunks);
  if (!chunks) {
    if (chunks.error().code == error_code::not_found) return std::string{};
    return std::unexpected(chunks.error());
  }
  if (chunks->empty()) {
    log::get()->warn("[retrieve] no chunks found for {} document(s) in '{}'", document_ids.size(), collection);
  }
  std::string out;
  for (const auto& r : *chunks) {
    if (!out.empty()) out += "\n\n";
    out += r.text;
  }
  return out;
}

auto assemble_context(const retrieval_result& result, std::size_t max_chars) -> std::string {
  std::string out;
  for (const auto& p : result.passages) {
    const std::size_t sep = out.empty() ? 0 : 2;
    if (max_chars != 0 && out.size() + sep + p.text.size() > max_chars) break;
    if (sep) out += "\n\n";
    out += p.text;
  }
  return out;
}

auto sources(const retrieval_result& result) -> std::vector<std::string> {
  std::vector<std::string> out;
  std::unordered_set<std::string> seen;
  for (const auto& p : result.passages) {
    const auto& name = p.filename.empty() ? p.document_id : p.filename;
    if (seen.insert(name).second) out.push_back(name);
  }
  return out;
}

auto answer_query(const retriever& r, generation_model& generator, const std::string& query,
                  const std::string& collection) -> std::expected<answer, core::error> {
  auto grounding = r.retrieve(query, collection);
  if (!grounding) return std::unexpected(grounding.error());

  std::expected<std::string, core::error> text;
  try {
    text = generator.generate(query, grounding->passages);
  } catch (const std::exception& e) {
    return core::make_unexpected(error_code::internal, std::string("generator failed: ") + e.what(), "answer");
  }
  if (!text) return std::unexpected(text.error());

  answer a;
  a.text = std::move(*text);
  a.sources = sources(*grounding);
  a.grounding = std::move(*grounding);
  return a;
}

} // namespace gleaner
