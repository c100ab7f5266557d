#include "gleaner/ingestion.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <thread>

#include "gleaner/core/hash.hpp"
#include "gleaner/logging.hpp"

namespace gleaner {

using core::error_code;

auto to_string(ingest_stage s) noexcept -> std::string_view {
  switch (s) {
    case ingest_stage::chunk: return "chunk";
    case ingest_stage::embed: return "embed";
    case ingest_stage::index: return "index";
  }
  return "unknown";
}

auto status_name(const document_status& s) noexcept -> std::string_view {
  struct namer {
    std::string_view operator()(const pending_status&) const noexcept { return "pending"; }
    std::string_view operator()(const chunked_status&) const noexcept { return "chunked"; }
    std::string_view operator()(const indexed_status&) const noexcept { return "indexed"; }
    std::string_view operator()(const failed_status&) const noexcept { return "failed"; }
  };
  return std::visit(namer{}, s);
}

auto retry_policy::backoff(std::uint32_t attempt) const -> std::chrono::milliseconds {
  if (attempt == 0) return std::chrono::milliseconds{0};
  const double scaled = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, attempt - 1);
  const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
  return std::chrono::milliseconds{static_cast<std::chrono::milliseconds::rep>(capped)};
}

ingestion_pipeline::ingestion_pipeline(index_store& index, embedder emb, chunker_config chunking,
                                       retry_policy retry, ingestion_options opts)
    : index_(index),
      embedder_(std::move(emb)),
      chunking_(chunking),
      retry_(retry),
      opts_(std::move(opts)),
      sleep_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
  if (opts_.embed_batch_size == 0) opts_.embed_batch_size = 1;
  if (retry_.max_attempts == 0) retry_.max_attempts = 1;
}

void ingestion_pipeline::transition(document& doc, document_status s) {
  doc.status = std::move(s);
  if (listener_) listener_(doc);
}

void ingestion_pipeline::fail(document& doc, ingest_stage stage, const core::error& e) {
  log::get()->warn("[ingest] doc={} collection={} failed at {}: {} ({})", doc.id, doc.collection, to_string(stage),
                   e.message, core::to_string(e.code));
  transition(doc, failed_status{e.code, e.message, stage});
}

auto ingestion_pipeline::resolve(document& doc) const -> std::expected<void, core::error> {
  if (doc.collection.empty()) doc.collection = opts_.default_collection;
  if (doc.id.empty()) doc.id = doc.filename;
  if (doc.id.empty()) {
    return core::make_unexpected(error_code::invalid_argument, "document has neither id nor filename", "ingest");
  }
  if (doc.content_hash.empty()) doc.content_hash = core::hex_digest(doc.text);
  if (doc.uploaded_at == std::chrono::system_clock::time_point{}) doc.uploaded_at = std::chrono::system_clock::now();
  return {};
}

auto ingestion_pipeline::embed_with_retry(const std::string& doc_id, std::span<const std::string> texts)
    -> std::expected<std::vector<embedding>, core::error> {
  for (std::uint32_t attempt = 1;; ++attempt) {
    auto vecs = embedder_.embed(texts);
    if (vecs) return vecs;
    if (!core::is_transient(vecs.error()) || attempt >= retry_.max_attempts) return vecs;
    const auto delay = retry_.backoff(attempt);
    log::get()->warn("[ingest] doc={} embedding attempt {}/{} failed: {}; retrying in {} ms", doc_id, attempt,
                     retry_.max_attempts, vecs.error().message, delay.count());
    sleep_(delay);
  }
}

// Nothing of a failed document may stay queryable, including an older version.
// The removal happens under the writer's document lock so a concurrent ingest
// of the same document cannot commit in between and be erased by it.
auto ingestion_pipeline::rollback(document& doc, document_writer& writer) -> std::expected<void, core::error> {
  auto removed = writer.retract();
  if (!removed) {
    return core::make_unexpected(error_code::ingestion_failed,
                                 "rollback of '" + doc.id + "' failed: " + removed.error().message, "ingest");
  }
  if (*removed > 0) log::get()->warn("[ingest] doc={} rolled back {} previously indexed chunks", doc.id, *removed);
  return {};
}

void ingestion_pipeline::wait_before_retry(const document& doc, std::uint32_t attempt, const core::error& e) {
  const auto delay = retry_.backoff(attempt);
  log::get()->warn("[ingest] doc={} index attempt {}/{} failed: {}; retrying in {} ms", doc.id, attempt,
                   retry_.max_attempts, e.message, delay.count());
  sleep_(delay);
}

// Embeds the chunks not yet in `prepared`, stages everything and commits.
auto ingestion_pipeline::write_document(const document& doc, const std::vector<chunk>& chunks,
                                        std::vector<record>& prepared, document_writer& writer)
    -> std::expected<std::size_t, stage_failure> {
  const auto& identity = embedder_.identity();
  // Records embedded by an earlier attempt are staged again, not re-embedded.
  if (!prepared.empty()) {
    if (auto s = writer.stage(prepared); !s) return std::unexpected(stage_failure{ingest_stage::index, s.error()});
  }

  for (std::size_t off = prepared.size(); off < chunks.size(); off += opts_.embed_batch_size) {
    const auto n = std::min(opts_.embed_batch_size, chunks.size() - off);
    std::vector<std::string> texts;
    texts.reserve(n);
    for (std::size_t i = 0; i < n; ++i) texts.push_back(chunks[off + i].text);

    auto vecs = embed_with_retry(doc.id, texts);
    if (!vecs) return std::unexpected(stage_failure{ingest_stage::embed, vecs.error()});

    std::vector<record> batch;
    batch.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      const auto& c = chunks[off + i];
      record r;
      r.chunk_id = make_chunk_id(doc.id, c.sequence_index);
      r.document_id = doc.id;
      r.sequence_index = c.sequence_index;
      r.start_offset = c.start_offset;
      r.end_offset = c.end_offset;
      r.text = c.text;
      r.model_id = identity.model_id;
      r.vector = std::move((*vecs)[i]);
      r.tags = {{"document_id", doc.id},
                {"filename", doc.filename},
                {"content_hash", doc.content_hash},
                {"collection", doc.collection}};
      batch.push_back(std::move(r));
    }
    if (auto s = writer.stage(batch); !s) return std::unexpected(stage_failure{ingest_stage::index, s.error()});
    prepared.insert(prepared.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
  }

  auto committed = writer.commit();
  if (!committed) return std::unexpected(stage_failure{ingest_stage::index, committed.error()});
  return *committed;
}

auto ingestion_pipeline::run(document& doc) -> std::expected<void, core::error> {
  if (auto r = resolve(doc); !r) {
    fail(doc, ingest_stage::chunk, r.error());
    return {};
  }
  transition(doc, pending_status{});
  const auto& identity = embedder_.identity();

  if (auto r = index_.ensure_collection(doc.collection, identity); !r) {
    fail(doc, ingest_stage::index, r.error());
    return {};
  }

  auto fingerprint = index_.document_fingerprint(doc.collection, doc.id);
  if (!fingerprint) {
    fail(doc, ingest_stage::index, fingerprint.error());
    return {};
  }
  if (*fingerprint && **fingerprint == doc.content_hash) {
    auto existing = index_.document_chunks(doc.collection, {doc.id});
    if (!existing) {
      fail(doc, ingest_stage::index, existing.error());
      return {};
    }
    log::get()->info("[ingest] doc={} unchanged (hash {}), {} chunks already indexed", doc.id, doc.content_hash,
                     existing->size());
    transition(doc, indexed_status{existing->size(), identity.model_id});
    return {};
  }

  auto chunks = chunk_text(doc.text, chunking_);
  if (!chunks) {
    fail(doc, ingest_stage::chunk, chunks.error());
    return {};
  }
  if (chunks->empty()) {
    fail(doc, ingest_stage::chunk, core::error{error_code::invalid_argument, "document has no text", "ingest"});
    return {};
  }
  transition(doc, chunked_status{chunks->size()});
  log::get()->info("[ingest] doc={} collection={} chunked into {} passages", doc.id, doc.collection, chunks->size());

  // Transient index errors (lock timeouts) rerun the write; embeddings already
  // computed are kept across attempts.
  std::vector<record> prepared;
  prepared.reserve(chunks->size());
  for (std::uint32_t attempt = 1;; ++attempt) {
    const bool last = attempt >= retry_.max_attempts;
    auto writer = index_.begin_document(doc.collection, doc.id, doc.content_hash);
    if (!writer) {
      if (!last && core::is_transient(writer.error())) {
        wait_before_retry(doc, attempt, writer.error());
        continue;
      }
      // Without the document lock the previous version is left to its current holder.
      fail(doc, ingest_stage::index, writer.error());
      return {};
    }

    auto written = write_document(doc, *chunks, prepared, *writer);
    if (written) {
      transition(doc, indexed_status{*written, identity.model_id});
      log::get()->info("[ingest] doc={} collection={} indexed {} chunks with {}", doc.id, doc.collection, *written,
                       identity.model_id);
      return {};
    }
    const auto& failure = written.error();
    if (failure.stage == ingest_stage::index && !last && core::is_transient(failure.error)) {
      if (auto a = writer->abort(); !a) {
        log::get()->warn("[ingest] doc={} abort before retry failed: {}", doc.id, a.error().message);
      }
      wait_before_retry(doc, attempt, failure.error);
      continue;
    }
    fail(doc, failure.stage, failure.error);
    return rollback(doc, *writer);
  }
}

auto ingestion_pipeline::ingest(document doc) -> std::expected<document, core::error> {
  try {
    if (auto r = run(doc); !r) {
      log::get()->error("[ingest] doc={} {}", doc.id, r.error().message);
      return std::unexpected(r.error());
    }
  } catch (const std::exception& e) {
    log::get()->error("[ingest] doc={} unexpected failure: {}", doc.id, e.what());
    if (!doc.id.empty() && !doc.collection.empty()) {
      if (auto removed = index_.remove_document(doc.collection, doc.id); !removed) {
        log::get()->error("[ingest] doc={} cleanup after failure did not complete: {}", doc.id,
                          removed.error().message);
      }
    }
    doc.status = failed_status{error_code::ingestion_failed, e.what(), ingest_stage::index};
    if (listener_) {
      try {
        listener_(doc);
      } catch (const std::exception& le) {
        log::get()->warn("[ingest] doc={} status listener failed: {}", doc.id, le.what());
      }
    }
    return core::make_unexpected(error_code::ingestion_failed,
                                 "ingestion of '" + doc.id + "' failed: " + e.what(), "ingest");
  }
  return doc;
}

auto ingestion_pipeline::remove(const document& doc) -> std::expected<std::size_t, core::error> {
  const auto& collection = doc.collection.empty() ? opts_.default_collection : doc.collection;
  const auto& id = doc.id.empty() ? doc.filename : doc.id;
  if (id.empty()) {
    return core::make_unexpected(error_code::invalid_argument, "document has neither id nor filename", "ingest");
  }
  auto removed = index_.remove_document(collection, id);
  if (!removed) {
    if (removed.error().code == error_code::not_found) return std::size_t{0};
    return removed;
  }
  log::get()->info("[ingest] doc={} collection={} removed {} chunks", id, collection, *removed);
  return removed;
}

} // namespace gleaner
