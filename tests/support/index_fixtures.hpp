#pragma once

// Small builders for index_store tests.

#include <memory>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <gleaner/index_store.hpp>

#include "test_models.hpp"

namespace test_support {

inline const gleaner::model_identity& test_identity() {
  static const gleaner::model_identity id{"test-model", 3, gleaner::metric::cosine};
  return id;
}

inline gleaner::record make_record(const std::string& doc, std::uint32_t seq, std::vector<float> vec,
                                   const std::string& model = "test-model") {
  gleaner::record r;
  r.document_id = doc;
  r.sequence_index = seq;
  r.chunk_id = gleaner::make_chunk_id(doc, seq);
  r.start_offset = seq * 10;
  r.end_offset = seq * 10 + 10;
  r.text = doc + " chunk " + std::to_string(seq);
  r.model_id = model;
  r.vector = std::move(vec);
  r.tags = {{"document_id", doc}, {"filename", doc + ".txt"}};
  return r;
}

inline gleaner::store_settings fast_settings(const std::filesystem::path& dir) {
  gleaner::store_settings s;
  s.path = dir;
  s.durability = gleaner::wal::DurabilityProfile::None;
  s.lock_timeout = std::chrono::milliseconds{2000};
  return s;
}

inline std::unique_ptr<gleaner::index_store> open_store(const gleaner::store_settings& s) {
  auto store = gleaner::index_store::open(s);
  REQUIRE(store.has_value());
  return std::move(*store);
}

// Commits a whole document in one transaction.
inline std::size_t put_document(gleaner::index_store& store, const std::string& collection, const std::string& doc,
                                const std::vector<std::vector<float>>& vectors, const std::string& fingerprint = "v1") {
  auto w = store.begin_document(collection, doc, fingerprint);
  REQUIRE(w.has_value());
  std::vector<gleaner::record> recs;
  for (std::size_t i = 0; i < vectors.size(); ++i) recs.push_back(make_record(doc, static_cast<std::uint32_t>(i), vectors[i]));
  REQUIRE(w->stage(recs).has_value());
  auto n = w->commit();
  REQUIRE(n.has_value());
  return *n;
}

inline std::vector<std::string> ids(const std::vector<gleaner::hit>& hits) {
  std::vector<std::string> out;
  for (const auto& h : hits) out.push_back(h.chunk_id);
  return out;
}

} // namespace test_support
