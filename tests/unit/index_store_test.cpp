#include <catch2/catch_all.hpp>
#include <gleaner/index_store.hpp>
#include <tests/support/index_fixtures.hpp>

using namespace gleaner;
using namespace test_support;

TEST_CASE("collection identity is established once and then enforced", "[index]") {
  temp_dir tmp("index_identity");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("os101", test_identity()).has_value());
  REQUIRE(store->ensure_collection("os101", test_identity()).has_value());

  auto other = store->ensure_collection("os101", model_identity{"test-model", 4, metric::cosine});
  REQUIRE_FALSE(other.has_value());
  REQUIRE(other.error().code == core::error_code::dimension_mismatch);

  REQUIRE_FALSE(store->ensure_collection("../escape", test_identity()).has_value());
  REQUIRE(store->list_collections() == std::vector<std::string>{"os101"});
}

TEST_CASE("upsert with a foreign dimension or model fails and leaves the index untouched", "[index][dimension]") {
  temp_dir tmp("index_dim_guard");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  REQUIRE(store->upsert("c", make_record("a", 0, {1, 0, 0})).has_value());

  auto wrong_dim = store->upsert("c", make_record("a", 1, {1, 0, 0, 0}));
  REQUIRE_FALSE(wrong_dim.has_value());
  REQUIRE(wrong_dim.error().code == core::error_code::dimension_mismatch);

  auto wrong_model = store->upsert("c", make_record("a", 0, {0, 1, 0}, "other-model"));
  REQUIRE_FALSE(wrong_model.has_value());
  REQUIRE(wrong_model.error().code == core::error_code::dimension_mismatch);

  auto st = store->stats("c");
  REQUIRE(st.has_value());
  REQUIRE(st->chunks == 1);
  REQUIRE(store->get("c", "a#0")->vector == std::vector<float>{1, 0, 0});

  auto bad_query = store->query("c", std::vector<float>{1, 0}, 3);
  REQUIRE_FALSE(bad_query.has_value());
  REQUIRE(bad_query.error().code == core::error_code::dimension_mismatch);
}

TEST_CASE("query ranks by descending similarity and repeats identically", "[index][ranking]") {
  temp_dir tmp("index_ranking");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  put_document(*store, "c", "doc", {{1, 0, 0}, {0.9f, 0.1f, 0}, {0, 1, 0}, {0.7f, 0.7f, 0}, {0, 0, 1}});

  const std::vector<float> q{1, 0.05f, 0};
  auto first = store->query("c", q, 3);
  REQUIRE(first.has_value());
  REQUIRE(ids(*first) == std::vector<std::string>{"doc#0", "doc#1", "doc#3"});
  REQUIRE((*first)[0].score >= (*first)[1].score);
  REQUIRE((*first)[1].score >= (*first)[2].score);
  for (int i = 0; i < 5; ++i) {
    auto again = store->query("c", q, 3);
    REQUIRE(again.has_value());
    REQUIRE(ids(*again) == ids(*first));
  }
}

TEST_CASE("equal scores keep insertion order", "[index][ranking]") {
  temp_dir tmp("index_ties");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  for (const auto* doc : {"d3", "d1", "d2"}) REQUIRE(store->upsert("c", make_record(doc, 0, {0, 1, 0})).has_value());
  auto hits = store->query("c", std::vector<float>{0, 1, 0}, 3);
  REQUIRE(hits.has_value());
  REQUIRE(ids(*hits) == std::vector<std::string>{"d3#0", "d1#0", "d2#0"});
}

TEST_CASE("euclidean and inner product scores are higher-is-better", "[index][ranking]") {
  temp_dir tmp("index_metrics");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("l2", model_identity{"test-model", 3, metric::euclidean}).has_value());
  REQUIRE(store->ensure_collection("ip", model_identity{"test-model", 3, metric::inner_product}).has_value());
  for (const auto* c : {"l2", "ip"}) {
    REQUIRE(store->upsert(c, make_record("near", 0, {1, 1, 0})).has_value());
    REQUIRE(store->upsert(c, make_record("far", 0, {5, 5, 5})).has_value());
  }
  auto l2 = store->query("l2", std::vector<float>{1, 1, 0}, 2);
  REQUIRE(l2.has_value());
  REQUIRE((*l2)[0].chunk_id == "near#0");
  REQUIRE((*l2)[0].score == Catch::Approx(0.0f));
  REQUIRE((*l2)[1].score < 0.0f);

  auto ip = store->query("ip", std::vector<float>{1, 1, 0}, 2);
  REQUIRE(ip.has_value());
  REQUIRE((*ip)[0].chunk_id == "far#0");
  REQUIRE((*ip)[0].score == Catch::Approx(10.0f));
}

TEST_CASE("removing one document never disturbs another", "[index][isolation]") {
  temp_dir tmp("index_isolation");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  put_document(*store, "c", "A", {{1, 0, 0}, {0.8f, 0.2f, 0}});
  put_document(*store, "c", "B", {{0.9f, 0.1f, 0}, {0.6f, 0.4f, 0}, {0, 1, 0}});

  const std::vector<float> q{1, 0.1f, 0};
  auto before = store->query("c", q, 10);
  REQUIRE(before.has_value());
  std::vector<std::string> b_before;
  for (const auto& h : *before) if (h.chunk_id.starts_with("B#")) b_before.push_back(h.chunk_id);

  auto removed = store->remove_document("c", "A");
  REQUIRE(removed.has_value());
  REQUIRE(*removed == 2);

  auto after = store->query("c", q, 10);
  REQUIRE(after.has_value());
  REQUIRE(ids(*after) == b_before);
  REQUIRE(store->stats("c")->documents == 1);
  REQUIRE(store->remove_document("c", "A").value() == 0);
}

TEST_CASE("collections are isolated from each other", "[index][isolation]") {
  temp_dir tmp("index_collections");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("os", test_identity()).has_value());
  REQUIRE(store->ensure_collection("dbms", test_identity()).has_value());
  put_document(*store, "os", "sched", {{1, 0, 0}});
  put_document(*store, "dbms", "btree", {{1, 0, 0}});

  auto hits = store->query("os", std::vector<float>{1, 0, 0}, 10);
  REQUIRE(hits.has_value());
  REQUIRE(ids(*hits) == std::vector<std::string>{"sched#0"});
  REQUIRE_FALSE(store->get("os", "btree#0").has_value());

  auto missing = store->query("nope", std::vector<float>{1, 0, 0}, 1);
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == core::error_code::not_found);
}

TEST_CASE("document commit replaces the previous chunk set", "[index][txn]") {
  temp_dir tmp("index_replace");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  put_document(*store, "c", "doc", {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}}, "hash-1");
  REQUIRE(store->document_fingerprint("c", "doc").value() == std::optional<std::string>{"hash-1"});

  REQUIRE(put_document(*store, "c", "doc", {{0, 1, 0}}, "hash-2") == 1);
  REQUIRE(store->stats("c")->chunks == 1);
  REQUIRE(store->document_fingerprint("c", "doc").value() == std::optional<std::string>{"hash-2"});
  REQUIRE_FALSE(store->get("c", "doc#2").has_value());
  REQUIRE_FALSE(store->document_fingerprint("c", "absent").value().has_value());
}

TEST_CASE("staged records stay invisible until commit and vanish on abort", "[index][txn]") {
  temp_dir tmp("index_staging");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  put_document(*store, "c", "doc", {{1, 0, 0}}, "old");

  {
    auto w = store->begin_document("c", "doc", "new");
    REQUIRE(w.has_value());
    REQUIRE(w->stage(std::vector<record>{make_record("doc", 0, {0, 1, 0}), make_record("doc", 1, {0, 0, 1})}).has_value());
    REQUIRE(w->staged() == 2);
    REQUIRE(store->stats("c")->chunks == 1);
    REQUIRE(store->get("c", "doc#0")->vector == std::vector<float>{1, 0, 0});
    REQUIRE(w->abort().has_value());
  }
  REQUIRE(store->stats("c")->chunks == 1);
  REQUIRE(store->document_fingerprint("c", "doc").value() == std::optional<std::string>{"old"});

  {
    auto w = store->begin_document("c", "doc", "dropped");
    REQUIRE(w.has_value());
    REQUIRE(w->stage(std::vector<record>{make_record("doc", 0, {0, 1, 0})}).has_value());
    // Destroyed without commit.
  }
  REQUIRE(store->get("c", "doc#0")->vector == std::vector<float>{1, 0, 0});
}

TEST_CASE("stage rejects records of another document or shape", "[index][txn]") {
  temp_dir tmp("index_stage_guard");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  auto w = store->begin_document("c", "doc", "h");
  REQUIRE(w.has_value());
  auto foreign = w->stage(std::vector<record>{make_record("other", 0, {1, 0, 0})});
  REQUIRE_FALSE(foreign.has_value());
  REQUIRE(foreign.error().code == core::error_code::invalid_argument);
  auto wrong = w->stage(std::vector<record>{make_record("doc", 0, {1, 0, 0}), make_record("doc", 1, {1, 0})});
  REQUIRE_FALSE(wrong.has_value());
  REQUIRE(wrong.error().code == core::error_code::dimension_mismatch);
  REQUIRE(w->staged() == 0);
  REQUIRE(w->commit().value() == 0);
  REQUIRE(store->stats("c")->documents == 0);
}

TEST_CASE("filters restrict query candidates", "[index][filter]") {
  temp_dir tmp("index_filter");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  put_document(*store, "c", "A", {{1, 0, 0}, {0.9f, 0.1f, 0}});
  put_document(*store, "c", "B", {{1, 0, 0}});

  const auto only_b = document_filter({"B"});
  auto hits = store->query("c", std::vector<float>{1, 0, 0}, 5, &only_b);
  REQUIRE(hits.has_value());
  REQUIRE(ids(*hits) == std::vector<std::string>{"B#0"});

  const filter_expr second{range{"sequence_index", 1.0, 1.0}};
  hits = store->query("c", std::vector<float>{1, 0, 0}, 5, &second);
  REQUIRE(hits.has_value());
  REQUIRE(ids(*hits) == std::vector<std::string>{"A#1"});
}

TEST_CASE("document_chunks returns chunks in document and sequence order", "[index]") {
  temp_dir tmp("index_doc_chunks");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  put_document(*store, "c", "A", {{1, 0, 0}, {0, 1, 0}, {0, 0, 1}});
  put_document(*store, "c", "B", {{1, 0, 0}, {0, 1, 0}});

  auto all = store->document_chunks("c", {"B", "A"});
  REQUIRE(all.has_value());
  std::vector<std::string> got;
  for (const auto& r : *all) got.push_back(r.chunk_id);
  REQUIRE(got == std::vector<std::string>{"B#0", "B#1", "A#0", "A#1", "A#2"});

  auto limited = store->document_chunks("c", {"A", "B"}, 4);
  REQUIRE(limited.has_value());
  REQUIRE(limited->size() == 4);
  REQUIRE(limited->back().chunk_id == "B#0");
}

TEST_CASE("dropping a collection removes it from disk", "[index]") {
  temp_dir tmp("index_drop");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  put_document(*store, "c", "A", {{1, 0, 0}});
  REQUIRE(store->drop_collection("c").has_value());
  REQUIRE_FALSE(store->has_collection("c"));
  REQUIRE_FALSE(std::filesystem::exists(tmp / "c"));
  REQUIRE(store->drop_collection("c").error().code == core::error_code::not_found);
}

TEST_CASE("a closed store rejects further calls", "[index]") {
  temp_dir tmp("index_close");
  auto store = open_store(fast_settings(tmp.path()));
  REQUIRE(store->ensure_collection("c", test_identity()).has_value());
  REQUIRE(store->close().has_value());
  auto r = store->stats("c");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::precondition_failed);
}
