#include <catch2/catch_all.hpp>
#include <gleaner/embedder.hpp>
#include <gleaner/kernels/distance.hpp>
#include <tests/support/test_models.hpp>

#include <cmath>

using namespace gleaner;
using test_support::table_model;

namespace {
std::vector<std::string> sample_texts(std::size_t n) {
  std::vector<std::string> out;
  for (std::size_t i = 0; i < n; ++i) out.push_back("passage number " + std::to_string(i) + " about topic " + std::to_string(i % 3));
  return out;
}
} // namespace

TEST_CASE("batching does not change output order or values", "[embedder]") {
  auto model = std::make_shared<hashing_embedding_model>(64);
  const auto texts = sample_texts(11);
  embedder one_shot(model, embedder_options{100, std::chrono::milliseconds{5000}, true});
  embedder batched(model, embedder_options{3, std::chrono::milliseconds{5000}, true});
  auto a = one_shot.embed(texts);
  auto b = batched.embed(texts);
  REQUIRE(a.has_value());
  REQUIRE(b.has_value());
  REQUIRE(a->size() == texts.size());
  REQUIRE(*a == *b);
  auto again = batched.embed(texts);
  REQUIRE(again.has_value());
  REQUIRE(*again == *b);
}

TEST_CASE("batches are sized by max_batch_size", "[embedder]") {
  auto model = std::make_shared<table_model>("table", 4);
  embedder e(model, embedder_options{4, std::chrono::milliseconds{5000}, true});
  REQUIRE(e.embed(sample_texts(10)).has_value());
  REQUIRE(model->calls() == 3);
  REQUIRE(model->texts_seen() == 10);
}

TEST_CASE("hashing model is deterministic and unit length", "[embedder]") {
  hashing_embedding_model m(128);
  const auto v1 = m.embed_text("Operating Systems: process scheduling");
  const auto v2 = m.embed_text("operating systems process scheduling");
  REQUIRE(v1 == v2);
  REQUIRE(v1.size() == 128);
  REQUIRE(kernels::inner_product(v1, v1) == Catch::Approx(1.0f).margin(1e-5));
  const auto other = m.embed_text("photosynthesis in plants");
  REQUIRE(kernels::cosine_similarity(v1, other) < 0.9f);
}

TEST_CASE("cosine models are normalized by the adapter", "[embedder]") {
  auto model = std::make_shared<table_model>("table", 3);
  model->set("x", {3.0f, 4.0f, 0.0f});
  embedder e(model);
  auto v = e.embed_one("x");
  REQUIRE(v.has_value());
  REQUIRE((*v)[0] == Catch::Approx(0.6f));
  REQUIRE((*v)[1] == Catch::Approx(0.8f));

  auto ip_model = std::make_shared<table_model>("table-ip", 3, metric::inner_product);
  ip_model->set("x", {3.0f, 4.0f, 0.0f});
  auto raw = embedder(ip_model).embed_one("x");
  REQUIRE(raw.has_value());
  REQUIRE((*raw)[0] == Catch::Approx(3.0f));
}

TEST_CASE("model failures surface as embedding_unavailable", "[embedder][errors]") {
  auto model = std::make_shared<table_model>("table", 4);
  model->fail_call(1);
  embedder e(model);
  auto r = e.embed(sample_texts(2));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::embedding_unavailable);
  REQUIRE(core::is_transient(r.error()));
  // The adapter itself never retries.
  REQUIRE(model->calls() == 1);
}

TEST_CASE("wrong dimension from the model is rejected", "[embedder][errors]") {
  auto model = std::make_shared<table_model>("table", 4);
  model->corrupt_dimension(true);
  auto r = embedder(model).embed(sample_texts(1));
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::embedding_unavailable);
}

TEST_CASE("exceptions from the model are converted", "[embedder][errors]") {
  auto r = embedder(std::make_shared<test_support::throwing_model>()).embed_one("boom");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::embedding_unavailable);
}

TEST_CASE("slow model reports timeout", "[embedder][timeout]") {
  auto model = std::make_shared<table_model>("table", 4);
  model->set_latency(std::chrono::milliseconds{200});
  embedder e(model, embedder_options{8, std::chrono::milliseconds{20}, true});
  auto r = e.embed_one("late");
  REQUIRE_FALSE(r.has_value());
  REQUIRE(r.error().code == core::error_code::timeout);
}

TEST_CASE("empty input embeds to an empty result without calling the model", "[embedder]") {
  auto model = std::make_shared<table_model>("table", 4);
  auto r = embedder(model).embed(std::vector<std::string>{});
  REQUIRE(r.has_value());
  REQUIRE(r->empty());
  REQUIRE(model->calls() == 0);
}
