#include <catch2/catch_all.hpp>
#include <gleaner/gleaner.hpp>
#include <tests/support/index_fixtures.hpp>

using namespace gleaner;
using namespace test_support;

namespace {

const std::string syllabus =
    "Week one covers processes, threads and the system call interface of a Unix kernel.\n\n"
    "Week two covers deadlock: mutual exclusion, hold and wait, no preemption, circular wait.\n\n"
    "Week three covers virtual memory, paging and the translation lookaside buffer.";

const chunker_config paragraph_chunks{100, 0, 0};

document upload(const std::string& filename, const std::string& text) {
  document d;
  d.filename = filename;
  d.collection = "os101";
  d.text = text;
  return d;
}

} // namespace

TEST_CASE("an ingested document is retrievable by the passage a question is about", "[e2e]") {
  temp_dir tmp("e2e_table");
  auto store = open_store(fast_settings(tmp.path()));

  auto chunks = chunk_text(syllabus, paragraph_chunks);
  REQUIRE(chunks.has_value());
  REQUIRE(chunks->size() == 3);

  auto model = std::make_shared<table_model>("test-model", 3);
  model->set((*chunks)[0].text, {1, 0, 0});
  model->set((*chunks)[1].text, {0, 1, 0});
  model->set((*chunks)[2].text, {0, 0, 1});
  model->set("what are the conditions for deadlock?", {0.1f, 0.9f, 0.1f});

  ingestion_pipeline pipeline(*store, embedder(model), paragraph_chunks);
  auto doc = pipeline.ingest(upload("syllabus.pdf", syllabus));
  REQUIRE(doc.has_value());
  REQUIRE(doc->indexed());
  REQUIRE(std::get<indexed_status>(doc->status).chunk_count == 3);

  retriever ret(*store, embedder(model), retriever_options{2});
  auto result = ret.retrieve("what are the conditions for deadlock?", "os101");
  REQUIRE(result.has_value());
  REQUIRE(result->size() == 2);
  REQUIRE(result->passages[0].chunk_id == make_chunk_id("syllabus.pdf", 1));
  REQUIRE(result->passages[0].document_id == "syllabus.pdf");
  REQUIRE(result->passages[0].text == (*chunks)[1].text);
  REQUIRE(sources(*result) == std::vector<std::string>{"syllabus.pdf"});

  REQUIRE(store->ensure_collection("empty", model->identity()).has_value());
  auto nothing = ret.retrieve("what are the conditions for deadlock?", "empty");
  REQUIRE(nothing.has_value());
  REQUIRE(nothing->empty());
}

TEST_CASE("the hashing model ranks a passage's own text first across a restart", "[e2e][durability]") {
  temp_dir tmp("e2e_hashing");
  auto settings = fast_settings(tmp.path());
  settings.durability = wal::DurabilityProfile::Flush;
  auto model = std::make_shared<hashing_embedding_model>(256);

  {
    auto store = open_store(settings);
    ingestion_pipeline pipeline(*store, embedder(model), paragraph_chunks);
    REQUIRE(pipeline.ingest(upload("syllabus.pdf", syllabus))->indexed());
    REQUIRE(pipeline.ingest(upload("notes.txt", "Office hours are on Tuesday afternoons."))->indexed());
    REQUIRE(store->close().has_value());
  }

  auto store = open_store(settings);
  auto stats = store->stats("os101");
  REQUIRE(stats.has_value());
  REQUIRE(stats->documents == 2);
  REQUIRE(stats->chunks == 4);

  retriever ret(*store, embedder(model));
  const std::string question =
      "Week three covers virtual memory, paging and the translation lookaside buffer.";
  auto result = ret.retrieve(question, "os101", 1);
  REQUIRE(result.has_value());
  REQUIRE(result->size() == 1);
  REQUIRE(result->passages[0].chunk_id == make_chunk_id("syllabus.pdf", 2));
  REQUIRE(result->passages[0].score == Catch::Approx(1.0f).margin(1e-4));

  REQUIRE_THAT(ret.document_context("os101", {"syllabus.pdf"}).value(),
               Catch::Matchers::ContainsSubstring("Week two covers deadlock"));
}
