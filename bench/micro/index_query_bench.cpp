#include <benchmark/benchmark.h>
#include <gleaner/chunker.hpp>
#include <gleaner/embedder.hpp>
#include <gleaner/index_store.hpp>
#include <gleaner/logging.hpp>

#include <cmath>
#include <filesystem>
#include <random>
#include <string>
#include <vector>

using namespace gleaner;

namespace {

std::vector<float> random_unit(std::uint32_t dim, std::mt19937& gen) {
  std::normal_distribution<float> dist(0.0f, 1.0f);
  std::vector<float> v(dim);
  float n = 0.0f;
  for (auto& x : v) { x = dist(gen); n += x * x; }
  n = std::sqrt(n);
  for (auto& x : v) x /= n;
  return v;
}

std::filesystem::path bench_dir(const std::string& tag) {
  auto p = std::filesystem::temp_directory_path() / ("gleaner_bench_" + tag);
  std::filesystem::remove_all(p);
  return p;
}

} // namespace

static void BenchIndexQuery(benchmark::State& state) {
  const auto chunks = static_cast<std::size_t>(state.range(0));
  const std::uint32_t dim = 384;
  if (!log::configure(log::logging_settings{"warn", ""})) { state.SkipWithError("logging"); return; }

  store_settings s;
  s.path = bench_dir("query");
  s.durability = wal::DurabilityProfile::None;
  s.checkpoint_wal_bytes = 1ull << 40;
  auto store = index_store::open(s);
  if (!store) { state.SkipWithError(store.error().message.c_str()); return; }
  const model_identity id{"bench", dim, metric::cosine};
  if (!(*store)->ensure_collection("bench", id)) { state.SkipWithError("ensure_collection"); return; }

  std::mt19937 gen(42);
  const std::size_t per_doc = 50;
  for (std::size_t d = 0; d * per_doc < chunks; ++d) {
    const auto doc_id = "doc" + std::to_string(d);
    auto w = (*store)->begin_document("bench", doc_id, "v1");
    if (!w) { state.SkipWithError(w.error().message.c_str()); return; }
    std::vector<record> batch;
    for (std::size_t i = 0; i < per_doc && d * per_doc + i < chunks; ++i) {
      record r;
      r.document_id = doc_id;
      r.sequence_index = static_cast<std::uint32_t>(i);
      r.chunk_id = make_chunk_id(doc_id, r.sequence_index);
      r.text = "passage";
      r.model_id = "bench";
      r.vector = random_unit(dim, gen);
      batch.push_back(std::move(r));
    }
    if (!w->stage(batch) || !w->commit()) { state.SkipWithError("ingest"); return; }
  }

  const auto q = random_unit(dim, gen);
  for (auto _ : state) {
    auto hits = (*store)->query("bench", q, 8);
    benchmark::DoNotOptimize(hits);
  }
  state.SetItemsProcessed(static_cast<int64_t>(state.iterations() * chunks));
  if (!(*store)->close()) state.SkipWithError("close");
  std::filesystem::remove_all(s.path);
}
BENCHMARK(BenchIndexQuery)->Arg(1000)->Arg(10000);

static void BenchChunkText(benchmark::State& state) {
  std::string text;
  for (int i = 0; i < 2000; ++i) text += "Sentence number " + std::to_string(i) + " talks about scheduling. ";
  const chunker_config cfg{1000, 200, 0};
  for (auto _ : state) {
    auto chunks = chunk_text(text, cfg);
    benchmark::DoNotOptimize(chunks);
  }
  state.SetBytesProcessed(static_cast<int64_t>(state.iterations() * text.size()));
}
BENCHMARK(BenchChunkText);

static void BenchHashingEmbed(benchmark::State& state) {
  hashing_embedding_model model(384);
  const std::string text = "Deadlock requires mutual exclusion, hold and wait, no preemption and circular wait.";
  for (auto _ : state) {
    benchmark::DoNotOptimize(model.embed_text(text));
  }
}
BENCHMARK(BenchHashingEmbed);

BENCHMARK_MAIN();
