/**
 * Ingest text files and ask a question against them.
 *
 *   ingest_and_query <collection> <question> <file>...
 *
 * Settings come from $GLEANER_CONFIG (a YAML file) when set, then from the
 * GLEANER_* environment variables. The local hashing model stands in for a
 * hosted embedding service.
 */

#include <gleaner/gleaner.hpp>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>

namespace {

std::expected<gleaner::settings, gleaner::core::error> load() {
  gleaner::settings s;
  if (const char* path = std::getenv("GLEANER_CONFIG"); path && *path) {
    auto loaded = gleaner::load_settings(path);
    if (!loaded) return std::unexpected(loaded.error());
    s = std::move(*loaded);
  }
  if (auto r = gleaner::apply_env_overrides(s); !r) return std::unexpected(r.error());
  if (auto r = gleaner::validate(s); !r) return std::unexpected(r.error());
  return s;
}

int fail(const gleaner::core::error& e) {
  std::cerr << "error: " << gleaner::core::to_string(e.code) << ": " << e.message << "\n";
  return 1;
}

}  // namespace

int main(int argc, char** argv) {
  using namespace gleaner;

  if (argc < 4) {
    std::cerr << "usage: " << argv[0] << " <collection> <question> <file>...\n";
    return 2;
  }
  const std::string collection = argv[1];
  const std::string question = argv[2];

  auto cfg = load();
  if (!cfg) return fail(cfg.error());
  if (auto r = log::configure(cfg->logging); !r) return fail(r.error());

  auto store = index_store::open(cfg->store);
  if (!store) return fail(store.error());

  auto model = std::make_shared<hashing_embedding_model>(cfg->embedding.dimension, cfg->embedding.model_id);
  embedder emb(model, cfg->embedding.options);
  ingestion_pipeline pipeline(**store, emb, cfg->chunking, cfg->retry, cfg->ingestion);

  for (int i = 3; i < argc; ++i) {
    std::ifstream in(argv[i], std::ios::binary);
    if (!in) {
      std::cerr << "skipping unreadable file " << argv[i] << "\n";
      continue;
    }
    std::stringstream body;
    body << in.rdbuf();

    document doc;
    doc.filename = argv[i];
    doc.collection = collection;
    doc.text = body.str();
    auto result = pipeline.ingest(std::move(doc));
    if (!result) return fail(result.error());
    std::cout << argv[i] << ": " << status_name(result->status);
    if (const auto* f = std::get_if<failed_status>(&result->status)) {
      std::cout << " at " << to_string(f->stage) << " (" << f->message << ")";
    } else if (const auto* ok = std::get_if<indexed_status>(&result->status)) {
      std::cout << " (" << ok->chunk_count << " chunks)";
    }
    std::cout << "\n";
  }

  retriever ret(**store, emb, cfg->retrieval);
  auto found = ret.retrieve(question, collection);
  if (!found) return fail(found.error());

  std::cout << "\nTop " << found->size() << " passages for: " << question << "\n";
  for (const auto& p : found->passages) {
    std::cout << "  [" << p.score << "] " << p.filename << " #" << p.sequence_index << "\n    "
              << p.text.substr(0, 160) << (p.text.size() > 160 ? "..." : "") << "\n";
  }
  const auto srcs = sources(*found);
  std::cout << "\nSources:";
  for (const auto& s : srcs) std::cout << " " << s;
  std::cout << "\n";

  if (auto r = (*store)->close(); !r) return fail(r.error());
  return 0;
}
