#include "gleaner/config.hpp"

#include <yaml-cpp/yaml.h>

#include "gleaner/core/platform_utils.hpp"

namespace gleaner {

using core::error_code;

namespace {

auto invalid(const std::string& what) -> std::unexpected<core::error> {
  return core::make_unexpected(error_code::config_invalid, what, "config");
}

void load_store(const YAML::Node& n, store_settings& s) {
  if (n["path"]) s.path = n["path"].as<std::string>();
  if (n["durability"]) {
    const auto name = n["durability"].as<std::string>();
    auto d = parse_durability(name);
    if (!d) throw YAML::Exception(n["durability"].Mark(), "unknown durability profile '" + name + "'");
    s.durability = *d;
  }
  if (n["wal_max_file_bytes"]) s.wal_max_file_bytes = n["wal_max_file_bytes"].as<std::uint64_t>();
  if (n["checkpoint_wal_bytes"]) s.checkpoint_wal_bytes = n["checkpoint_wal_bytes"].as<std::uint64_t>();
  if (n["lock_timeout_ms"]) s.lock_timeout = std::chrono::milliseconds(n["lock_timeout_ms"].as<std::int64_t>());
}

void load_chunking(const YAML::Node& n, chunker_config& c) {
  if (n["chunk_size"]) c.chunk_size = n["chunk_size"].as<std::size_t>();
  if (n["overlap"]) c.overlap = n["overlap"].as<std::size_t>();
  if (n["min_chunk_size"]) c.min_chunk_size = n["min_chunk_size"].as<std::size_t>();
}

void load_embedding(const YAML::Node& n, embedding_settings& e) {
  if (n["model_id"]) e.model_id = n["model_id"].as<std::string>();
  if (n["dimension"]) e.dimension = n["dimension"].as<std::uint32_t>();
  if (n["max_batch_size"]) e.options.max_batch_size = n["max_batch_size"].as<std::size_t>();
  if (n["timeout_ms"]) e.options.timeout = std::chrono::milliseconds(n["timeout_ms"].as<std::int64_t>());
  if (n["normalize"]) e.options.normalize = n["normalize"].as<bool>();
}

void load_ingestion(const YAML::Node& n, retry_policy& r, ingestion_options& o) {
  if (n["max_attempts"]) r.max_attempts = n["max_attempts"].as<std::uint32_t>();
  if (n["initial_backoff_ms"]) r.initial_backoff = std::chrono::milliseconds(n["initial_backoff_ms"].as<std::int64_t>());
  if (n["multiplier"]) r.multiplier = n["multiplier"].as<double>();
  if (n["max_backoff_ms"]) r.max_backoff = std::chrono::milliseconds(n["max_backoff_ms"].as<std::int64_t>());
  if (n["embed_batch_size"]) o.embed_batch_size = n["embed_batch_size"].as<std::size_t>();
  if (n["default_collection"]) o.default_collection = n["default_collection"].as<std::string>();
}

void load_retrieval(const YAML::Node& n, retriever_options& r) {
  if (n["top_k"]) r.top_k = n["top_k"].as<std::size_t>();
  if (n["overfetch_factor"]) r.overfetch_factor = n["overfetch_factor"].as<std::size_t>();
  if (n["max_chunks_per_document"]) r.max_chunks_per_document = n["max_chunks_per_document"].as<std::size_t>();
  if (n["min_score"]) r.min_score = n["min_score"].as<float>();
}

auto env_size(const char* name, std::size_t& out) -> std::expected<void, core::error> {
  auto v = core::safe_getenv(name);
  if (!v || v->empty()) return {};
  try {
    std::size_t used = 0;
    const auto parsed = std::stoull(*v, &used);
    if (used != v->size()) return invalid(std::string(name) + " is not a number: '" + *v + "'");
    out = static_cast<std::size_t>(parsed);
  } catch (const std::exception&) {
    return invalid(std::string(name) + " is not a number: '" + *v + "'");
  }
  return {};
}

} // namespace

auto parse_durability(std::string_view name) -> std::optional<wal::DurabilityProfile> {
  using wal::DurabilityProfile;
  if (name == "none") return DurabilityProfile::None;
  if (name == "rotation") return DurabilityProfile::Rotation;
  if (name == "flush") return DurabilityProfile::Flush;
  if (name == "rotation_and_flush") return DurabilityProfile::RotationAndFlush;
  return std::nullopt;
}

auto load_settings(const std::filesystem::path& path) -> std::expected<settings, core::error> {
  settings s;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return invalid("config file not found: " + path.string());
  try {
    const YAML::Node root = YAML::LoadFile(path.string());
    if (root["store"]) load_store(root["store"], s.store);
    if (root["chunking"]) load_chunking(root["chunking"], s.chunking);
    if (root["embedding"]) load_embedding(root["embedding"], s.embedding);
    if (root["ingestion"]) load_ingestion(root["ingestion"], s.retry, s.ingestion);
    if (root["retrieval"]) load_retrieval(root["retrieval"], s.retrieval);
    if (root["logging"]) {
      const auto n = root["logging"];
      if (n["level"]) s.logging.level = n["level"].as<std::string>();
      if (n["file"]) s.logging.file = n["file"].as<std::string>();
    }
  } catch (const YAML::Exception& e) {
    return invalid(path.string() + ": " + e.what());
  }
  return s;
}

auto apply_env_overrides(settings& s) -> std::expected<void, core::error> {
  if (auto v = core::safe_getenv("GLEANER_STORE_PATH"); v && !v->empty()) s.store.path = *v;
  if (auto v = core::safe_getenv("GLEANER_LOG_LEVEL"); v && !v->empty()) s.logging.level = *v;
  if (auto r = env_size("GLEANER_CHUNK_SIZE", s.chunking.chunk_size); !r) return r;
  if (auto r = env_size("GLEANER_CHUNK_OVERLAP", s.chunking.overlap); !r) return r;
  if (auto r = env_size("GLEANER_TOP_K", s.retrieval.top_k); !r) return r;
  return {};
}

auto validate(const settings& s) -> std::expected<void, core::error> {
  if (s.store.path.empty()) return invalid("store.path must not be empty");
  if (auto r = validate(s.chunking); !r) return r;
  if (s.embedding.model_id.empty()) return invalid("embedding.model_id must not be empty");
  if (s.embedding.dimension == 0) return invalid("embedding.dimension must be > 0");
  if (s.embedding.options.max_batch_size == 0) return invalid("embedding.max_batch_size must be > 0");
  if (s.retry.max_attempts == 0) return invalid("ingestion.max_attempts must be >= 1");
  if (s.retry.multiplier < 1.0) return invalid("ingestion.multiplier must be >= 1");
  if (s.ingestion.embed_batch_size == 0) return invalid("ingestion.embed_batch_size must be > 0");
  if (s.ingestion.default_collection.empty()) return invalid("ingestion.default_collection must not be empty");
  if (s.retrieval.top_k == 0) return invalid("retrieval.top_k must be > 0");
  if (s.retrieval.overfetch_factor < 1) return invalid("retrieval.overfetch_factor must be >= 1");
  return {};
}

} // namespace gleaner
