#include "gleaner/index_store.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <sstream>
#include <utility>

#include "codec.hpp"
#include "gleaner/filter_eval.hpp"
#include "gleaner/kernels/distance.hpp"
#include "gleaner/logging.hpp"
#include "gleaner/wal/replay.hpp"
#include "gleaner/wal/snapshot.hpp"

namespace gleaner {

namespace fs = std::filesystem;
using core::error_code;

namespace {
constexpr const char* META_FILE = "collection.meta";
constexpr const char* SNAPSHOT_FILE = "records.snapshot";
constexpr const char* META_HEADER = "gleaner-collection 1";
} // namespace

namespace detail {

struct stored_record {
  record rec;
  std::uint64_t seq{};
};

struct document_entry {
  std::string fingerprint;
  std::vector<std::string> chunk_ids;
};

struct collection_state {
  std::string name;
  fs::path dir;
  model_identity identity;

  // Guards records and documents.
  mutable std::shared_timed_mutex mu;
  std::unordered_map<std::string, stored_record> records;
  std::unordered_map<std::string, document_entry> documents;
  std::uint64_t next_seq{1};

  // Guards everything below.
  std::timed_mutex wal_mu;
  wal::WalWriter wal;
  std::uint64_t next_lsn{1};
  std::uint64_t next_txn{1};
  std::uint64_t last_commit_lsn{};
  std::uint64_t bytes_at_checkpoint{};
  std::size_t open_txns{};
  bool dropped{false};
  bool closed{false};
  std::optional<core::error> broken;

  // One mutex per document id with a holder or waiter; entries go away when unused.
  struct doc_lock_entry {
    std::timed_mutex mu;
    std::size_t users{};
  };
  std::mutex doc_table_mu;
  std::unordered_map<std::string, std::unique_ptr<doc_lock_entry>> doc_table;
};

/** \brief Exclusive hold on one document id of a collection; released on destruction. */
class document_lock {
public:
  document_lock() = default;
  document_lock(document_lock&& other) noexcept
      : st_(std::exchange(other.st_, nullptr)), id_(std::move(other.id_)), entry_(std::exchange(other.entry_, nullptr)) {}
  document_lock& operator=(document_lock&& other) noexcept {
    if (this != &other) {
      release();
      st_ = std::exchange(other.st_, nullptr);
      id_ = std::move(other.id_);
      entry_ = std::exchange(other.entry_, nullptr);
    }
    return *this;
  }
  document_lock(const document_lock&) = delete;
  document_lock& operator=(const document_lock&) = delete;
  ~document_lock() { release(); }

  /** \brief Waits up to timeout for the document; nullopt on expiry. */
  static auto acquire(collection_state& st, const std::string& document_id, std::chrono::milliseconds timeout)
      -> std::optional<document_lock> {
    collection_state::doc_lock_entry* entry = nullptr;
    {
      std::lock_guard table(st.doc_table_mu);
      auto& slot = st.doc_table[document_id];
      if (!slot) slot = std::make_unique<collection_state::doc_lock_entry>();
      entry = slot.get();
      ++entry->users;
    }
    if (!entry->mu.try_lock_for(timeout)) {
      drop_user(st, document_id, entry);
      return std::nullopt;
    }
    document_lock held;
    held.st_ = &st;
    held.id_ = document_id;
    held.entry_ = entry;
    return held;
  }

  void release() noexcept {
    if (!entry_) return;
    entry_->mu.unlock();
    drop_user(*st_, id_, entry_);
    entry_ = nullptr;
    st_ = nullptr;
  }

private:
  static void drop_user(collection_state& st, const std::string& id, collection_state::doc_lock_entry* entry) noexcept {
    std::lock_guard table(st.doc_table_mu);
    if (--entry->users == 0) st.doc_table.erase(id);
  }

  collection_state* st_{nullptr};
  std::string id_;
  collection_state::doc_lock_entry* entry_{nullptr};
};

} // namespace detail

namespace {

using detail::collection_state;

auto lock_timeout_error(const std::string& what) -> std::unexpected<core::error> {
  return core::make_unexpected(error_code::timeout, "timed out waiting for " + what, "index");
}

auto valid_collection_name(const std::string& name) -> bool {
  if (name.empty() || name == "." || name == ".." || name.size() > 128) return false;
  return std::all_of(name.begin(), name.end(), [](char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
  });
}

auto validate_record(const collection_state& st, const record& r) -> std::expected<void, core::error> {
  if (r.chunk_id.empty() || r.document_id.empty()) {
    return core::make_unexpected(error_code::invalid_argument, "record needs chunk_id and document_id", "index");
  }
  if (r.model_id != st.identity.model_id) {
    return core::make_unexpected(error_code::dimension_mismatch,
                                 "record from model '" + r.model_id + "' cannot join collection '" + st.name +
                                     "' bound to '" + st.identity.model_id + "'",
                                 "index");
  }
  if (r.vector.size() != st.identity.dimension) {
    return core::make_unexpected(error_code::dimension_mismatch,
                                 "vector has " + std::to_string(r.vector.size()) + " dimensions, collection '" +
                                     st.name + "' expects " + std::to_string(st.identity.dimension),
                                 "index");
  }
  for (float v : r.vector) {
    if (!std::isfinite(v)) {
      return core::make_unexpected(error_code::invalid_argument, "vector has non-finite components", "index");
    }
  }
  return {};
}

// --- in-memory application, shared by live commits and replay -------------

void erase_chunk(collection_state& st, const std::string& chunk_id) {
  auto it = st.records.find(chunk_id);
  if (it == st.records.end()) return;
  if (auto d = st.documents.find(it->second.rec.document_id); d != st.documents.end()) {
    auto& ids = d->second.chunk_ids;
    ids.erase(std::remove(ids.begin(), ids.end(), chunk_id), ids.end());
    if (ids.empty()) st.documents.erase(d);
  }
  st.records.erase(it);
}

auto erase_document(collection_state& st, const std::string& document_id) -> std::size_t {
  auto d = st.documents.find(document_id);
  if (d == st.documents.end()) return 0;
  const auto ids = std::move(d->second.chunk_ids);
  st.documents.erase(d);
  for (const auto& id : ids) st.records.erase(id);
  return ids.size();
}

void apply_op(collection_state& st, detail::index_op op, std::string& pending_fingerprint) {
  if (auto* u = std::get_if<detail::upsert_op>(&op)) {
    std::string kept_fingerprint = pending_fingerprint;
    if (auto d = st.documents.find(u->rec.document_id); d != st.documents.end() && kept_fingerprint.empty()) {
      kept_fingerprint = d->second.fingerprint;
    }
    erase_chunk(st, u->rec.chunk_id);
    auto& doc = st.documents[u->rec.document_id];
    if (doc.chunk_ids.empty()) doc.fingerprint = kept_fingerprint;
    doc.chunk_ids.push_back(u->rec.chunk_id);
    const auto id = u->rec.chunk_id;
    st.records[id] = detail::stored_record{std::move(u->rec), st.next_seq++};
  } else if (auto* rm = std::get_if<detail::remove_document_op>(&op)) {
    erase_document(st, rm->document_id);
  } else if (auto* rp = std::get_if<detail::replace_document_op>(&op)) {
    erase_document(st, rp->document_id);
    pending_fingerprint = rp->fingerprint;
  }
}

void apply_ops(collection_state& st, std::vector<detail::index_op>& ops) {
  std::string pending_fingerprint;
  for (auto& op : ops) apply_op(st, std::move(op), pending_fingerprint);
}

// --- metadata --------------------------------------------------------------

auto write_meta(const fs::path& dir, const model_identity& id) -> std::expected<void, core::error> {
  std::ostringstream out;
  out << META_HEADER << "\n"
      << "model_id=" << id.model_id << "\n"
      << "dimension=" << id.dimension << "\n"
      << "metric=" << to_string(id.native_metric) << "\n";
  const auto text = out.str();
  return wal::write_file_atomic(dir / META_FILE,
                                {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()});
}

auto read_meta(const fs::path& dir) -> std::expected<model_identity, core::error> {
  std::ifstream in(dir / META_FILE);
  if (!in.good()) return core::make_unexpected(error_code::not_found, "collection metadata missing", "index.meta");
  auto bad = [&](const std::string& why) {
    return core::make_unexpected(error_code::data_integrity, (dir / META_FILE).string() + ": " + why, "index.meta");
  };
  std::string line;
  if (!std::getline(in, line) || line != META_HEADER) return bad("bad header");
  model_identity id;
  bool have_model = false, have_dim = false;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos) return bad("malformed line");
    const auto key = line.substr(0, eq);
    const auto value = line.substr(eq + 1);
    if (key == "model_id") {
      id.model_id = value;
      have_model = true;
    } else if (key == "dimension") {
      try {
        id.dimension = static_cast<std::uint32_t>(std::stoul(value));
      } catch (const std::exception&) {
        return bad("dimension is not a number");
      }
      have_dim = id.dimension > 0;
    } else if (key == "metric") {
      auto m = parse_metric(value);
      if (!m) return bad("unknown metric '" + value + "'");
      id.native_metric = *m;
    }
  }
  if (!have_model || !have_dim) return bad("incomplete identity");
  return id;
}

auto wal_options(const fs::path& dir, const store_settings& s) -> wal::WalWriterOptions {
  wal::WalWriterOptions o;
  o.dir = dir;
  o.max_file_bytes = s.wal_max_file_bytes;
  o.durability = s.durability;
  return o;
}

auto recover_collection(const std::string& name, const fs::path& dir, const store_settings& s)
    -> std::expected<std::shared_ptr<collection_state>, core::error> {
  auto ident = read_meta(dir);
  if (!ident) return std::unexpected(ident.error());
  auto st = std::make_shared<collection_state>();
  st->name = name;
  st->dir = dir;
  st->identity = *ident;

  std::uint64_t cutoff = 0;
  if (auto bytes = wal::read_file(dir / SNAPSHOT_FILE); bytes) {
    auto img = detail::decode_snapshot(*bytes);
    if (!img) return std::unexpected(img.error());
    cutoff = img->last_lsn;
    st->next_seq = img->next_seq;
    st->next_txn = img->next_txn;
    for (auto& [seq, rec] : img->records) {
      st->documents[rec.document_id].chunk_ids.push_back(rec.chunk_id);
      const auto id = rec.chunk_id;
      st->records[id] = detail::stored_record{std::move(rec), seq};
    }
    for (auto& [doc_id, fp] : img->documents) {
      if (auto d = st->documents.find(doc_id); d != st->documents.end()) d->second.fingerprint = std::move(fp);
    }
  } else if (bytes.error().code != error_code::not_found) {
    return std::unexpected(bytes.error());
  }

  auto repaired = wal::repair_torn_tail(dir);
  if (!repaired) return std::unexpected(repaired.error());
  if (*repaired) log::get()->warn("[index] {}: truncated torn log tail", name);

  auto replay = wal::replay_committed(dir, cutoff, [&](const wal::committed_txn& t) -> std::expected<void, core::error> {
    std::vector<detail::index_op> ops;
    ops.reserve(t.ops.size());
    for (const auto& body : t.ops) {
      auto op = detail::decode_op(body);
      if (!op) return std::unexpected(op.error());
      ops.push_back(std::move(*op));
    }
    apply_ops(*st, ops);
    st->last_commit_lsn = t.commit_lsn;
    return {};
  });
  if (!replay) return std::unexpected(replay.error());
  if (replay->incomplete > 0) {
    log::get()->warn("[index] {}: discarded {} uncommitted transaction(s)", name, replay->incomplete);
  }

  st->next_lsn = std::max(cutoff, replay->scan.last_lsn) + 1;
  st->next_txn = std::max(st->next_txn, replay->max_txn_id + 1);
  st->last_commit_lsn = std::max(st->last_commit_lsn, cutoff);

  auto w = wal::WalWriter::open(wal_options(dir, s));
  if (!w) return std::unexpected(w.error());
  st->wal = std::move(*w);
  log::get()->info("[index] recovered collection '{}': {} chunks, {} documents, {} transactions replayed",
                   name, st->records.size(), st->documents.size(), replay->committed);
  return st;
}

// --- log helpers; callers hold wal_mu ---------------------------------------

auto check_writable(const collection_state& st) -> std::expected<void, core::error> {
  if (st.dropped) return core::make_unexpected(error_code::not_found, "collection '" + st.name + "' was dropped", "index");
  if (st.closed) return core::make_unexpected(error_code::precondition_failed, "index store is closed", "index");
  if (st.broken) {
    return core::make_unexpected(error_code::io_failed,
                                 "collection log unavailable after earlier failure: " + st.broken->message, "index");
  }
  return {};
}

auto append_locked(collection_state& st, std::uint64_t txn, wal::frame_type type,
                   std::span<const std::uint8_t> body = {}) -> std::expected<void, core::error> {
  const auto payload = wal::txn_payload(txn, body);
  auto r = st.wal.append(st.next_lsn, type, payload);
  if (!r) return r;
  ++st.next_lsn;
  return {};
}

// Writes the commit frame, makes it durable and applies ops to memory.
auto commit_locked(collection_state& st, std::uint64_t txn, std::vector<detail::index_op>& ops)
    -> std::expected<void, core::error> {
  if (auto r = append_locked(st, txn, wal::frame_type::commit); !r) return r;
  const auto commit_lsn = st.next_lsn - 1;
  if (auto r = st.wal.flush(); !r) {
    // The commit frame may still reach the disk later; memory can no longer be trusted to match.
    st.broken = r.error();
    log::get()->error("[index] {}: log flush failed, collection is read-only until reopened: {}", st.name,
                      r.error().message);
    return r;
  }
  std::unique_lock state_lock(st.mu);
  apply_ops(st, ops);
  st.last_commit_lsn = commit_lsn;
  return {};
}

auto checkpoint_locked(collection_state& st) -> std::expected<void, core::error> {
  if (st.open_txns > 0) {
    return core::make_unexpected(error_code::precondition_failed,
                                 "cannot checkpoint '" + st.name + "' while document writers are open", "index");
  }
  detail::snapshot_image img;
  {
    std::shared_lock state_lock(st.mu);
    img.last_lsn = st.next_lsn - 1;
    img.next_seq = st.next_seq;
    img.next_txn = st.next_txn;
    img.documents.reserve(st.documents.size());
    for (const auto& [id, doc] : st.documents) img.documents.emplace_back(id, doc.fingerprint);
    img.records.reserve(st.records.size());
    for (const auto& [id, sr] : st.records) img.records.emplace_back(sr.seq, sr.rec);
  }
  std::sort(img.documents.begin(), img.documents.end());
  std::sort(img.records.begin(), img.records.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });

  const auto bytes = detail::encode_snapshot(img);
  if (auto r = wal::write_file_atomic(st.dir / SNAPSHOT_FILE, bytes); !r) return r;
  if (auto r = st.wal.rotate(); !r) return r;
  auto purged = wal::purge_wal(st.dir, img.last_lsn, st.wal.index());
  if (!purged) return std::unexpected(purged.error());
  st.bytes_at_checkpoint = st.wal.stats().bytes;
  log::get()->info("[index] checkpoint '{}' at lsn {}: {} records, {} log files purged", st.name, img.last_lsn,
                   img.records.size(), *purged);
  return {};
}

void maybe_checkpoint_locked(collection_state& st, std::uint64_t threshold) {
  if (threshold == 0 || st.open_txns > 0) return;
  if (st.wal.stats().bytes - st.bytes_at_checkpoint < threshold) return;
  if (auto r = checkpoint_locked(st); !r) {
    log::get()->warn("[index] automatic checkpoint of '{}' failed: {}", st.name, r.error().message);
  }
}

// Logs and applies the removal of a document in its own transaction; wal_mu held.
auto remove_document_locked(collection_state& st, const std::string& document_id)
    -> std::expected<std::size_t, core::error> {
  std::size_t present = 0;
  {
    std::shared_lock state_lock(st.mu);
    if (auto d = st.documents.find(document_id); d != st.documents.end()) present = d->second.chunk_ids.size();
  }
  if (present == 0) return 0;
  const auto txn = st.next_txn++;
  std::vector<detail::index_op> ops;
  ops.emplace_back(detail::remove_document_op{document_id});
  if (auto a = append_locked(st, txn, wal::frame_type::op, detail::encode_op(ops.front())); !a) {
    return std::unexpected(a.error());
  }
  if (auto r = commit_locked(st, txn, ops); !r) return std::unexpected(r.error());
  return present;
}

} // namespace

// --- document_writer ---------------------------------------------------------

struct document_writer::impl {
  std::shared_ptr<collection_state> st;
  detail::document_lock doc_lock;
  std::string document_id;
  std::string fingerprint;
  std::uint64_t txn{};
  std::vector<record> staged;
  std::chrono::milliseconds lock_timeout{};
  std::uint64_t checkpoint_bytes{};
  bool poisoned{false};
  bool finished{false};

  // Releases the transaction slot and the document lock; wal_mu held.
  void finish_locked() {
    finished = true;
    if (st->open_txns > 0) --st->open_txns;
  }
};

document_writer::document_writer(std::unique_ptr<impl> p) : impl_(std::move(p)) {}
document_writer::document_writer(document_writer&&) noexcept = default;

document_writer& document_writer::operator=(document_writer&& other) noexcept {
  if (this != &other) {
    if (impl_ && !impl_->finished) {
      if (auto r = abort(); !r) log::get()->warn("[index] abort of '{}' failed: {}", impl_->document_id, r.error().message);
    }
    impl_ = std::move(other.impl_);
  }
  return *this;
}

document_writer::~document_writer() {
  if (impl_ && !impl_->finished) {
    if (auto r = abort(); !r) {
      log::get()->warn("[index] abort of '{}' failed: {}", impl_->document_id, r.error().message);
    }
  }
}

const std::string& document_writer::document_id() const noexcept { return impl_->document_id; }
std::size_t document_writer::staged() const noexcept { return impl_->staged.size(); }

auto document_writer::stage(std::span<const record> records) -> std::expected<void, core::error> {
  auto& w = *impl_;
  if (w.finished) return core::make_unexpected(error_code::precondition_failed, "writer already finished", "index");
  if (w.poisoned) return core::make_unexpected(error_code::precondition_failed, "writer failed earlier; abort it", "index");
  for (const auto& r : records) {
    if (r.document_id != w.document_id) {
      return core::make_unexpected(error_code::invalid_argument,
                                   "record of '" + r.document_id + "' staged into writer of '" + w.document_id + "'",
                                   "index");
    }
    if (auto v = validate_record(*w.st, r); !v) return v;
  }

  std::unique_lock wal_lock(w.st->wal_mu, std::defer_lock);
  if (!wal_lock.try_lock_for(w.lock_timeout)) return lock_timeout_error("the collection log");
  if (auto c = check_writable(*w.st); !c) return c;
  for (const auto& r : records) {
    const auto body = detail::encode_op(detail::upsert_op{r});
    if (auto a = append_locked(*w.st, w.txn, wal::frame_type::op, body); !a) {
      w.poisoned = true;
      return a;
    }
  }
  w.staged.insert(w.staged.end(), records.begin(), records.end());
  return {};
}

auto document_writer::commit() -> std::expected<std::size_t, core::error> {
  auto& w = *impl_;
  if (w.finished) return core::make_unexpected(error_code::precondition_failed, "writer already finished", "index");
  if (w.poisoned) return core::make_unexpected(error_code::precondition_failed, "writer failed earlier; abort it", "index");

  std::unique_lock wal_lock(w.st->wal_mu, std::defer_lock);
  if (!wal_lock.try_lock_for(w.lock_timeout)) return lock_timeout_error("the collection log");
  if (auto c = check_writable(*w.st); !c) return std::unexpected(c.error());

  std::vector<detail::index_op> ops;
  ops.reserve(w.staged.size() + 1);
  ops.emplace_back(detail::replace_document_op{w.document_id, w.fingerprint});
  for (auto& r : w.staged) ops.emplace_back(detail::upsert_op{std::move(r)});
  const auto count = w.staged.size();
  w.staged.clear();

  if (auto r = commit_locked(*w.st, w.txn, ops); !r) {
    w.poisoned = true;
    return std::unexpected(r.error());
  }
  w.finish_locked();
  log::get()->debug("[index] committed '{}' into '{}': {} chunks (txn {})", w.document_id, w.st->name, count, w.txn);
  maybe_checkpoint_locked(*w.st, w.checkpoint_bytes);
  wal_lock.unlock();
  w.doc_lock.release();
  return count;
}

auto document_writer::abort() -> std::expected<void, core::error> {
  auto& w = *impl_;
  if (w.finished) return {};
  std::unique_lock wal_lock(w.st->wal_mu);
  w.staged.clear();
  w.finish_locked();
  std::expected<void, core::error> result{};
  if (!w.st->dropped && !w.st->closed && !w.st->broken) {
    result = append_locked(*w.st, w.txn, wal::frame_type::abort);
    if (result) result = w.st->wal.flush();
  }
  wal_lock.unlock();
  w.doc_lock.release();
  log::get()->debug("[index] aborted writer for '{}' (txn {})", w.document_id, w.txn);
  return result;
}

auto document_writer::retract() -> std::expected<std::size_t, core::error> {
  auto& w = *impl_;
  if (w.finished) return core::make_unexpected(error_code::precondition_failed, "writer already finished", "index");
  std::unique_lock wal_lock(w.st->wal_mu);
  w.staged.clear();
  w.finish_locked();
  auto result = [&]() -> std::expected<std::size_t, core::error> {
    if (auto c = check_writable(*w.st); !c) return std::unexpected(c.error());
    if (auto a = append_locked(*w.st, w.txn, wal::frame_type::abort); !a) return std::unexpected(a.error());
    auto removed = remove_document_locked(*w.st, w.document_id);
    if (!removed) return removed;
    if (*removed == 0) {
      // Nothing committed, so the abort frame is not flushed yet.
      if (auto f = w.st->wal.flush(); !f) return std::unexpected(f.error());
    } else {
      maybe_checkpoint_locked(*w.st, w.checkpoint_bytes);
    }
    return removed;
  }();
  wal_lock.unlock();
  w.doc_lock.release();
  if (result) log::get()->debug("[index] retracted '{}' (txn {}): {} chunks removed", w.document_id, w.txn, *result);
  return result;
}

// --- index_store -------------------------------------------------------------

index_store::index_store(store_settings settings) : settings_(std::move(settings)) {}

index_store::~index_store() {
  if (auto r = close(); !r) log::get()->warn("[index] close failed: {}", r.error().message);
}

auto index_store::open(store_settings settings) -> std::expected<std::unique_ptr<index_store>, core::error> {
  std::error_code ec;
  fs::create_directories(settings.path, ec);
  if (ec) {
    return core::make_unexpected(error_code::io_failed,
                                 "cannot create store directory " + settings.path.string() + ": " + ec.message(), "index");
  }
  std::unique_ptr<index_store> store(new index_store(std::move(settings)));
  const auto& root = store->settings_.path;
  for (const auto& entry : fs::directory_iterator(root, ec)) {
    if (!entry.is_directory() || !fs::exists(entry.path() / META_FILE)) continue;
    const auto name = entry.path().filename().string();
    auto st = recover_collection(name, entry.path(), store->settings_);
    if (!st) {
      log::get()->error("[index] failed to recover collection '{}': {}", name, st.error().message);
      return std::unexpected(st.error());
    }
    store->collections_.emplace(name, std::move(*st));
  }
  if (ec) {
    return core::make_unexpected(error_code::io_failed, "cannot list store directory: " + ec.message(), "index");
  }
  log::get()->info("[index] opened store at {} with {} collection(s)", root.string(), store->collections_.size());
  return store;
}

auto index_store::close() -> std::expected<void, core::error> {
  std::unique_lock catalog(catalog_mu_);
  if (closed_) return {};
  closed_ = true;
  std::expected<void, core::error> first_error{};
  for (auto& [name, st] : collections_) {
    std::unique_lock wal_lock(st->wal_mu);
    if (!st->broken) {
      if (auto r = st->wal.flush(true); !r && first_error) first_error = r;
    }
    st->closed = true;
    st->wal = wal::WalWriter{};
  }
  collections_.clear();
  return first_error;
}

auto index_store::find(const std::string& name) const
    -> std::expected<std::shared_ptr<detail::collection_state>, core::error> {
  std::shared_lock catalog(catalog_mu_);
  if (closed_) return core::make_unexpected(error_code::precondition_failed, "index store is closed", "index");
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    return core::make_unexpected(error_code::not_found, "collection '" + name + "' does not exist", "index");
  }
  return it->second;
}

auto index_store::ensure_collection(const std::string& name, const model_identity& identity)
    -> std::expected<void, core::error> {
  if (!valid_collection_name(name)) {
    return core::make_unexpected(error_code::invalid_argument, "invalid collection name '" + name + "'", "index");
  }
  if (identity.model_id.empty() || identity.dimension == 0) {
    return core::make_unexpected(error_code::invalid_argument, "model identity needs an id and a dimension", "index");
  }
  std::unique_lock catalog(catalog_mu_);
  if (closed_) return core::make_unexpected(error_code::precondition_failed, "index store is closed", "index");
  if (auto it = collections_.find(name); it != collections_.end()) {
    const auto& have = it->second->identity;
    if (have == identity) return {};
    return core::make_unexpected(error_code::dimension_mismatch,
                                 "collection '" + name + "' is bound to " + have.model_id + "/" +
                                     std::to_string(have.dimension) + ", not " + identity.model_id + "/" +
                                     std::to_string(identity.dimension),
                                 "index");
  }

  const auto dir = settings_.path / name;
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) return core::make_unexpected(error_code::io_failed, "cannot create " + dir.string() + ": " + ec.message(), "index");
  if (auto r = write_meta(dir, identity); !r) return r;

  auto st = std::make_shared<collection_state>();
  st->name = name;
  st->dir = dir;
  st->identity = identity;
  auto w = wal::WalWriter::open(wal_options(dir, settings_));
  if (!w) return std::unexpected(w.error());
  st->wal = std::move(*w);
  collections_.emplace(name, std::move(st));
  log::get()->info("[index] created collection '{}' for {} ({} dims, {})", name, identity.model_id,
                   identity.dimension, to_string(identity.native_metric));
  return {};
}

auto index_store::has_collection(const std::string& name) const -> bool {
  std::shared_lock catalog(catalog_mu_);
  return collections_.contains(name);
}

auto index_store::list_collections() const -> std::vector<std::string> {
  std::shared_lock catalog(catalog_mu_);
  std::vector<std::string> out;
  out.reserve(collections_.size());
  for (const auto& [name, st] : collections_) out.push_back(name);
  std::sort(out.begin(), out.end());
  return out;
}

auto index_store::drop_collection(const std::string& name) -> std::expected<void, core::error> {
  std::unique_lock catalog(catalog_mu_);
  auto it = collections_.find(name);
  if (it == collections_.end()) {
    return core::make_unexpected(error_code::not_found, "collection '" + name + "' does not exist", "index");
  }
  auto st = it->second;
  {
    std::unique_lock wal_lock(st->wal_mu, std::defer_lock);
    if (!wal_lock.try_lock_for(settings_.lock_timeout)) return lock_timeout_error("the collection log");
    std::unique_lock state_lock(st->mu);
    st->dropped = true;
    st->wal = wal::WalWriter{};
    st->records.clear();
    st->documents.clear();
  }
  collections_.erase(it);
  std::error_code ec;
  fs::remove_all(st->dir, ec);
  if (ec) {
    return core::make_unexpected(error_code::io_failed, "cannot remove " + st->dir.string() + ": " + ec.message(), "index");
  }
  log::get()->info("[index] dropped collection '{}'", name);
  return {};
}

auto index_store::upsert(const std::string& collection, const record& rec) -> std::expected<void, core::error> {
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  auto& s = **st;
  if (auto v = validate_record(s, rec); !v) return v;

  auto doc_lock = detail::document_lock::acquire(s, rec.document_id, settings_.lock_timeout);
  if (!doc_lock) return lock_timeout_error("document '" + rec.document_id + "'");
  std::unique_lock wal_lock(s.wal_mu, std::defer_lock);
  if (!wal_lock.try_lock_for(settings_.lock_timeout)) return lock_timeout_error("the collection log");
  if (auto c = check_writable(s); !c) return c;

  const auto txn = s.next_txn++;
  std::vector<detail::index_op> ops;
  ops.emplace_back(detail::upsert_op{rec});
  if (auto a = append_locked(s, txn, wal::frame_type::op, detail::encode_op(ops.front())); !a) return a;
  if (auto r = commit_locked(s, txn, ops); !r) return r;
  maybe_checkpoint_locked(s, settings_.checkpoint_wal_bytes);
  return {};
}

auto index_store::begin_document(const std::string& collection, const std::string& document_id,
                                 const std::string& fingerprint) -> std::expected<document_writer, core::error> {
  if (document_id.empty()) {
    return core::make_unexpected(error_code::invalid_argument, "document id must not be empty", "index");
  }
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  auto& s = **st;

  auto w = std::make_unique<document_writer::impl>();
  w->st = *st;
  w->document_id = document_id;
  w->fingerprint = fingerprint;
  w->lock_timeout = settings_.lock_timeout;
  w->checkpoint_bytes = settings_.checkpoint_wal_bytes;
  auto doc_lock = detail::document_lock::acquire(s, document_id, settings_.lock_timeout);
  if (!doc_lock) return lock_timeout_error("document '" + document_id + "'");
  w->doc_lock = std::move(*doc_lock);

  std::unique_lock wal_lock(s.wal_mu, std::defer_lock);
  if (!wal_lock.try_lock_for(settings_.lock_timeout)) return lock_timeout_error("the collection log");
  if (auto c = check_writable(s); !c) return std::unexpected(c.error());
  w->txn = s.next_txn++;
  ++s.open_txns;
  const auto body = detail::encode_op(detail::replace_document_op{document_id, fingerprint});
  if (auto a = append_locked(s, w->txn, wal::frame_type::op, body); !a) {
    --s.open_txns;
    return std::unexpected(a.error());
  }
  return document_writer(std::move(w));
}

auto index_store::remove_document(const std::string& collection, const std::string& document_id)
    -> std::expected<std::size_t, core::error> {
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  auto& s = **st;

  auto doc_lock = detail::document_lock::acquire(s, document_id, settings_.lock_timeout);
  if (!doc_lock) return lock_timeout_error("document '" + document_id + "'");
  std::size_t present = 0;
  {
    std::shared_lock state_lock(s.mu);
    if (auto d = s.documents.find(document_id); d != s.documents.end()) present = d->second.chunk_ids.size();
  }
  if (present == 0) return 0;

  std::unique_lock wal_lock(s.wal_mu, std::defer_lock);
  if (!wal_lock.try_lock_for(settings_.lock_timeout)) return lock_timeout_error("the collection log");
  if (auto c = check_writable(s); !c) return std::unexpected(c.error());
  auto removed = remove_document_locked(s, document_id);
  if (!removed) return removed;
  log::get()->info("[index] removed document '{}' from '{}' ({} chunks)", document_id, collection, *removed);
  maybe_checkpoint_locked(s, settings_.checkpoint_wal_bytes);
  return removed;
}

auto index_store::rank(const std::string& collection, std::span<const float> vector, std::size_t k,
                       const filter_expr* filter, const ranked_fn& emit) const -> std::expected<void, core::error> {
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  const auto& s = **st;
  if (vector.size() != s.identity.dimension) {
    return core::make_unexpected(error_code::dimension_mismatch,
                                 "query has " + std::to_string(vector.size()) + " dimensions, collection '" +
                                     collection + "' expects " + std::to_string(s.identity.dimension),
                                 "index");
  }
  if (k == 0) return {};

  std::shared_lock state_lock(s.mu, settings_.lock_timeout);
  if (!state_lock.owns_lock()) return lock_timeout_error("collection '" + collection + "'");

  struct scored {
    float score;
    std::uint64_t seq;
    const record* rec;
  };
  std::vector<scored> candidates;
  candidates.reserve(s.records.size());
  for (const auto& [id, sr] : s.records) {
    if (filter && !filter_eval::matches(*filter, sr.rec)) continue;
    const std::span<const float> v(sr.rec.vector);
    float score = 0.0f;
    switch (s.identity.native_metric) {
      case metric::cosine: score = kernels::cosine_similarity(vector, v); break;
      case metric::inner_product: score = kernels::inner_product(vector, v); break;
      case metric::euclidean: score = -kernels::l2_sq(vector, v); break;
    }
    candidates.push_back({score, sr.seq, &sr.rec});
  }
  const auto better = [](const scored& a, const scored& b) {
    if (a.score != b.score) return a.score > b.score;
    return a.seq < b.seq;
  };
  const auto n = std::min(k, candidates.size());
  std::partial_sort(candidates.begin(), candidates.begin() + static_cast<std::ptrdiff_t>(n), candidates.end(), better);
  // Still under the state lock: emitted records belong to one consistent image.
  for (std::size_t i = 0; i < n; ++i) emit(*candidates[i].rec, candidates[i].score);
  return {};
}

auto index_store::query(const std::string& collection, std::span<const float> vector, std::size_t k,
                        const filter_expr* filter) const -> std::expected<std::vector<hit>, core::error> {
  std::vector<hit> out;
  auto r = rank(collection, vector, k, filter, [&](const record& rec, float score) {
    out.push_back(hit{rec.chunk_id, score});
  });
  if (!r) return std::unexpected(r.error());
  return out;
}

auto index_store::search(const std::string& collection, std::span<const float> vector, std::size_t k,
                         const filter_expr* filter) const -> std::expected<std::vector<scored_record>, core::error> {
  std::vector<scored_record> out;
  auto r = rank(collection, vector, k, filter, [&](const record& rec, float score) {
    out.push_back(scored_record{rec, score});
  });
  if (!r) return std::unexpected(r.error());
  return out;
}

auto index_store::get(const std::string& collection, const std::string& chunk_id) const
    -> std::expected<record, core::error> {
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  const auto& s = **st;
  std::shared_lock state_lock(s.mu, settings_.lock_timeout);
  if (!state_lock.owns_lock()) return lock_timeout_error("collection '" + collection + "'");
  auto it = s.records.find(chunk_id);
  if (it == s.records.end()) {
    return core::make_unexpected(error_code::not_found, "chunk '" + chunk_id + "' not in '" + collection + "'", "index");
  }
  return it->second.rec;
}

auto index_store::document_chunks(const std::string& collection, const std::vector<std::string>& document_ids,
                                  std::size_t limit) const -> std::expected<std::vector<record>, core::error> {
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  const auto& s = **st;
  std::shared_lock state_lock(s.mu, settings_.lock_timeout);
  if (!state_lock.owns_lock()) return lock_timeout_error("collection '" + collection + "'");

  std::vector<record> out;
  for (const auto& doc_id : document_ids) {
    auto d = s.documents.find(doc_id);
    if (d == s.documents.end()) continue;
    std::vector<const record*> chunks;
    for (const auto& id : d->second.chunk_ids) {
      if (auto r = s.records.find(id); r != s.records.end()) chunks.push_back(&r->second.rec);
    }
    std::sort(chunks.begin(), chunks.end(),
              [](const record* a, const record* b) { return a->sequence_index < b->sequence_index; });
    for (const auto* r : chunks) {
      if (limit != 0 && out.size() >= limit) return out;
      out.push_back(*r);
    }
  }
  return out;
}

auto index_store::document_fingerprint(const std::string& collection, const std::string& document_id) const
    -> std::expected<std::optional<std::string>, core::error> {
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  const auto& s = **st;
  std::shared_lock state_lock(s.mu, settings_.lock_timeout);
  if (!state_lock.owns_lock()) return lock_timeout_error("collection '" + collection + "'");
  auto d = s.documents.find(document_id);
  if (d == s.documents.end()) return std::optional<std::string>{};
  return std::optional<std::string>{d->second.fingerprint};
}

auto index_store::stats(const std::string& collection) const -> std::expected<collection_stats, core::error> {
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  const auto& s = **st;
  std::shared_lock state_lock(s.mu, settings_.lock_timeout);
  if (!state_lock.owns_lock()) return lock_timeout_error("collection '" + collection + "'");
  return collection_stats{s.identity, s.records.size(), s.documents.size(), s.last_commit_lsn};
}

auto index_store::checkpoint(const std::string& collection) -> std::expected<void, core::error> {
  auto st = find(collection);
  if (!st) return std::unexpected(st.error());
  auto& s = **st;
  std::unique_lock wal_lock(s.wal_mu, std::defer_lock);
  if (!wal_lock.try_lock_for(settings_.lock_timeout)) return lock_timeout_error("the collection log");
  if (auto c = check_writable(s); !c) return c;
  return checkpoint_locked(s);
}

} // namespace gleaner
