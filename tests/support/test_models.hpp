#pragma once

// Scripted embedding models and scratch directories for tests.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include <gleaner/embedder.hpp>

namespace test_support {

namespace fs = std::filesystem;

// Unique directory under the system temp dir, removed on destruction.
class temp_dir {
public:
  explicit temp_dir(const std::string& tag) {
    static std::atomic<std::uint64_t> counter{0};
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    path_ = fs::temp_directory_path() /
            ("gleaner_" + tag + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::error_code ec;
    fs::remove_all(path_, ec);
    fs::create_directories(path_, ec);
  }
  ~temp_dir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  temp_dir(const temp_dir&) = delete;
  temp_dir& operator=(const temp_dir&) = delete;

  const fs::path& path() const noexcept { return path_; }
  fs::path operator/(const std::string& name) const { return path_ / name; }

private:
  fs::path path_;
};

// Returns the vector registered for a text; unregistered texts map to `fallback`.
class table_model : public gleaner::embedding_model {
public:
  table_model(std::string model_id, std::uint32_t dim, gleaner::metric m = gleaner::metric::cosine)
      : identity_{std::move(model_id), dim, m}, fallback_(dim, 0.0f) {
    fallback_[0] = 1.0f;
  }

  void set(const std::string& text, std::vector<float> v) {
    std::lock_guard lk(mu_);
    table_[text] = std::move(v);
  }
  void set_fallback(std::vector<float> v) { fallback_ = std::move(v); }

  // Calls numbered from 1; failing calls return embedding_unavailable.
  void fail_call(std::size_t n) { std::lock_guard lk(mu_); failing_calls_.push_back(n); }
  // Every call after the first n succeeds fails.
  void fail_after(std::size_t n) { fail_after_ = n; }
  // Each call sleeps this long; a call whose timeout is shorter reports timeout.
  void set_latency(std::chrono::milliseconds d) { latency_ = d; }
  // Returns vectors of the wrong length.
  void corrupt_dimension(bool on) { corrupt_ = on; }

  std::size_t calls() const noexcept { return calls_.load(); }
  std::size_t texts_seen() const noexcept { return texts_.load(); }

  auto identity() const -> const gleaner::model_identity& override { return identity_; }

  auto embed_batch(std::span<const std::string> texts, std::chrono::milliseconds timeout)
      -> std::expected<std::vector<gleaner::embedding>, gleaner::core::error> override {
    using gleaner::core::error_code;
    const auto n = ++calls_;
    if (latency_.count() > 0) {
      if (timeout < latency_) {
        std::this_thread::sleep_for(timeout);
        return gleaner::core::make_unexpected(error_code::timeout, "scripted model too slow", "test.model");
      }
      std::this_thread::sleep_for(latency_);
    }
    {
      std::lock_guard lk(mu_);
      for (auto f : failing_calls_) {
        if (f == n) return gleaner::core::make_unexpected(error_code::embedding_unavailable, "scripted failure", "test.model");
      }
    }
    if (fail_after_ != 0 && n > fail_after_) {
      return gleaner::core::make_unexpected(error_code::embedding_unavailable, "scripted outage", "test.model");
    }
    texts_ += texts.size();
    std::vector<gleaner::embedding> out;
    out.reserve(texts.size());
    std::lock_guard lk(mu_);
    for (const auto& t : texts) {
      auto it = table_.find(t);
      auto v = it == table_.end() ? fallback_ : it->second;
      if (corrupt_) v.push_back(0.0f);
      out.push_back(std::move(v));
    }
    return out;
  }

private:
  gleaner::model_identity identity_;
  std::vector<float> fallback_;
  std::map<std::string, std::vector<float>> table_;
  std::vector<std::size_t> failing_calls_;
  std::size_t fail_after_{0};
  std::chrono::milliseconds latency_{0};
  bool corrupt_{false};
  std::atomic<std::size_t> calls_{0};
  std::atomic<std::size_t> texts_{0};
  std::mutex mu_;
};

// Throws from embed_batch; exercises the adapter's exception boundary.
class throwing_model : public gleaner::embedding_model {
public:
  throwing_model() : identity_{"throwing", 4, gleaner::metric::cosine} {}
  auto identity() const -> const gleaner::model_identity& override { return identity_; }
  auto embed_batch(std::span<const std::string>, std::chrono::milliseconds)
      -> std::expected<std::vector<gleaner::embedding>, gleaner::core::error> override {
    throw std::runtime_error("model crashed");
  }

private:
  gleaner::model_identity identity_;
};

} // namespace test_support
