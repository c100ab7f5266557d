#include "gleaner/wal/snapshot.hpp"

#include <fstream>

#include "gleaner/wal/io.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace gleaner::wal {

auto write_file_atomic(const std::filesystem::path& dst, std::span<const std::uint8_t> bytes)
    -> std::expected<void, core::error> {
  using core::error_code;
  auto tmp = dst;
  tmp += ".tmp";
  auto fail = [&](const char* what) {
    std::error_code rec;
    (void)std::filesystem::remove(tmp, rec);
    return core::make_unexpected(error_code::io_failed, what, "index.snapshot");
  };
  // 1) Write tmp
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) return fail("snapshot tmp open failed");
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out.good()) return fail("snapshot tmp write failed");
  }
  // 2) Ensure tmp contents durable
  if (auto r = detail::fsync_file_path(tmp); !r) return fail("snapshot tmp fsync failed");
  // 3) Atomic replace
#if defined(_WIN32)
  if (!::MoveFileExW(tmp.wstring().c_str(), dst.wstring().c_str(),
                     MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
    return fail("snapshot replace failed");
  }
#else
  std::error_code ec;
  std::filesystem::rename(tmp, dst, ec);
  if (ec) return fail("snapshot rename failed");
#endif
  // 4) Best-effort directory flush
  detail::fsync_dir_path(dst.parent_path());
  return {};
}

auto read_file(const std::filesystem::path& src)
    -> std::expected<std::vector<std::uint8_t>, core::error> {
  using core::error_code;
  std::ifstream in(src, std::ios::binary);
  if (!in.good()) return core::make_unexpected(error_code::not_found, "open failed: " + src.filename().string(), "index.snapshot");
  std::error_code ec;
  const auto size = std::filesystem::file_size(src, ec);
  if (ec) return core::make_unexpected(error_code::io_failed, "stat failed", "index.snapshot");
  std::vector<std::uint8_t> buf(static_cast<std::size_t>(size));
  in.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
  if (static_cast<std::uint64_t>(in.gcount()) != size) {
    return core::make_unexpected(error_code::io_failed, "short read", "index.snapshot");
  }
  return buf;
}

} // namespace gleaner::wal
