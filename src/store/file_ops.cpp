#include "inkwell/store/file_ops.hpp"

#include <fstream>
#include <sstream>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#elif defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace {

// OS-level sync of a file path. Errors are propagated via std::expected.
auto fsync_file_path(const std::filesystem::path& p, std::string_view component)
    -> std::expected<void, inkwell::core::error> {
  using inkwell::core::error; using inkwell::core::error_code;
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) {
    return std::unexpected(error{error_code::io_failed, "fsync open failed: " + p.string(), std::string(component)});
  }
  int rc = ::fsync(fd);
  (void)::close(fd);
  if (rc != 0) {
    return std::unexpected(error{error_code::io_failed, "fsync failed: " + p.string(), std::string(component)});
  }
#elif defined(_WIN32)
  HANDLE h = ::CreateFileW(p.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                           FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE,
                           nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
  if (h != INVALID_HANDLE_VALUE) {
    (void)::FlushFileBuffers(h);
    ::CloseHandle(h);
  }
#endif
  return {};
}

// Best-effort for directory metadata.
void fsync_dir_path(const std::filesystem::path& dir) {
#if defined(__linux__) || defined(__APPLE__)
  int fd = ::open(dir.string().c_str(), O_RDONLY);
  if (fd >= 0) { (void)::fsync(fd); (void)::close(fd); }
#else
  (void)dir;
#endif
}

} // namespace

namespace inkwell::store {

auto read_file(const std::filesystem::path& p, std::string_view component)
    -> std::expected<std::string, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) {
    return std::unexpected(error{error_code::not_found, "file not found: " + p.string(), std::string(component)});
  }
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) {
    return std::unexpected(error{error_code::io_failed, "open for read failed: " + p.string(), std::string(component)});
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return std::unexpected(error{error_code::io_failed, "read failed: " + p.string(), std::string(component)});
  }
  return std::move(ss).str();
}

auto write_file_atomic(const std::filesystem::path& p, std::string_view content, std::string_view component)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto tmp = p;
  tmp += ".tmp";
  // Remove a leftover tmp from a previous crashed write.
  { std::error_code ec; std::filesystem::remove(tmp, ec); }

  // 1) Write tmp
  {
    std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "tmp open failed: " + tmp.string(), std::string(component)});
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code ec; std::filesystem::remove(tmp, ec);
      return std::unexpected(error{error_code::io_failed, "tmp write failed: " + tmp.string(), std::string(component)});
    }
  }
  // 2) Ensure tmp contents durable
  if (auto sx = fsync_file_path(tmp, component); !sx) {
    std::error_code ec; std::filesystem::remove(tmp, ec);
    return std::unexpected(sx.error());
  }
  // 3) Atomic replace
#if defined(_WIN32)
  if (!::MoveFileExW(tmp.wstring().c_str(), p.wstring().c_str(), MOVEFILE_REPLACE_EXISTING | MOVEFILE_WRITE_THROUGH)) {
    std::error_code ec; std::filesystem::remove(tmp, ec);
    return std::unexpected(error{error_code::io_failed, "replace failed: " + p.string(), std::string(component)});
  }
#else
  {
    std::error_code ec;
    std::filesystem::rename(tmp, p, ec);
    if (ec) {
      (void)std::filesystem::remove(tmp, ec);
      return std::unexpected(error{error_code::io_failed, "rename failed: " + p.string(), std::string(component)});
    }
  }
#endif
  // 4) Best-effort directory flush
  fsync_dir_path(p.has_parent_path() ? p.parent_path() : std::filesystem::path("."));
  return {};
}

auto append_file(const std::filesystem::path& p, std::string_view content, std::string_view component)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  {
    std::ofstream out(p, std::ios::binary | std::ios::app);
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "open for append failed: " + p.string(), std::string(component)});
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out.good()) {
      return std::unexpected(error{error_code::io_failed, "append failed: " + p.string(), std::string(component)});
    }
  }
  return fsync_file_path(p, component);
}

auto copy_file_exclusive(const std::filesystem::path& src, const std::filesystem::path& dst, std::string_view component)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  if (!std::filesystem::is_regular_file(src, ec)) {
    return std::unexpected(error{error_code::source_not_found, "source not found: " + src.string(), std::string(component)});
  }
  if (std::filesystem::exists(dst, ec)) {
    return std::unexpected(error{error_code::destination_exists, "destination exists, not overwriting: " + dst.string(), std::string(component)});
  }
  // copy_options::none fails with file_exists if dst appeared in the meantime.
  if (!std::filesystem::copy_file(src, dst, std::filesystem::copy_options::none, ec) || ec) {
    if (ec == std::errc::file_exists) {
      return std::unexpected(error{error_code::destination_exists, "destination exists, not overwriting: " + dst.string(), std::string(component)});
    }
    return std::unexpected(error{error_code::io_failed, "copy failed: " + src.string() + " -> " + dst.string() + " (" + ec.message() + ")", std::string(component)});
  }
  return fsync_file_path(dst, component);
}

} // namespace inkwell::store
