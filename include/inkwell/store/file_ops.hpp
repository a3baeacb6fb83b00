#pragma once

/** \file file_ops.hpp
 *  \brief Small filesystem primitives shared by the stores.
 *
 * Atomic, durable replace (write_file_atomic):
 * - Write contents to a temporary sibling file (<name>.tmp) in the same directory
 * - fsync(tmp) on POSIX, FlushFileBuffers on Windows
 * - Atomically replace the destination (rename(2) / MoveFileExW with MOVEFILE_REPLACE_EXISTING)
 * - Best-effort fsync of the parent directory
 * - On failure the tmp file is removed and io_failed is returned; there is no non-atomic fallback.
 *
 * copy_file_exclusive never overwrites: an existing destination yields destination_exists.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "inkwell/error.hpp"

namespace inkwell::store {

// Whole-file read. A missing file yields not_found.
[[nodiscard]] auto read_file(const std::filesystem::path& p, std::string_view component)
    -> std::expected<std::string, core::error>;

[[nodiscard]] auto write_file_atomic(const std::filesystem::path& p, std::string_view content,
                                     std::string_view component)
    -> std::expected<void, core::error>;

// Appends bytes and syncs the file.
[[nodiscard]] auto append_file(const std::filesystem::path& p, std::string_view content,
                               std::string_view component)
    -> std::expected<void, core::error>;

// Byte-for-byte copy of src to dst; dst must not exist.
[[nodiscard]] auto copy_file_exclusive(const std::filesystem::path& src, const std::filesystem::path& dst,
                                       std::string_view component)
    -> std::expected<void, core::error>;

} // namespace inkwell::store
