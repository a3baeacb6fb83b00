#pragma once

/** \file asset_store.hpp
 *  \brief Archive directory of byte-for-byte file snapshots keyed by entry id.
 *
 * Asset names are deterministic: "{entryId}-{basename(source)}". Neither save nor restore
 * ever overwrites an existing file; both fail with destination_exists instead.
 * Not thread-safe; single writer per store directory.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "inkwell/error.hpp"

namespace inkwell::store {

class AssetStore {
public:
  explicit AssetStore(std::filesystem::path dir);

  /** \brief Copy source verbatim to "{entry_id}-{basename}" and return that asset id.
   *  Errors: invalid_argument (malformed entry id), source_not_found, destination_exists, io_failed.
   */
  auto save(std::string_view entry_id, const std::filesystem::path& source) const
      -> std::expected<std::string, core::error>;

  /** \brief Copy an asset to dest_dir/_{asset_id} and return the restored path.
   *  Errors: not_found (unknown asset), destination_exists, io_failed.
   */
  auto restore(std::string_view asset_id, const std::filesystem::path& dest_dir) const
      -> std::expected<std::filesystem::path, core::error>;

  /** \brief Delete an asset. Absent assets are a no-op. */
  auto remove(std::string_view asset_id) const -> std::expected<void, core::error>;

  /** \brief Delete every asset claimed by entry_id's prefix except keep; returns the deleted ids. */
  auto remove_for_entry(std::string_view entry_id, std::string_view keep = {}) const
      -> std::expected<std::vector<std::string>, core::error>;

  /** \brief Asset ids containing filter (case-insensitive), sorted lexicographically. */
  auto list(std::string_view filter = {}) const
      -> std::expected<std::vector<std::string>, core::error>;

  [[nodiscard]] bool exists(std::string_view asset_id) const;

  const std::filesystem::path& dir() const noexcept { return dir_; }

private:
  std::filesystem::path dir_;

  auto checked_path(std::string_view asset_id) const
      -> std::expected<std::filesystem::path, core::error>;
};

} // namespace inkwell::store
