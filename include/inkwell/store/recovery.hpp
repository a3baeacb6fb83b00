#pragma once

/** \file recovery.hpp
 *  \brief Mutations of the most recent entry of the whole store.
 *
 * Only the global last entry (LogStore::latest_entry_id) is mutable. All operations bypass
 * staging and act on the LogStore and AssetStore directly.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "inkwell/entry/entry.hpp"
#include "inkwell/error.hpp"
#include "inkwell/store/asset_store.hpp"
#include "inkwell/store/log_store.hpp"

namespace inkwell::store {

struct DeleteResult {
  entry::Entry removed;
  std::vector<std::string> deleted_assets;
};

class RecoveryController {
public:
  RecoveryController(const LogStore& log, const AssetStore& assets);

  /** \brief Errors: nothing_to_delete on an empty store. */
  auto show_last() const -> std::expected<entry::Entry, core::error>;

  /** \brief Remove the last record, then its archived assets and any "{id}-" prefixed asset. */
  auto delete_last() const -> std::expected<DeleteResult, core::error>;

  /** \brief Rewrite title/body/metadata of the last entry.
   *
   * id and timestamp are always preserved. The archived list is preserved unless
   * content.archived is non-empty; external_state/mode likewise unless content sets them.
   */
  auto replace_last(const entry::Entry& content) const -> std::expected<entry::Entry, core::error>;

  /** \brief Replace the last entry's assets with a fresh copy of file; returns the new asset id.
   *
   * The new asset is saved and the record rewritten before any old asset is deleted. If either
   * step fails the new asset is removed and the old ones are left in place.
   */
  auto rearchive(const std::filesystem::path& file, std::string_view description = {}) const
      -> std::expected<std::string, core::error>;

  /** \brief Delete the last entry's assets, leaving its text (and archived section) intact. */
  auto unarchive() const -> std::expected<std::vector<std::string>, core::error>;

private:
  const LogStore& log_;
  const AssetStore& assets_;

  auto last() const -> std::expected<entry::Entry, core::error>;
  auto drop_assets(const entry::Entry& e, std::string_view keep = {}) const
      -> std::expected<std::vector<std::string>, core::error>;
  auto check_rewritable(const entry::Entry& e) const -> std::expected<void, core::error>;
};

} // namespace inkwell::store
