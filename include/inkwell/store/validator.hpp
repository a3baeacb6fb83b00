#pragma once

/** \file validator.hpp
 *  \brief Cross-reference integrity scan over daily logs and the asset directory.
 *
 * The scan never mutates anything and never fails fast.
 * Every problem found is collected into the returned list; only IO errors abort the scan.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "inkwell/error.hpp"
#include "inkwell/store/asset_store.hpp"
#include "inkwell/store/log_store.hpp"

namespace inkwell::store {

enum class violation_kind : std::uint8_t {
  invalid_id,        /**< record with missing/malformed id, or without a title */
  missing_asset,     /**< archived reference to an asset that does not exist */
  orphaned_asset,    /**< asset referenced by no entry */
  dangling_related,  /**< related id that matches no entry */
};

struct Violation {
  violation_kind kind{violation_kind::invalid_id};
  std::filesystem::path file;   /**< daily log (or asset) the problem was found in */
  std::string entry_id;         /**< owning entry, empty if unknown */
  std::string subject;          /**< asset id or related id involved */
  std::string message;
};

struct ValidateOptions {
  /** Only entries after this id are checked for invalid_id/missing_asset; orphan and
   *  related checks need the full corpus and are skipped when set. */
  std::optional<std::string> since_id;
};

auto to_string(violation_kind kind) noexcept -> std::string_view;

auto validate_store(const LogStore& log, const AssetStore& assets, const ValidateOptions& opts = {})
    -> std::expected<std::vector<Violation>, core::error>;

} // namespace inkwell::store
