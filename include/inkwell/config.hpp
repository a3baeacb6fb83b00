#pragma once

/** \file config.hpp
 *  \brief Store layout and runtime knobs.
 *
 * Environment overrides (read through core::safe_getenv):
 *   INKWELL_DIR       store root (absolute, or relative to the working tree)
 *   INKWELL_VALIDATE  "0" disables the integrity scan after finalize
 *   INKWELL_DEBUG     "1" enables [inkwell][...] tracing on stderr
 */

#include <expected>
#include <filesystem>
#include <string>

#include "inkwell/error.hpp"

namespace inkwell {

struct StoreConfig {
  std::filesystem::path root{".inkwell"};     /**< daily logs live directly under root */
  std::string assets_dir{"assets"};           /**< archive directory, relative to root */
  std::string staging_name{"__pending__.md"}; /**< the single staging slot, relative to root */
  bool validate_after_finalize{true};

  std::filesystem::path assets_path() const { return root / assets_dir; }
  std::filesystem::path staging_path() const { return root / staging_name; }
};

/** \brief Defaults resolved against worktree, then environment overrides. */
auto load_config(const std::filesystem::path& worktree) -> StoreConfig;

/**
 * \brief Create root and asset directories and register ignore patterns.
 *
 * Appends "<root>/assets/", "<root>/__*__.md" and "_20*-*" (restored asset copies) to
 * worktree/.gitignore when missing. Idempotent.
 */
auto ensure_layout(const StoreConfig& cfg, const std::filesystem::path& worktree)
    -> std::expected<void, core::error>;

} // namespace inkwell
