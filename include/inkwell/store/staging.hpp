#pragma once

/** \file staging.hpp
 *  \brief Two-phase commit of a single in-flight entry through an on-disk staging slot.
 *
 * Protocol:
 * - prepare(): allocate an id and write the draft (placeholders + pending metadata) to the slot
 * - the drafting collaborator edits the slot file or calls fill()
 * - finalize(): check placeholders, pre-flight archives, run the external commit hook,
 *   save assets (all-or-nothing), append to the LogStore, delete the slot
 * - abort(): delete the slot; LogStore and AssetStore are never touched
 *
 * The slot lives at a fixed path so that status()/finalize() work across process restarts.
 * Exactly one slot may exist; a second prepare() fails with staging_busy.
 */

#include <ctime>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "inkwell/config.hpp"
#include "inkwell/entry/entry.hpp"
#include "inkwell/error.hpp"
#include "inkwell/store/asset_store.hpp"
#include "inkwell/store/log_store.hpp"
#include "inkwell/store/validator.hpp"

namespace inkwell::store {

/** \brief Called by finalize in external-commit mode with the final title/body.
 *  The returned string is stored verbatim as the entry's external_state.
 */
using ExternalCommitHook =
    std::function<std::expected<std::string, core::error>(std::string_view title, std::string_view body)>;

struct ArchiveRequest {
  std::filesystem::path source;
  std::string description;
};

struct PrepareOptions {
  std::vector<entry::TouchedFile> touched;
  std::vector<ArchiveRequest> archives;
  std::vector<std::string> related;            /**< prior entry ids; titles are looked up */
  bool external_commit{false};
  std::optional<std::string> external_state;   /**< opaque, e.g. the current commit hash */
};

struct StagingRecord {
  entry::Entry draft;            /**< archived holds the pending archive operations */
  bool external_commit{false};
  std::filesystem::path path;    /**< slot file */
  bool title_filled{false};
  bool body_filled{false};
};

struct FinalizeOptions {
  ExternalCommitHook hook;       /**< required in external-commit mode */
  bool validate{true};           /**< ANDed with StoreConfig::validate_after_finalize */
};

struct FinalizeResult {
  std::string id;
  std::vector<std::string> archived_assets;
  std::vector<Violation> violations;   /**< post-commit scan; reported, never repaired */
};

class StagingArea {
public:
  StagingArea(StoreConfig cfg, const LogStore& log, const AssetStore& assets);

  auto prepare(const PrepareOptions& opts) const -> std::expected<std::filesystem::path, core::error>;
  auto prepare(const PrepareOptions& opts, const std::tm& when) const
      -> std::expected<std::filesystem::path, core::error>;

  auto status() const -> std::expected<std::optional<StagingRecord>, core::error>;

  /** \brief Remove the slot; returns the discarded id, or nullopt if nothing was pending. */
  auto abort() const -> std::expected<std::optional<std::string>, core::error>;

  /** \brief Replace title and body of the pending draft. Title must be a single non-empty line. */
  auto fill(std::string_view title, std::string_view body) const -> std::expected<void, core::error>;

  auto finalize(const FinalizeOptions& opts = {}) const -> std::expected<FinalizeResult, core::error>;

private:
  StoreConfig cfg_;
  const LogStore& log_;
  const AssetStore& assets_;

  auto load_slot() const -> std::expected<std::optional<StagingRecord>, core::error>;
  auto write_slot(const StagingRecord& rec) const -> std::expected<void, core::error>;
};

} // namespace inkwell::store
