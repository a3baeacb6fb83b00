#include "inkwell/store/staging.hpp"
#include "inkwell/entry/codec.hpp"
#include "inkwell/store/file_ops.hpp"
#include "inkwell/store/id_allocator.hpp"
#include "inkwell/core/platform_utils.hpp"

#include <iostream>
#include <set>

namespace inkwell::store {

namespace {

constexpr const char* kComponent = "store.staging";

// Best-effort cleanup of assets saved by a finalize that did not complete.
void rollback_assets(const AssetStore& assets, const std::vector<std::string>& saved) {
  for (const auto& id : saved) {
    if (auto rx = assets.remove(id); !rx) {
      std::cerr << "[inkwell][staging] rollback could not remove asset " << id << ": " << rx.error().message << std::endl;
    }
  }
}

} // namespace

StagingArea::StagingArea(StoreConfig cfg, const LogStore& log, const AssetStore& assets)
    : cfg_(std::move(cfg)), log_(log), assets_(assets) {}

auto StagingArea::load_slot() const -> std::expected<std::optional<StagingRecord>, core::error> {
  using core::error; using core::error_code;
  const auto path = cfg_.staging_path();
  auto text = read_file(path, kComponent);
  if (!text) {
    if (text.error().code == error_code::not_found) return std::optional<StagingRecord>{};
    return std::unexpected(text.error());
  }
  auto recs = entry::decode_records(*text);
  if (recs.empty() || !recs.front().has_id || !entry::is_valid_entry_id(recs.front().entry.id)) {
    return std::unexpected(error{error_code::corrupt_log,
      "staging slot " + path.string() + " does not hold a valid entry draft (missing or malformed id)", kComponent});
  }

  auto& parsed = recs.front();
  StagingRecord rec;
  rec.draft = std::move(parsed.entry);
  rec.draft.title = parsed.heading_title;
  rec.external_commit = rec.draft.mode == entry::kExternalCommitMode;
  rec.path = path;
  // Asset names are derived, never trusted from the editable slot text.
  for (auto& a : rec.draft.archived) a.asset_id = entry::asset_name(rec.draft.id, a.original_path);
  rec.title_filled = !rec.draft.title.empty() &&
                     rec.draft.title.find(entry::kTitlePlaceholder) == std::string::npos;
  rec.body_filled = rec.draft.body.find(entry::kBodyPlaceholder) == std::string::npos;
  return std::optional<StagingRecord>(std::move(rec));
}

auto StagingArea::write_slot(const StagingRecord& rec) const -> std::expected<void, core::error> {
  return write_file_atomic(cfg_.staging_path(),
                           entry::encode_entry(rec.draft, entry::EncodeOptions{.frontmatter_title = false}),
                           kComponent);
}

auto StagingArea::prepare(const PrepareOptions& opts) const
    -> std::expected<std::filesystem::path, core::error> {
  return prepare(opts, entry::local_now());
}

auto StagingArea::prepare(const PrepareOptions& opts, const std::tm& when) const
    -> std::expected<std::filesystem::path, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  if (std::filesystem::exists(cfg_.staging_path(), ec)) {
    std::string pending;
    if (auto cur = load_slot(); cur && *cur) pending = " (" + (*cur)->draft.id + ")";
    return std::unexpected(error{error_code::staging_busy,
      "an entry is already pending" + pending + " at " + cfg_.staging_path().string() + "; finalize or abort it first",
      kComponent});
  }
  for (const auto& rel : opts.related) {
    if (!entry::is_valid_entry_id(rel)) {
      return std::unexpected(error{error_code::invalid_argument, "invalid related entry id: " + rel, kComponent});
    }
  }

  auto id = allocate_entry_id(log_, when);
  if (!id) return std::unexpected(id.error());

  StagingRecord rec;
  rec.draft.id = *id;
  rec.draft.timestamp = entry::format_timestamp(when);
  rec.draft.title = std::string(entry::kTitlePlaceholder);
  rec.draft.body = std::string(entry::kBodyPlaceholder);
  rec.draft.files_touched = opts.touched;
  for (const auto& a : opts.archives) {
    rec.draft.archived.push_back(entry::ArchivedFile{a.source.string(), entry::asset_name(*id, a.source), a.description});
  }
  for (const auto& rel : opts.related) {
    auto found = log_.find(rel);
    if (!found) return std::unexpected(found.error());
    rec.draft.related.push_back(entry::RelatedEntry{rel, *found ? (*found)->title : std::string{}});
  }
  rec.draft.external_state = opts.external_state;
  if (opts.external_commit) rec.draft.mode = std::string(entry::kExternalCommitMode);

  std::filesystem::create_directories(cfg_.root, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "mkdir failed: " + cfg_.root.string() + " (" + ec.message() + ")", kComponent});
  }
  if (auto wx = write_slot(rec); !wx) return std::unexpected(wx.error());
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][staging] prepared " << *id << " archives=" << rec.draft.archived.size()
              << (opts.external_commit ? " mode=external-commit" : "") << std::endl;
  }
  return cfg_.staging_path();
}

auto StagingArea::status() const -> std::expected<std::optional<StagingRecord>, core::error> {
  return load_slot();
}

auto StagingArea::abort() const -> std::expected<std::optional<std::string>, core::error> {
  using core::error; using core::error_code;
  const auto path = cfg_.staging_path();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return std::optional<std::string>{};
  std::optional<std::string> id;
  if (auto cur = load_slot(); cur && *cur) id = (*cur)->draft.id;
  std::filesystem::remove(path, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "cannot remove staging slot " + path.string() + " (" + ec.message() + ")", kComponent});
  }
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][staging] aborted " << id.value_or("<unreadable draft>") << std::endl;
  }
  return id;
}

auto StagingArea::fill(std::string_view title, std::string_view body) const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (title.empty() || title.find('\n') != std::string_view::npos || title.find('\r') != std::string_view::npos) {
    return std::unexpected(error{error_code::invalid_argument, "title must be a single non-empty line", kComponent});
  }
  auto cur = load_slot();
  if (!cur) return std::unexpected(cur.error());
  if (!*cur) {
    return std::unexpected(error{error_code::no_pending_entry, "no pending entry to fill; run prepare first", kComponent});
  }
  auto rec = std::move(**cur);
  rec.draft.title = std::string(title);
  rec.draft.body = std::string(body);
  return write_slot(rec);
}

auto StagingArea::finalize(const FinalizeOptions& opts) const -> std::expected<FinalizeResult, core::error> {
  using core::error; using core::error_code;
  auto cur = load_slot();
  if (!cur) return std::unexpected(cur.error());
  if (!*cur) {
    return std::unexpected(error{error_code::no_pending_entry, "no pending entry to finalize; run prepare first", kComponent});
  }
  auto rec = std::move(**cur);
  auto& e = rec.draft;

  // 1) Placeholders
  if (!rec.title_filled) {
    return std::unexpected(error{error_code::placeholder_unresolved,
      "entry " + e.id + ": title still contains placeholder " + std::string(entry::kTitlePlaceholder) + " or is empty", kComponent});
  }
  if (!rec.body_filled) {
    return std::unexpected(error{error_code::placeholder_unresolved,
      "entry " + e.id + ": body still contains placeholder " + std::string(entry::kBodyPlaceholder), kComponent});
  }

  // 2) Pre-flight archives; nothing is written before every source and destination checks out.
  std::set<std::string> planned;
  for (const auto& a : e.archived) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(a.original_path, ec)) {
      return std::unexpected(error{error_code::source_not_found,
        "file to archive not found: " + a.original_path + " (pending entry " + e.id + ")", kComponent});
    }
    if (assets_.exists(a.asset_id) || !planned.insert(a.asset_id).second) {
      return std::unexpected(error{error_code::destination_exists,
        "asset " + a.asset_id + " already exists, not overwriting (pending entry " + e.id + ")", kComponent});
    }
  }

  // 3) External commit
  if (rec.external_commit) {
    if (!opts.hook) {
      return std::unexpected(error{error_code::external_commit_failed,
        "entry " + e.id + " requests an external commit but no commit hook is configured", kComponent});
    }
    auto state = opts.hook(e.title, e.body);
    if (!state) {
      return std::unexpected(error{error_code::external_commit_failed,
        "external commit for entry " + e.id + " failed: " + state.error().message, kComponent});
    }
    e.external_state = std::move(*state);
    e.mode = std::string(entry::kExternalCommitMode);
  }

  // 4) Materialize archives, all-or-nothing
  FinalizeResult result;
  for (auto& a : e.archived) {
    auto saved = assets_.save(e.id, a.original_path);
    if (!saved) {
      rollback_assets(assets_, result.archived_assets);
      return std::unexpected(saved.error());
    }
    a.asset_id = *saved;
    result.archived_assets.push_back(std::move(*saved));
  }

  // 5) Append
  if (auto ax = log_.append(e); !ax) {
    rollback_assets(assets_, result.archived_assets);
    return std::unexpected(ax.error());
  }
  result.id = e.id;

  // 6) Past this point the entry is committed; failures are reported, not rolled back.
  std::error_code ec;
  std::filesystem::remove(rec.path, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed,
      "entry " + e.id + " was committed but the staging slot " + rec.path.string() + " could not be removed (" + ec.message() + ")",
      kComponent});
  }
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][staging] finalized " << e.id << " assets=" << result.archived_assets.size() << std::endl;
  }

  if (opts.validate && cfg_.validate_after_finalize) {
    auto issues = validate_store(log_, assets_);
    if (!issues) return std::unexpected(issues.error());
    result.violations = std::move(*issues);
  }
  return result;
}

} // namespace inkwell::store
