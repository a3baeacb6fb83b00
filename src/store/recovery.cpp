#include "inkwell/store/recovery.hpp"
#include "inkwell/core/platform_utils.hpp"

#include <algorithm>
#include <iostream>

namespace inkwell::store {

namespace {
constexpr const char* kComponent = "store.recovery";
}

RecoveryController::RecoveryController(const LogStore& log, const AssetStore& assets)
    : log_(log), assets_(assets) {}

auto RecoveryController::last() const -> std::expected<entry::Entry, core::error> {
  using core::error; using core::error_code;
  auto id = log_.latest_entry_id();
  if (!id) return std::unexpected(id.error());
  if (!*id) {
    return std::unexpected(error{error_code::nothing_to_delete, "no entries in " + log_.root().string(), kComponent});
  }
  auto found = log_.find(**id);
  if (!found) return std::unexpected(found.error());
  if (!*found) {
    return std::unexpected(error{error_code::internal, "last entry " + **id + " vanished while reading", kComponent});
  }
  return std::move(**found);
}

auto RecoveryController::drop_assets(const entry::Entry& e, std::string_view keep) const
    -> std::expected<std::vector<std::string>, core::error> {
  std::vector<std::string> deleted;
  for (const auto& a : e.archived) {
    if (a.asset_id == keep || !assets_.exists(a.asset_id)) continue;
    if (auto rx = assets_.remove(a.asset_id); !rx) return std::unexpected(rx.error());
    deleted.push_back(a.asset_id);
  }
  auto extra = assets_.remove_for_entry(e.id, keep);
  if (!extra) return std::unexpected(extra.error());
  deleted.insert(deleted.end(), extra->begin(), extra->end());
  std::sort(deleted.begin(), deleted.end());
  return deleted;
}

auto RecoveryController::check_rewritable(const entry::Entry& e) const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto recs = log_.scan(entry::entry_date(e.id));
  if (!recs) return std::unexpected(recs.error());
  if (recs->empty() || recs->back().entry.id != e.id) {
    return std::unexpected(error{error_code::corrupt_log,
      log_.path_for(entry::entry_date(e.id)).filename().string() + ": final record is not entry " + e.id, kComponent});
  }
  return {};
}

auto RecoveryController::show_last() const -> std::expected<entry::Entry, core::error> {
  return last();
}

auto RecoveryController::delete_last() const -> std::expected<DeleteResult, core::error> {
  auto e = last();
  if (!e) return std::unexpected(e.error());
  auto removed = log_.delete_last(entry::entry_date(e->id), e->id);
  if (!removed) return std::unexpected(removed.error());
  auto assets = drop_assets(*removed);
  if (!assets) return std::unexpected(assets.error());
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][recovery] deleted " << removed->id << " assets=" << assets->size() << std::endl;
  }
  return DeleteResult{std::move(*removed), std::move(*assets)};
}

auto RecoveryController::replace_last(const entry::Entry& content) const
    -> std::expected<entry::Entry, core::error> {
  using core::error; using core::error_code;
  auto e = last();
  if (!e) return std::unexpected(e.error());
  if (content.title.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "replacement for entry " + e->id + " has an empty title", kComponent});
  }
  entry::Entry next = content;
  next.id = e->id;
  next.timestamp = e->timestamp;
  if (next.archived.empty()) next.archived = e->archived;
  if (!next.external_state) next.external_state = e->external_state;
  if (next.mode.empty()) next.mode = e->mode;
  if (auto rx = log_.replace_last(entry::entry_date(next.id), next); !rx) return std::unexpected(rx.error());
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][recovery] replaced " << next.id << std::endl;
  }
  return next;
}

auto RecoveryController::rearchive(const std::filesystem::path& file, std::string_view description) const
    -> std::expected<std::string, core::error> {
  using core::error; using core::error_code;
  auto e = last();
  if (!e) return std::unexpected(e.error());
  std::error_code ec;
  if (!std::filesystem::is_regular_file(file, ec)) {
    return std::unexpected(error{error_code::source_not_found, "file to archive not found: " + file.string(), kComponent});
  }
  if (auto cx = check_rewritable(*e); !cx) return std::unexpected(cx.error());

  // The new snapshot may reuse the name of an old one; park the old file until the record is rewritten.
  const auto name = entry::asset_name(e->id, file);
  const auto target = assets_.dir() / name;
  const auto parked = assets_.dir() / (name + ".rearchive");
  const bool park = assets_.exists(name);
  if (park) {
    std::filesystem::rename(target, parked, ec);
    if (ec) {
      return std::unexpected(error{error_code::io_failed, "cannot set aside asset " + name + " (" + ec.message() + ")", kComponent});
    }
  }
  auto unpark = [&]() {
    if (!park) return;
    std::error_code uec;
    std::filesystem::rename(parked, target, uec);
    if (uec) {
      std::cerr << "[inkwell][recovery] could not restore asset " << name << " from " << parked.string()
                << ": " << uec.message() << std::endl;
    }
  };

  auto saved = assets_.save(e->id, file);
  if (!saved) {
    unpark();
    return std::unexpected(saved.error());
  }

  entry::Entry next = *e;
  next.archived = {entry::ArchivedFile{file.string(), *saved, std::string(description)}};
  if (auto rx = log_.replace_last(entry::entry_date(next.id), next); !rx) {
    if (auto ux = assets_.remove(*saved); !ux) {
      std::cerr << "[inkwell][recovery] rollback could not remove asset " << *saved << ": " << ux.error().message << std::endl;
    }
    unpark();
    return std::unexpected(rx.error());
  }

  // Committed; old snapshots go last.
  if (park) {
    std::filesystem::remove(parked, ec);
    if (ec) {
      return std::unexpected(error{error_code::io_failed, "cannot remove replaced asset " + parked.string() + " (" + ec.message() + ")", kComponent});
    }
  }
  if (auto dx = drop_assets(*e, *saved); !dx) return std::unexpected(dx.error());
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][recovery] rearchived " << next.id << " -> " << *saved << std::endl;
  }
  return *saved;
}

auto RecoveryController::unarchive() const -> std::expected<std::vector<std::string>, core::error> {
  auto e = last();
  if (!e) return std::unexpected(e.error());
  return drop_assets(*e);
}

} // namespace inkwell::store
