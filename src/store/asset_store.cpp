#include "inkwell/store/asset_store.hpp"
#include "inkwell/store/file_ops.hpp"
#include "inkwell/entry/entry.hpp"
#include "inkwell/core/platform_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

namespace inkwell::store {

namespace {

constexpr const char* kComponent = "store.assets";

std::string lowercase(std::string_view s) {
  std::string out(s);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); });
  return out;
}

} // namespace

AssetStore::AssetStore(std::filesystem::path dir) : dir_(std::move(dir)) {}

auto AssetStore::checked_path(std::string_view asset_id) const
    -> std::expected<std::filesystem::path, core::error> {
  using core::error; using core::error_code;
  // Asset ids are plain file names inside dir_; reject separators and traversal.
  if (asset_id.empty() || asset_id == "." || asset_id == ".." ||
      asset_id.find('/') != std::string_view::npos || asset_id.find('\\') != std::string_view::npos) {
    return std::unexpected(error{error_code::invalid_argument, "invalid asset id: " + std::string(asset_id), kComponent});
  }
  return dir_ / std::string(asset_id);
}

auto AssetStore::save(std::string_view entry_id, const std::filesystem::path& source) const
    -> std::expected<std::string, core::error> {
  using core::error; using core::error_code;
  if (!entry::is_valid_entry_id(entry_id)) {
    return std::unexpected(error{error_code::invalid_argument,
      "invalid entry id format: " + std::string(entry_id) + " (expected YYYY-MM-DD-HH-MM[-NN])", kComponent});
  }
  std::error_code ec;
  if (!std::filesystem::is_regular_file(source, ec)) {
    return std::unexpected(error{error_code::source_not_found, "file to archive not found: " + source.string(), kComponent});
  }
  const auto name = entry::asset_name(entry_id, source);
  if (std::filesystem::exists(dir_ / name, ec)) {
    return std::unexpected(error{error_code::destination_exists, "asset " + name + " already exists, not overwriting", kComponent});
  }
  std::filesystem::create_directories(dir_, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "mkdir failed: " + dir_.string(), kComponent});
  }
  if (auto cx = copy_file_exclusive(source, dir_ / name, kComponent); !cx) return std::unexpected(cx.error());
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][assets] archived " << source.string() << " -> " << name << std::endl;
  }
  return name;
}

auto AssetStore::restore(std::string_view asset_id, const std::filesystem::path& dest_dir) const
    -> std::expected<std::filesystem::path, core::error> {
  using core::error; using core::error_code;
  auto src = checked_path(asset_id);
  if (!src) return std::unexpected(src.error());
  std::error_code ec;
  if (!std::filesystem::is_regular_file(*src, ec)) {
    return std::unexpected(error{error_code::not_found, "asset " + std::string(asset_id) + " not found in " + dir_.string(), kComponent});
  }
  const auto dest = dest_dir / ("_" + std::string(asset_id));
  if (auto cx = copy_file_exclusive(*src, dest, kComponent); !cx) return std::unexpected(cx.error());
  return dest;
}

auto AssetStore::remove(std::string_view asset_id) const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  auto p = checked_path(asset_id);
  if (!p) return std::unexpected(p.error());
  std::error_code ec;
  std::filesystem::remove(*p, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "remove failed: " + p->string() + " (" + ec.message() + ")", kComponent});
  }
  return {};
}

auto AssetStore::remove_for_entry(std::string_view entry_id, std::string_view keep) const
    -> std::expected<std::vector<std::string>, core::error> {
  auto all = list();
  if (!all) return std::unexpected(all.error());
  std::vector<std::string> removed;
  for (const auto& name : *all) {
    if (name == keep || !entry::asset_belongs_to(name, entry_id)) continue;
    if (auto rx = remove(name); !rx) return std::unexpected(rx.error());
    removed.push_back(name);
  }
  return removed;
}

auto AssetStore::list(std::string_view filter) const
    -> std::expected<std::vector<std::string>, core::error> {
  using core::error; using core::error_code;
  std::vector<std::string> out;
  std::error_code ec;
  if (!std::filesystem::exists(dir_, ec)) return out;
  const auto needle = lowercase(filter);
  std::filesystem::directory_iterator it(dir_, ec), end;
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "cannot list " + dir_.string() + " (" + ec.message() + ")", kComponent});
  }
  for (; it != end; it.increment(ec)) {
    if (ec) break;
    if (!it->is_regular_file(ec)) continue;
    auto name = it->path().filename().string();
    if (!needle.empty() && lowercase(name).find(needle) == std::string::npos) continue;
    out.push_back(std::move(name));
  }
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "cannot list " + dir_.string() + " (" + ec.message() + ")", kComponent});
  }
  std::sort(out.begin(), out.end());
  return out;
}

bool AssetStore::exists(std::string_view asset_id) const {
  auto p = checked_path(asset_id);
  if (!p) return false;
  std::error_code ec;
  return std::filesystem::is_regular_file(*p, ec);
}

} // namespace inkwell::store
