#include "inkwell/store/validator.hpp"
#include "inkwell/core/platform_utils.hpp"

#include <iostream>
#include <set>

namespace inkwell::store {

auto to_string(violation_kind kind) noexcept -> std::string_view {
  switch (kind) {
    case violation_kind::invalid_id: return "invalid_id";
    case violation_kind::missing_asset: return "missing_asset";
    case violation_kind::orphaned_asset: return "orphaned_asset";
    case violation_kind::dangling_related: return "dangling_related";
  }
  return "unknown";
}

auto validate_store(const LogStore& log, const AssetStore& assets, const ValidateOptions& opts)
    -> std::expected<std::vector<Violation>, core::error> {
  std::vector<Violation> issues;
  auto dates = log.dates();
  if (!dates) return std::unexpected(dates.error());

  const bool incremental = opts.since_id.has_value();
  const std::string since = opts.since_id.value_or(std::string{});
  const std::string since_date = since.size() >= 10 ? since.substr(0, 10) : since;

  struct Pending { std::filesystem::path file; std::string entry_id; std::string related_id; };
  std::set<std::string> known_ids;
  std::set<std::string> referenced_assets;
  std::vector<Pending> related_refs;
  std::size_t checked = 0;

  for (const auto& date : *dates) {
    if (incremental && date < since_date) continue;
    auto recs = log.scan(date);
    if (!recs) return std::unexpected(recs.error());
    const auto file = log.path_for(date);
    const auto fname = file.filename().string();

    for (std::size_t i = 0; i < recs->size(); ++i) {
      const auto& r = (*recs)[i];
      const auto& e = r.entry;
      const bool id_ok = r.has_id && entry::is_valid_entry_id(e.id);
      if (id_ok) known_ids.insert(e.id);
      for (const auto& a : e.archived) referenced_assets.insert(a.asset_id);
      for (const auto& rel : e.related) related_refs.push_back(Pending{file, e.id, rel.id});

      if (incremental && id_ok && e.id <= since) continue;
      ++checked;
      if (!id_ok) {
        const auto what = r.has_id ? "malformed id '" + e.id + "'" : std::string("missing id");
        issues.push_back(Violation{violation_kind::invalid_id, file, e.id, {},
          fname + ": record " + std::to_string(i + 1) + " has " + what});
      } else if (!r.has_title || e.title.empty()) {
        issues.push_back(Violation{violation_kind::invalid_id, file, e.id, {},
          fname + ": entry " + e.id + " has no title"});
      }
      for (const auto& a : e.archived) {
        if (assets.exists(a.asset_id)) continue;
        issues.push_back(Violation{violation_kind::missing_asset, file, e.id, a.asset_id,
          "asset " + a.asset_id + " referenced by entry " + e.id + " not found"});
      }
    }
  }

  if (!incremental) {
    auto listed = assets.list();
    if (!listed) return std::unexpected(listed.error());
    for (const auto& name : *listed) {
      if (referenced_assets.count(name)) continue;
      issues.push_back(Violation{violation_kind::orphaned_asset, assets.dir() / name, {}, name,
        "asset " + name + " is not referenced by any entry"});
    }
    for (const auto& ref : related_refs) {
      if (known_ids.count(ref.related_id)) continue;
      issues.push_back(Violation{violation_kind::dangling_related, ref.file, ref.entry_id, ref.related_id,
        "related entry " + ref.related_id + " referenced by entry " + ref.entry_id + " not found"});
    }
  }

  if (core::debug_enabled()) {
    std::cerr << "[inkwell][validate] checked=" << checked << " violations=" << issues.size()
              << (incremental ? " since=" + since : std::string{}) << std::endl;
  }
  return issues;
}

} // namespace inkwell::store
