#include <catch2/catch_all.hpp>
#include <filesystem>
#include <string>

#include "inkwell/entry/codec.hpp"
#include "inkwell/store/asset_store.hpp"
#include "inkwell/store/log_store.hpp"
#include "inkwell/store/validator.hpp"
#include "tests/support/store_test_helpers.hpp"

using namespace store_test_helpers;
using inkwell::entry::Entry;
using inkwell::store::AssetStore;
using inkwell::store::LogStore;
using inkwell::store::ValidateOptions;
using inkwell::store::validate_store;
using inkwell::store::violation_kind;

namespace {

Entry make(const std::string& id, const std::string& title) {
  Entry e;
  e.id = id;
  e.title = title;
  return e;
}

// Entry with one archived file saved through the asset store.
Entry with_asset(const std::filesystem::path& dir, AssetStore& assets, const std::string& id, const std::string& file) {
  write_text(dir / "src" / file, "content of " + file);
  auto asset = assets.save(id, dir / "src" / file);
  REQUIRE(asset.has_value());
  Entry e = make(id, "archived " + file);
  e.archived.push_back({file, *asset, ""});
  return e;
}

} // namespace

TEST_CASE("a consistent store has no violations", "[validate]") {
  auto dir = fresh_dir("validate_clean");
  LogStore log(dir / "log");
  AssetStore assets(dir / "log" / "assets");
  REQUIRE(validate_store(log, assets)->empty());

  REQUIRE(log.append(with_asset(dir, assets, "2026-01-23-14-35", "foo.py")).has_value());
  auto e = make("2026-01-24-08-00", "follow-up");
  e.related.push_back({"2026-01-23-14-35", ""});
  REQUIRE(log.append(e).has_value());
  auto issues = validate_store(log, assets);
  REQUIRE(issues.has_value());
  REQUIRE(issues->empty());
  std::error_code ec; std::filesystem::remove_all(dir, ec);
}

TEST_CASE("scenario D: an asset deleted out-of-band is reported exactly once", "[validate][scenario]") {
  auto dir = fresh_dir("validate_scenario_d");
  LogStore log(dir / "log");
  AssetStore assets(dir / "log" / "assets");
  REQUIRE(log.append(with_asset(dir, assets, "2026-01-23-14-35", "foo.py")).has_value());
  REQUIRE(log.append(with_asset(dir, assets, "2026-01-23-15-00", "bar.py")).has_value());

  std::filesystem::remove(dir / "log" / "assets" / "2026-01-23-14-35-foo.py");
  auto issues = validate_store(log, assets);
  REQUIRE(issues.has_value());
  REQUIRE(issues->size() == 1);
  const auto& v = issues->front();
  REQUIRE(v.kind == violation_kind::missing_asset);
  REQUIRE(v.entry_id == "2026-01-23-14-35");
  REQUIRE(v.subject == "2026-01-23-14-35-foo.py");
  REQUIRE(v.message == "asset 2026-01-23-14-35-foo.py referenced by entry 2026-01-23-14-35 not found");
  REQUIRE(v.file.filename().string() == "2026-01-23.md");
  std::error_code ec; std::filesystem::remove_all(dir, ec);
}

TEST_CASE("orphaned assets, dangling related ids, and invalid records are all collected", "[validate]") {
  auto dir = fresh_dir("validate_collect");
  LogStore log(dir / "log");
  AssetStore assets(dir / "log" / "assets");
  auto e = make("2026-01-23-14-35", "refers to nothing");
  e.related.push_back({"2026-01-01-00-00", "gone"});
  REQUIRE(log.append(e).has_value());
  write_text(dir / "stray.bin", "x");
  REQUIRE(assets.save("2026-01-23-16-00", dir / "stray.bin").has_value());

  // Hand-edited record with a broken id and one without a title.
  write_text(dir / "log" / "2026-01-22.md",
    inkwell::entry::daily_log_header("2026-01-22") +
    "---\nid: 2026-01-22-9-00\ntimestamp: 09:00\ntitle: typo\n---\n## 09:00 \xE2\x80\x94 typo\n\n---\n\n"
    "---\nid: 2026-01-22-10-00\ntimestamp: 10:00\n---\n## 10:00 \xE2\x80\x94 untitled\n\n---\n\n");

  auto issues = validate_store(log, assets);
  REQUIRE(issues.has_value());
  REQUIRE(issues->size() == 4);
  int invalid = 0, orphaned = 0, dangling = 0;
  for (const auto& v : *issues) {
    if (v.kind == violation_kind::invalid_id) ++invalid;
    if (v.kind == violation_kind::orphaned_asset) {
      ++orphaned;
      REQUIRE(v.subject == "2026-01-23-16-00-stray.bin");
    }
    if (v.kind == violation_kind::dangling_related) {
      ++dangling;
      REQUIRE(v.subject == "2026-01-01-00-00");
      REQUIRE(v.entry_id == "2026-01-23-14-35");
    }
  }
  REQUIRE(invalid == 2);
  REQUIRE(orphaned == 1);
  REQUIRE(dangling == 1);
  REQUIRE(inkwell::store::to_string(violation_kind::orphaned_asset) == "orphaned_asset");
  std::error_code ec; std::filesystem::remove_all(dir, ec);
}

TEST_CASE("incremental validation only checks entries after the given id", "[validate][since]") {
  auto dir = fresh_dir("validate_since");
  LogStore log(dir / "log");
  AssetStore assets(dir / "log" / "assets");
  REQUIRE(log.append(with_asset(dir, assets, "2026-01-20-10-00", "old.txt")).has_value());
  REQUIRE(log.append(with_asset(dir, assets, "2026-01-23-14-35", "new.txt")).has_value());
  std::filesystem::remove(dir / "log" / "assets" / "2026-01-20-10-00-old.txt");
  write_text(dir / "orphan.txt", "o");
  REQUIRE(assets.save("2026-01-23-18-00", dir / "orphan.txt").has_value());

  REQUIRE(validate_store(log, assets)->size() == 2);

  ValidateOptions opts;
  opts.since_id = "2026-01-21-00-00";
  REQUIRE(validate_store(log, assets, opts)->empty());

  opts.since_id = "2026-01-19-00-00";
  auto issues = validate_store(log, assets, opts);
  REQUIRE(issues->size() == 1);
  REQUIRE(issues->front().kind == violation_kind::missing_asset);
  std::error_code ec; std::filesystem::remove_all(dir, ec);
}
