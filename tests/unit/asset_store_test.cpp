#include <catch2/catch_all.hpp>
#include <filesystem>
#include <string>

#include "inkwell/store/asset_store.hpp"
#include "tests/support/store_test_helpers.hpp"

using namespace store_test_helpers;
using inkwell::core::error_code;
using inkwell::store::AssetStore;

TEST_CASE("save then restore reproduces the original bytes", "[assets]") {
  namespace fs = std::filesystem;
  auto dir = fresh_dir("assets_roundtrip");
  const std::string bytes("line1\r\nline2\n\0binary\xff", 21);
  write_text(dir / "work" / "model.py", bytes);
  AssetStore assets(dir / "store" / "assets");

  auto id = assets.save("2026-01-23-14-35", dir / "work" / "model.py");
  REQUIRE(id.has_value());
  REQUIRE(*id == "2026-01-23-14-35-model.py");
  REQUIRE(assets.exists(*id));

  fs::create_directories(dir / "out");
  auto restored = assets.restore(*id, dir / "out");
  REQUIRE(restored.has_value());
  REQUIRE(restored->string() == (dir / "out" / "_2026-01-23-14-35-model.py").string());
  REQUIRE(read_text(*restored) == bytes);
  std::error_code ec; fs::remove_all(dir, ec);
}

TEST_CASE("save never overwrites and reports missing sources", "[assets]") {
  namespace fs = std::filesystem;
  auto dir = fresh_dir("assets_save_errors");
  write_text(dir / "a.txt", "first");
  AssetStore assets(dir / "assets");
  REQUIRE(assets.save("2026-01-23-14-35", dir / "a.txt").has_value());

  write_text(dir / "a.txt", "second");
  auto dup = assets.save("2026-01-23-14-35", dir / "a.txt");
  REQUIRE_FALSE(dup.has_value());
  REQUIRE(dup.error().code == error_code::destination_exists);
  REQUIRE(read_text(dir / "assets" / "2026-01-23-14-35-a.txt") == "first");

  auto missing = assets.save("2026-01-23-14-35", dir / "model.py");
  REQUIRE_FALSE(missing.has_value());
  REQUIRE(missing.error().code == error_code::source_not_found);
  REQUIRE(missing.error().message.find("model.py") != std::string::npos);

  auto bad_id = assets.save("yesterday", dir / "a.txt");
  REQUIRE_FALSE(bad_id.has_value());
  REQUIRE(bad_id.error().code == error_code::invalid_argument);
  std::error_code ec; fs::remove_all(dir, ec);
}

TEST_CASE("second restore to the same place fails and leaves the first copy alone", "[assets]") {
  namespace fs = std::filesystem;
  auto dir = fresh_dir("assets_restore_twice");
  write_text(dir / "notes.md", "v1");
  AssetStore assets(dir / "assets");
  auto id = assets.save("2026-01-23-14-35", dir / "notes.md");
  REQUIRE(id.has_value());

  auto first = assets.restore(*id, dir);
  REQUIRE(first.has_value());
  write_text(*first, "edited by user");
  auto second = assets.restore(*id, dir);
  REQUIRE_FALSE(second.has_value());
  REQUIRE(second.error().code == error_code::destination_exists);
  REQUIRE(read_text(*first) == "edited by user");

  auto unknown = assets.restore("2026-01-23-14-35-nope.md", dir);
  REQUIRE_FALSE(unknown.has_value());
  REQUIRE(unknown.error().code == error_code::not_found);
  std::error_code ec; fs::remove_all(dir, ec);
}

TEST_CASE("list filters case-insensitively and sorts; remove is idempotent", "[assets]") {
  namespace fs = std::filesystem;
  auto dir = fresh_dir("assets_list");
  AssetStore assets(dir / "assets");
  REQUIRE(assets.list()->empty());

  write_text(dir / "Model.PY", "m");
  write_text(dir / "data.csv", "d");
  REQUIRE(assets.save("2026-01-24-08-00", dir / "data.csv").has_value());
  REQUIRE(assets.save("2026-01-23-14-35", dir / "Model.PY").has_value());
  REQUIRE(assets.save("2026-01-23-14-35-02", dir / "data.csv").has_value());

  auto all = assets.list();
  REQUIRE(all.has_value());
  REQUIRE(*all == std::vector<std::string>{"2026-01-23-14-35-02-data.csv", "2026-01-23-14-35-Model.PY",
                                           "2026-01-24-08-00-data.csv"});
  REQUIRE(*assets.list("model.py") == std::vector<std::string>{"2026-01-23-14-35-Model.PY"});
  REQUIRE(assets.list("DATA")->size() == 2);

  REQUIRE(assets.remove("2026-01-24-08-00-data.csv").has_value());
  REQUIRE(assets.remove("2026-01-24-08-00-data.csv").has_value());
  REQUIRE_FALSE(assets.exists("2026-01-24-08-00-data.csv"));
  REQUIRE_FALSE(assets.remove("../escape").has_value());

  auto removed = assets.remove_for_entry("2026-01-23-14-35");
  REQUIRE(removed.has_value());
  REQUIRE(*removed == std::vector<std::string>{"2026-01-23-14-35-Model.PY"});
  REQUIRE(assets.exists("2026-01-23-14-35-02-data.csv"));
  std::error_code ec; fs::remove_all(dir, ec);
}
