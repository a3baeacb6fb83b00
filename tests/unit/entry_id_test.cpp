#include <catch2/catch_all.hpp>
#include <string>

#include "inkwell/entry/entry.hpp"
#include "tests/support/store_test_helpers.hpp"

using namespace inkwell::entry;

TEST_CASE("entry id format validation", "[entry][id]") {
  REQUIRE(is_valid_entry_id("2026-01-23-14-35"));
  REQUIRE(is_valid_entry_id("2026-01-23-14-35-02"));
  REQUIRE(is_valid_entry_id("2026-12-31-23-59-99"));

  REQUIRE_FALSE(is_valid_entry_id(""));
  REQUIRE_FALSE(is_valid_entry_id("2026-01-23"));
  REQUIRE_FALSE(is_valid_entry_id("2026-01-23-14-3"));
  REQUIRE_FALSE(is_valid_entry_id("2026-13-23-14-35"));
  REQUIRE_FALSE(is_valid_entry_id("2026-01-00-14-35"));
  REQUIRE_FALSE(is_valid_entry_id("2026-01-23-24-00"));
  REQUIRE_FALSE(is_valid_entry_id("2026-01-23-14-60"));
  REQUIRE_FALSE(is_valid_entry_id("2026-01-23-14-35-2"));
  REQUIRE_FALSE(is_valid_entry_id("2026-01-23-14-35_02"));
  REQUIRE_FALSE(is_valid_entry_id("2026/01/23-14-35"));
}

TEST_CASE("entry id formatting discards seconds and zero-pads", "[entry][id]") {
  auto t = store_test_helpers::tm_at(2026, 1, 3, 4, 5);
  t.tm_sec = 59;
  REQUIRE(format_entry_id(t) == "2026-01-03-04-05");
  REQUIRE(format_date(t) == "2026-01-03");
  REQUIRE(format_timestamp(t) == "04:05");
  REQUIRE(entry_date("2026-01-03-04-05-02") == "2026-01-03");
  REQUIRE(timestamp_of("2026-01-03-04-05-02") == "04:05");
  REQUIRE(timestamp_of("garbage").empty());
}

TEST_CASE("asset names and ownership", "[entry][assets]") {
  REQUIRE(asset_name("2026-01-23-14-35", "src/model.py") == "2026-01-23-14-35-model.py");
  REQUIRE(asset_belongs_to("2026-01-23-14-35-model.py", "2026-01-23-14-35"));
  REQUIRE(asset_belongs_to("2026-01-23-14-35-02-model.py", "2026-01-23-14-35-02"));
  // A base id does not claim assets of its collision ids.
  REQUIRE_FALSE(asset_belongs_to("2026-01-23-14-35-02-model.py", "2026-01-23-14-35"));
  REQUIRE_FALSE(asset_belongs_to("2026-01-23-14-36-model.py", "2026-01-23-14-35"));
  REQUIRE_FALSE(asset_belongs_to("2026-01-23-14-35-", "2026-01-23-14-35"));
}
