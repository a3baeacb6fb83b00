#include <catch2/catch_all.hpp>
#include <algorithm>
#include <set>
#include <string>
#include <vector>

#include "inkwell/store/id_allocator.hpp"
#include "inkwell/store/log_store.hpp"
#include "tests/support/store_test_helpers.hpp"

using namespace store_test_helpers;
using inkwell::entry::Entry;
using inkwell::store::LogStore;
using inkwell::store::allocate_entry_id;

namespace {

Entry titled(const std::string& id) {
  Entry e;
  e.id = id;
  e.title = "entry " + id;
  return e;
}

} // namespace

TEST_CASE("allocation on an empty store returns the base id", "[alloc]") {
  auto dir = fresh_dir("alloc_empty");
  LogStore log(dir);
  auto id = allocate_entry_id(log, tm_at(2026, 1, 23, 14, 35));
  REQUIRE(id.has_value());
  REQUIRE(*id == "2026-01-23-14-35");

  // Pure: asking again without committing yields the same id.
  REQUIRE(*allocate_entry_id(log, tm_at(2026, 1, 23, 14, 35)) == "2026-01-23-14-35");
  std::error_code ec; std::filesystem::remove_all(dir, ec);
}

TEST_CASE("allocations within one minute are distinct and sort in allocation order", "[alloc]") {
  auto dir = fresh_dir("alloc_monotonic");
  LogStore log(dir);
  std::vector<std::string> got;
  for (int i = 0; i < 12; ++i) {
    auto id = allocate_entry_id(log, tm_at(2026, 1, 23, 14, 35));
    REQUIRE(id.has_value());
    REQUIRE(log.append(titled(*id)).has_value());
    got.push_back(*id);
  }
  REQUIRE(got[0] == "2026-01-23-14-35");
  REQUIRE(got[1] == "2026-01-23-14-35-02");
  REQUIRE(got[11] == "2026-01-23-14-35-12");
  REQUIRE(std::set<std::string>(got.begin(), got.end()).size() == got.size());
  REQUIRE(std::is_sorted(got.begin(), got.end()));
  std::error_code ec; std::filesystem::remove_all(dir, ec);
}

TEST_CASE("allocation picks the smallest unused suffix and ignores other minutes", "[alloc]") {
  auto dir = fresh_dir("alloc_gap");
  LogStore log(dir);
  REQUIRE(log.append(titled("2026-01-23-14-34")).has_value());
  REQUIRE(log.append(titled("2026-01-23-14-35")).has_value());
  REQUIRE(log.append(titled("2026-01-23-14-35-03")).has_value());
  REQUIRE(*allocate_entry_id(log, tm_at(2026, 1, 23, 14, 35)) == "2026-01-23-14-35-02");
  REQUIRE(*allocate_entry_id(log, tm_at(2026, 1, 23, 14, 36)) == "2026-01-23-14-36");
  std::error_code ec; std::filesystem::remove_all(dir, ec);
}

TEST_CASE("allocation fails once all 99 collision suffixes are used", "[alloc]") {
  auto dir = fresh_dir("alloc_exhausted");
  LogStore log(dir);
  for (int i = 0; i < 99; ++i) {
    auto id = allocate_entry_id(log, tm_at(2026, 1, 23, 14, 35));
    REQUIRE(id.has_value());
    REQUIRE(log.append(titled(*id)).has_value());
  }
  auto id = allocate_entry_id(log, tm_at(2026, 1, 23, 14, 35));
  REQUIRE_FALSE(id.has_value());
  REQUIRE(id.error().code == inkwell::core::error_code::allocation_exhausted);
  std::error_code ec; std::filesystem::remove_all(dir, ec);
}
