#include "inkwell/store/id_allocator.hpp"
#include "inkwell/entry/entry.hpp"

#include <cstdio>
#include <set>

namespace inkwell::store {

auto allocate_entry_id(const LogStore& log, const std::tm& when)
    -> std::expected<std::string, core::error> {
  using core::error; using core::error_code;
  const auto base = entry::format_entry_id(when);
  auto existing = log.ids(entry::format_date(when));
  if (!existing) return std::unexpected(existing.error());

  const std::set<std::string> taken(existing->begin(), existing->end());
  if (!taken.count(base)) return base;
  for (int n = kFirstCollisionSuffix; n <= kLastCollisionSuffix; ++n) {
    char suffix[4];
    std::snprintf(suffix, sizeof(suffix), "-%02d", n);
    auto candidate = base + suffix;
    if (!taken.count(candidate)) return candidate;
  }
  return std::unexpected(error{error_code::allocation_exhausted,
    "all ids for minute " + base + " are taken (-02 .. -99)", "store.alloc"});
}

} // namespace inkwell::store
