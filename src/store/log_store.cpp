#include "inkwell/store/log_store.hpp"
#include "inkwell/store/file_ops.hpp"
#include "inkwell/core/platform_utils.hpp"

#include <algorithm>
#include <iostream>

namespace inkwell::store {

namespace {

constexpr const char* kComponent = "store.log";

auto check_date(std::string_view date) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!entry::is_valid_date(date)) {
    return std::unexpected(error{error_code::invalid_argument,
      "invalid date: " + std::string(date) + " (expected YYYY-MM-DD)", kComponent});
  }
  return {};
}

auto check_title(const entry::Entry& e) -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (e.title.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "entry " + e.id + " has an empty title", kComponent});
  }
  if (e.title.find_first_of("\r\n") != std::string::npos) {
    return std::unexpected(error{error_code::invalid_argument, "entry " + e.id + ": title must be a single line", kComponent});
  }
  return {};
}

} // namespace

LogStore::LogStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path LogStore::path_for(std::string_view date) const {
  return root_ / (std::string(date) + ".md");
}

auto LogStore::load(std::string_view date) const -> std::expected<std::string, core::error> {
  if (auto dx = check_date(date); !dx) return std::unexpected(dx.error());
  auto rx = read_file(path_for(date), kComponent);
  if (!rx && rx.error().code == core::error_code::not_found) return std::string{};
  return rx;
}

auto LogStore::append(const entry::Entry& e) const -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (!entry::is_valid_entry_id(e.id)) {
    return std::unexpected(error{error_code::invalid_argument, "invalid entry id format: " + e.id, kComponent});
  }
  if (auto tx = check_title(e); !tx) return std::unexpected(tx.error());
  const std::string date(entry::entry_date(e.id));
  auto last = last_entry_id(date);
  if (!last) return std::unexpected(last.error());
  if (*last && **last >= e.id) {
    return std::unexpected(error{error_code::invalid_argument,
      "entry " + e.id + " does not sort after " + **last + " in " + path_for(date).filename().string(), kComponent});
  }

  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "mkdir failed: " + root_.string() + " (" + ec.message() + ")", kComponent});
  }
  const auto path = path_for(date);
  std::string bytes;
  if (!std::filesystem::exists(path, ec)) bytes = entry::daily_log_header(date);
  bytes += entry::encode_entry(e);
  if (auto ax = append_file(path, bytes, kComponent); !ax) return std::unexpected(ax.error());
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][log] appended " << e.id << " to " << path.filename().string() << std::endl;
  }
  return {};
}

auto LogStore::scan(std::string_view date) const
    -> std::expected<std::vector<entry::ParsedRecord>, core::error> {
  auto text = load(date);
  if (!text) return std::unexpected(text.error());
  return entry::decode_records(*text);
}

auto LogStore::read(std::string_view date) const
    -> std::expected<std::vector<entry::Entry>, core::error> {
  using core::error; using core::error_code;
  auto recs = scan(date);
  if (!recs) return std::unexpected(recs.error());
  std::vector<entry::Entry> out;
  out.reserve(recs->size());
  for (std::size_t i = 0; i < recs->size(); ++i) {
    auto& r = (*recs)[i];
    if (!r.has_id || !r.has_title || r.entry.title.empty()) {
      const auto field = !r.has_id ? std::string("id") : std::string("title");
      return std::unexpected(error{error_code::corrupt_log,
        path_for(date).filename().string() + ": record " + std::to_string(i + 1) + " is missing its " + field, kComponent});
    }
    out.push_back(std::move(r.entry));
  }
  return out;
}

auto LogStore::find(std::string_view id) const
    -> std::expected<std::optional<entry::Entry>, core::error> {
  using core::error; using core::error_code;
  if (!entry::is_valid_entry_id(id)) {
    return std::unexpected(error{error_code::invalid_argument, "invalid entry id format: " + std::string(id), kComponent});
  }
  auto recs = scan(entry::entry_date(id));
  if (!recs) return std::unexpected(recs.error());
  for (auto& r : *recs) {
    if (r.entry.id == id) return std::optional<entry::Entry>(std::move(r.entry));
  }
  return std::optional<entry::Entry>{};
}

auto LogStore::ids(std::string_view date) const -> std::expected<std::vector<std::string>, core::error> {
  auto recs = scan(date);
  if (!recs) return std::unexpected(recs.error());
  std::vector<std::string> out;
  for (auto& r : *recs) {
    if (r.has_id) out.push_back(std::move(r.entry.id));
  }
  return out;
}

auto LogStore::last_entry_id(std::string_view date) const
    -> std::expected<std::optional<std::string>, core::error> {
  auto all = ids(date);
  if (!all) return std::unexpected(all.error());
  if (all->empty()) return std::optional<std::string>{};
  return std::optional<std::string>(std::move(all->back()));
}

auto LogStore::latest_entry_id() const -> std::expected<std::optional<std::string>, core::error> {
  auto ds = dates();
  if (!ds) return std::unexpected(ds.error());
  for (auto it = ds->rbegin(); it != ds->rend(); ++it) {
    auto last = last_entry_id(*it);
    if (!last) return std::unexpected(last.error());
    if (*last) return last;
  }
  return std::optional<std::string>{};
}

auto LogStore::dates() const -> std::expected<std::vector<std::string>, core::error> {
  using core::error; using core::error_code;
  std::vector<std::string> out;
  std::error_code ec;
  if (!std::filesystem::exists(root_, ec)) return out;
  std::filesystem::directory_iterator it(root_, ec), end;
  for (; !ec && it != end; it.increment(ec)) {
    const auto& p = it->path();
    if (p.extension() != ".md") continue;
    auto stem = p.stem().string();
    if (entry::is_valid_date(stem)) out.push_back(std::move(stem));
  }
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "cannot list " + root_.string() + " (" + ec.message() + ")", kComponent});
  }
  std::sort(out.begin(), out.end());
  return out;
}

auto LogStore::last_record(std::string_view date, std::string& text) const
    -> std::expected<entry::ParsedRecord, core::error> {
  using core::error; using core::error_code;
  auto loaded = load(date);
  if (!loaded) return std::unexpected(loaded.error());
  text = std::move(*loaded);
  auto recs = entry::decode_records(text);
  if (recs.empty()) {
    return std::unexpected(error{error_code::nothing_to_delete, "no entries in " + path_for(date).filename().string(), kComponent});
  }
  return std::move(recs.back());
}

auto LogStore::replace_last(std::string_view date, const entry::Entry& e) const
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  if (auto tx = check_title(e); !tx) return std::unexpected(tx.error());
  std::string text;
  auto last = last_record(date, text);
  if (!last) return std::unexpected(last.error());
  if (last->entry.id != e.id) {
    return std::unexpected(error{error_code::invalid_argument,
      "replacement id " + e.id + " does not match last entry " + last->entry.id, kComponent});
  }
  std::string out = text.substr(0, last->offset);
  out += entry::encode_entry(e);
  if (auto wx = write_file_atomic(path_for(date), out, kComponent); !wx) return std::unexpected(wx.error());
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][log] replaced " << e.id << std::endl;
  }
  return {};
}

auto LogStore::delete_last(std::string_view date, std::string_view expected_id) const
    -> std::expected<entry::Entry, core::error> {
  using core::error; using core::error_code;
  std::string text;
  auto last = last_record(date, text);
  if (!last) return std::unexpected(last.error());
  if (!expected_id.empty() && last->entry.id != expected_id) {
    return std::unexpected(error{error_code::corrupt_log,
      path_for(date).filename().string() + ": final record is not entry " + std::string(expected_id) +
      " (found '" + last->entry.id + "'); refusing to delete", kComponent});
  }
  if (auto wx = write_file_atomic(path_for(date), std::string_view(text).substr(0, last->offset), kComponent); !wx) {
    return std::unexpected(wx.error());
  }
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][log] deleted " << last->entry.id << " from " << path_for(date).filename().string() << std::endl;
  }
  return std::move(last->entry);
}

} // namespace inkwell::store
