#include "inkwell/entry/entry.hpp"

#include <cctype>
#include <cstdio>

namespace inkwell::entry {

namespace {

bool all_digits(std::string_view s) noexcept {
  for (char c : s) { if (!std::isdigit(static_cast<unsigned char>(c))) return false; }
  return !s.empty();
}

int two_digits(std::string_view s) noexcept {
  return (s[0] - '0') * 10 + (s[1] - '0');
}

// Layout: YYYY-MM-DD-HH-MM
//         0123456789012345
bool valid_base(std::string_view id) noexcept {
  if (id.size() != 16) return false;
  for (std::size_t pos : {4u, 7u, 10u, 13u}) { if (id[pos] != '-') return false; }
  if (!is_valid_date(id.substr(0, 10))) return false;
  if (!all_digits(id.substr(11, 2)) || !all_digits(id.substr(14, 2))) return false;
  return two_digits(id.substr(11, 2)) <= 23 && two_digits(id.substr(14, 2)) <= 59;
}

} // namespace

bool is_valid_date(std::string_view date) noexcept {
  if (date.size() != 10 || date[4] != '-' || date[7] != '-') return false;
  if (!all_digits(date.substr(0, 4)) || !all_digits(date.substr(5, 2)) || !all_digits(date.substr(8, 2))) return false;
  const int month = two_digits(date.substr(5, 2));
  const int day = two_digits(date.substr(8, 2));
  return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

bool is_valid_entry_id(std::string_view id) noexcept {
  if (id.size() == 16) return valid_base(id);
  if (id.size() != 19 || id[16] != '-') return false;
  return valid_base(id.substr(0, 16)) && all_digits(id.substr(17, 2));
}

std::string format_entry_id(const std::tm& local) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d-%02d-%02d",
                local.tm_year + 1900, local.tm_mon + 1, local.tm_mday, local.tm_hour, local.tm_min);
  return buf;
}

std::string format_date(const std::tm& local) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
  return buf;
}

std::string format_timestamp(const std::tm& local) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "%02d:%02d", local.tm_hour, local.tm_min);
  return buf;
}

std::tm local_now() {
  const std::time_t t = std::time(nullptr);
  std::tm out{};
#if defined(_WIN32)
  localtime_s(&out, &t);
#else
  localtime_r(&t, &out);
#endif
  return out;
}

std::string_view entry_date(std::string_view id) noexcept {
  return id.substr(0, 10);
}

std::string timestamp_of(std::string_view id) {
  if (!is_valid_entry_id(id)) return {};
  std::string ts(id.substr(11, 5));
  ts[2] = ':';
  return ts;
}

std::string asset_name(std::string_view entry_id, const std::filesystem::path& source) {
  std::string name(entry_id);
  name += '-';
  name += source.filename().string();
  return name;
}

bool asset_belongs_to(std::string_view asset_id, std::string_view entry_id) noexcept {
  if (asset_id.size() <= entry_id.size() + 1) return false;
  if (asset_id.substr(0, entry_id.size()) != entry_id || asset_id[entry_id.size()] != '-') return false;
  // "{base}-NN-name" is ambiguous with an asset of the collision id "{base}-NN"; a base id
  // never claims it by prefix alone.
  if (entry_id.size() == 16) {
    auto rest = asset_id.substr(17);
    if (rest.size() >= 3 && all_digits(rest.substr(0, 2)) && rest[2] == '-') return false;
  }
  return true;
}

} // namespace inkwell::entry
