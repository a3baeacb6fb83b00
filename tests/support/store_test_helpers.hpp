#pragma once

#include <ctime>
#include <filesystem>
#include <map>
#include <string>

namespace store_test_helpers {

// Empty scratch directory under the system temp dir; any previous contents are removed.
std::filesystem::path fresh_dir(const std::string& name);

// Whole-file helpers. Throw std::runtime_error on I/O errors.
void write_text(const std::filesystem::path& p, const std::string& content);
std::string read_text(const std::filesystem::path& p);

// Relative path -> file bytes for every regular file below dir (empty if dir is absent).
std::map<std::string, std::string> snapshot_tree(const std::filesystem::path& dir);

// Broken-down local time with seconds zeroed.
std::tm tm_at(int year, int month, int day, int hour, int minute);

} // namespace store_test_helpers
