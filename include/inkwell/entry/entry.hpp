#pragma once

/** \file entry.hpp
 *  \brief Entry record types and entry-id helpers (pure, no IO).
 *
 * Entry id format: YYYY-MM-DD-HH-MM with an optional two-digit collision suffix (-02 .. -99).
 * Ids are zero-padded so that plain lexicographic order equals chronological order.
 * Thread-safety: functions are stateless and thread-safe.
 */

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace inkwell::entry {

inline constexpr std::string_view kTitlePlaceholder = "__TITLE__";
inline constexpr std::string_view kBodyPlaceholder = "__BODY__";
inline constexpr std::string_view kExternalCommitMode = "external-commit";

struct TouchedFile {
  std::string path;          // advisory; never checked against the filesystem
  std::string description;   // may be empty
};

struct ArchivedFile {
  std::string original_path; // path as given when archiving
  std::string asset_id;      // "{entryId}-{basename}" inside the asset directory
  std::string description;   // may be empty
};

struct RelatedEntry {
  std::string id;            // id of a prior entry
  std::string title;         // display only; resolved when the entry was prepared
};

struct Entry {
  std::string id;
  std::string timestamp;     // "HH:MM", local time
  std::string title;
  std::string body;
  std::vector<TouchedFile> files_touched;
  std::vector<ArchivedFile> archived;
  std::vector<RelatedEntry> related;
  std::optional<std::string> external_state; // opaque; stored verbatim
  std::string mode;          // empty or kExternalCommitMode
};

// True for YYYY-MM-DD-HH-MM[-NN] with in-range month/day/hour/minute fields.
[[nodiscard]] bool is_valid_entry_id(std::string_view id) noexcept;

// True for YYYY-MM-DD with in-range month/day fields.
[[nodiscard]] bool is_valid_date(std::string_view date) noexcept;

// "YYYY-MM-DD-HH-MM" from a broken-down local time; seconds are discarded.
[[nodiscard]] std::string format_entry_id(const std::tm& local);

// "YYYY-MM-DD" from a broken-down local time.
[[nodiscard]] std::string format_date(const std::tm& local);

// "HH:MM" from a broken-down local time.
[[nodiscard]] std::string format_timestamp(const std::tm& local);

// Local broken-down time for now (localtime_r / localtime_s).
[[nodiscard]] std::tm local_now();

// Date part ("YYYY-MM-DD") of an entry id. Precondition: id.size() >= 10.
[[nodiscard]] std::string_view entry_date(std::string_view id) noexcept;

// "HH:MM" embedded in an entry id, or empty if the id is malformed.
[[nodiscard]] std::string timestamp_of(std::string_view id);

// Asset name for archiving source under entry_id: "{entry_id}-{basename(source)}".
[[nodiscard]] std::string asset_name(std::string_view entry_id, const std::filesystem::path& source);

// True if asset_id was produced for entry_id (i.e. starts with "{entry_id}-").
[[nodiscard]] bool asset_belongs_to(std::string_view asset_id, std::string_view entry_id) noexcept;

} // namespace inkwell::entry
