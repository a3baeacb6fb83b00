#pragma once

/** \file log_store.hpp
 *  \brief Append-only collection of daily log files ("YYYY-MM-DD.md").
 *
 * Records are only ever appended. The single exception is the final record of a file, which
 * replace_last/delete_last rewrite by cutting the file at that record's byte offset and
 * writing prefix + replacement atomically (tmp + fsync + rename). Earlier bytes are untouched.
 *
 * Thread-safety: none; single writer per store directory.
 */

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "inkwell/entry/codec.hpp"
#include "inkwell/entry/entry.hpp"
#include "inkwell/error.hpp"

namespace inkwell::store {

class LogStore {
public:
  explicit LogStore(std::filesystem::path root);

  /** \brief Append entry to the daily log of its date, writing the header on first use.
   *  Errors: invalid_argument (malformed id, empty or multi-line title, id not after the file's last id), io_failed.
   */
  auto append(const entry::Entry& e) const -> std::expected<void, core::error>;

  /** \brief Strict parse. Missing file -> empty list; record without id/title -> corrupt_log. */
  auto read(std::string_view date) const -> std::expected<std::vector<entry::Entry>, core::error>;

  /** \brief Lenient parse; malformed records are returned with their flags cleared. */
  auto scan(std::string_view date) const -> std::expected<std::vector<entry::ParsedRecord>, core::error>;

  auto find(std::string_view id) const -> std::expected<std::optional<entry::Entry>, core::error>;

  /** \brief Last id in the daily log for date (per-date notion). */
  auto last_entry_id(std::string_view date) const
      -> std::expected<std::optional<std::string>, core::error>;

  /** \brief Last id of the newest non-empty daily log (global notion). */
  auto latest_entry_id() const -> std::expected<std::optional<std::string>, core::error>;

  /** \brief Replace the final record of date's log; e.id must equal that record's id. */
  auto replace_last(std::string_view date, const entry::Entry& e) const
      -> std::expected<void, core::error>;

  /** \brief Remove the final record of date's log and return it.
   *  When expected_id is given and the final record carries another id (or none), nothing is
   *  written and corrupt_log is returned.
   */
  auto delete_last(std::string_view date, std::string_view expected_id = {}) const
      -> std::expected<entry::Entry, core::error>;

  /** \brief Dates with a daily log file, ascending. */
  auto dates() const -> std::expected<std::vector<std::string>, core::error>;

  /** \brief Ids present in date's log, in file order (malformed records skipped). */
  auto ids(std::string_view date) const -> std::expected<std::vector<std::string>, core::error>;

  std::filesystem::path path_for(std::string_view date) const;
  const std::filesystem::path& root() const noexcept { return root_; }

private:
  std::filesystem::path root_;

  auto load(std::string_view date) const -> std::expected<std::string, core::error>;
  auto last_record(std::string_view date, std::string& text) const
      -> std::expected<entry::ParsedRecord, core::error>;
};

} // namespace inkwell::store
