#pragma once

/** \file codec.hpp
 *  \brief DailyLog record encode/decode (pure, in-memory).
 *
 * Daily log format (markdown):
 *   # YYYY-MM-DD\n\n---\n\n                      header, written once per file
 *   ---\n                                          record start
 *   id: <entry id>\n
 *   timestamp: HH:MM\n
 *   title: <single line>\n
 *   external_state: <escaped opaque bytes>\n      optional
 *   mode: external-commit\n                        optional
 *   ---\n
 *   ## HH:MM — <title>\n\n
 *   <body>\n\n                                     optional
 *   **Files touched:**\n- `path` — desc\n\n        optional sections
 *   **Archived:**\n- `orig` → [`asset`](assets/asset) — desc\n\n
 *   **Related:**\n- <id> — <title>\n\n
 *   ---\n\n                                        record end
 *
 * Body lines that read as "---" or as a section marker (after any leading backslashes) are
 * written with one extra leading backslash, which decoding strips again.
 *
 * A record starts at a "---" line that opens a block of "key: value" lines closed by another
 * "---" line; it extends to the next record start or the end of the text. Decoding is lenient:
 * it never fails, and records missing id/title are reported through ParsedRecord flags so that
 * strict readers (LogStore::read) and the integrity scan can make their own decision.
 */

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

#include "inkwell/entry/entry.hpp"
#include "inkwell/error.hpp"

namespace inkwell::entry {

struct EncodeOptions {
  bool frontmatter_title{true}; // the staging slot keeps the title in the heading only
};

struct ParsedRecord {
  Entry entry;                 // fields as found; id/title may be empty
  std::string heading_title;   // title from the "## HH:MM — title" line, if any
  bool has_id{false};
  bool has_title{false};       // frontmatter title key present
  std::size_t offset{0};       // byte offset of the record start within the text
  std::size_t length{0};       // bytes up to the next record start (or end of text)
};

// "# YYYY-MM-DD\n\n---\n\n"
[[nodiscard]] std::string daily_log_header(std::string_view date);

[[nodiscard]] std::string encode_entry(const Entry& e, const EncodeOptions& opts = {});

[[nodiscard]] std::vector<ParsedRecord> decode_records(std::string_view text);

/** \brief Parse a hand-written replacement entry.
 *  Accepts markdown starting (after optional leading blank lines) with "## Title" or
 *  "## HH:MM — Title", followed by body and sections. The returned entry has no id; its
 *  timestamp is set only when the heading carries one.
 */
[[nodiscard]] auto decode_replacement(std::string_view markdown)
    -> std::expected<Entry, core::error>;

// Lossless single-line escaping for opaque frontmatter values.
[[nodiscard]] std::string escape_value(std::string_view raw);
[[nodiscard]] std::string unescape_value(std::string_view escaped);

} // namespace inkwell::entry
