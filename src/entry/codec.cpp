#include "inkwell/entry/codec.hpp"

#include <cctype>
#include <cstdio>
#include <regex>

namespace inkwell::entry {

namespace {

constexpr std::string_view kEmDash = " \xE2\x80\x94 ";   // " — "
constexpr std::string_view kArrow = " \xE2\x86\x92 ";    // " → "
constexpr std::string_view kTouchedMarker = "**Files touched:**";
constexpr std::string_view kArchivedMarker = "**Archived:**";
constexpr std::string_view kRelatedMarker = "**Related:**";

struct Line {
  std::string_view text;   // without '\n' and trailing '\r'
  std::size_t offset;      // offset of the first byte of the line
};

std::vector<Line> split_lines(std::string_view text) {
  std::vector<Line> lines;
  std::size_t pos = 0;
  while (pos < text.size()) {
    auto nl = text.find('\n', pos);
    auto end = (nl == std::string_view::npos) ? text.size() : nl;
    auto sv = text.substr(pos, end - pos);
    if (!sv.empty() && sv.back() == '\r') sv.remove_suffix(1);
    lines.push_back(Line{sv, pos});
    if (nl == std::string_view::npos) break;
    pos = nl + 1;
  }
  return lines;
}

bool is_blank(std::string_view s) {
  for (char c : s) { if (!std::isspace(static_cast<unsigned char>(c))) return false; }
  return true;
}

bool is_key_line(std::string_view s) {
  if (s.empty() || !(std::isalpha(static_cast<unsigned char>(s[0])) || s[0] == '_')) return false;
  for (std::size_t i = 1; i < s.size(); ++i) {
    const char c = s[i];
    if (c == ':') return true;
    if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_')) return false;
  }
  return false;
}

// Body lines that would otherwise read as a record delimiter or a section marker.
bool is_reserved_line(std::string_view s) {
  return s == "---" || s == kTouchedMarker || s == kArchivedMarker || s == kRelatedMarker;
}

// A reserved line behind zero or more backslashes. Encoding adds one backslash to each such body
// line and decoding removes one, so user text that already starts with backslashes survives.
bool is_escapable_line(std::string_view s) {
  std::size_t k = 0;
  while (k < s.size() && s[k] == '\\') ++k;
  return is_reserved_line(s.substr(k));
}

void append_body(std::string& out, std::string_view body) {
  std::size_t pos = 0;
  while (pos <= body.size()) {
    auto nl = body.find('\n', pos);
    auto end = (nl == std::string_view::npos) ? body.size() : nl;
    auto line = body.substr(pos, end - pos);
    auto bare = line;
    if (!bare.empty() && bare.back() == '\r') bare.remove_suffix(1);
    if (is_escapable_line(bare)) out.push_back('\\');
    out.append(line);
    if (nl == std::string_view::npos) break;
    out.push_back('\n');
    pos = nl + 1;
  }
}

// Returns the index of the closing "---" if lines[i] opens a frontmatter block.
std::size_t frontmatter_end(const std::vector<Line>& lines, std::size_t i) {
  if (lines[i].text != "---") return 0;
  std::size_t j = i + 1;
  if (j >= lines.size() || !is_key_line(lines[j].text)) return 0;
  while (j < lines.size() && is_key_line(lines[j].text)) ++j;
  if (j < lines.size() && lines[j].text == "---") return j;
  return 0;
}

std::string_view trim_leading_space(std::string_view v) {
  if (!v.empty() && v.front() == ' ') v.remove_prefix(1);
  return v;
}

void parse_heading(std::string_view line, ParsedRecord& rec) {
  auto rest = line.substr(3); // after "## "
  // "HH:MM — title" or just "title"
  if (rest.size() >= 5 + kEmDash.size() && rest[2] == ':' &&
      std::isdigit(static_cast<unsigned char>(rest[0])) && std::isdigit(static_cast<unsigned char>(rest[1])) &&
      std::isdigit(static_cast<unsigned char>(rest[3])) && std::isdigit(static_cast<unsigned char>(rest[4])) &&
      rest.substr(5, kEmDash.size()) == kEmDash) {
    if (rec.entry.timestamp.empty()) rec.entry.timestamp = std::string(rest.substr(0, 5));
    rec.heading_title = std::string(rest.substr(5 + kEmDash.size()));
  } else {
    rec.heading_title = std::string(rest);
  }
}

enum class Section { None, Touched, Archived, Related };

// Parses heading, body, and sections from lines [begin, end).
void parse_content(const std::vector<Line>& lines, std::size_t begin, std::size_t end, ParsedRecord& rec) {
  static const std::regex touched_rx("^- `([^`]*)`(?: \xE2\x80\x94 (.*))?$");
  static const std::regex archived_rx("^- `([^`]*)` \xE2\x86\x92 \\[`([^`]+)`\\]\\(assets/([^)]*)\\)(?: \xE2\x80\x94 (.*))?$");
  static const std::regex related_rx("^- ([0-9]{4}-[0-9]{2}-[0-9]{2}-[0-9]{2}-[0-9]{2}(?:-[0-9]{2})?)(?: \xE2\x80\x94 (.*))?$");

  std::size_t i = begin;
  while (i < end && is_blank(lines[i].text)) ++i;
  if (i < end && lines[i].text.substr(0, 3) == "## ") {
    parse_heading(lines[i].text, rec);
    ++i;
  }

  std::vector<std::string_view> body;
  Section section = Section::None;
  for (; i < end; ++i) {
    const auto text = lines[i].text;
    if (text == kTouchedMarker) { section = Section::Touched; continue; }
    if (text == kArchivedMarker) { section = Section::Archived; continue; }
    if (text == kRelatedMarker) { section = Section::Related; continue; }
    if (section != Section::None) {
      if (is_blank(text)) { section = Section::None; continue; }
      const std::string s(text);
      std::smatch m;
      if (section == Section::Touched && std::regex_match(s, m, touched_rx)) {
        rec.entry.files_touched.push_back(TouchedFile{m[1].str(), m[2].matched ? m[2].str() : std::string()});
        continue;
      }
      if (section == Section::Archived && std::regex_match(s, m, archived_rx)) {
        rec.entry.archived.push_back(ArchivedFile{m[1].str(), m[2].str(), m[4].matched ? m[4].str() : std::string()});
        continue;
      }
      if (section == Section::Related && std::regex_match(s, m, related_rx)) {
        rec.entry.related.push_back(RelatedEntry{m[1].str(), m[2].matched ? m[2].str() : std::string()});
        continue;
      }
      section = Section::None; // unrecognized line ends the section and belongs to the body
    }
    if (!text.empty() && text.front() == '\\' && is_escapable_line(text)) {
      body.push_back(text.substr(1));
    } else {
      body.push_back(text);
    }
  }

  while (!body.empty() && is_blank(body.back())) body.pop_back();
  if (!body.empty() && body.back() == "---") body.pop_back();
  while (!body.empty() && is_blank(body.back())) body.pop_back();
  std::size_t first = 0;
  while (first < body.size() && is_blank(body[first])) ++first;

  std::string out;
  for (std::size_t k = first; k < body.size(); ++k) {
    if (k > first) out += '\n';
    out.append(body[k]);
  }
  rec.entry.body = std::move(out);
}

void apply_key(std::string_view line, ParsedRecord& rec) {
  const auto colon = line.find(':');
  const auto key = line.substr(0, colon);
  const auto value = trim_leading_space(line.substr(colon + 1));
  if (key == "id") {
    rec.entry.id = std::string(value);
    rec.has_id = !value.empty();
  } else if (key == "timestamp") {
    rec.entry.timestamp = std::string(value);
  } else if (key == "title") {
    rec.entry.title = std::string(value);
    rec.has_title = true;
  } else if (key == "external_state") {
    rec.entry.external_state = unescape_value(value);
  } else if (key == "mode") {
    rec.entry.mode = std::string(value);
  }
  // unknown keys are ignored
}

} // namespace

std::string daily_log_header(std::string_view date) {
  std::string h("# ");
  h.append(date);
  h.append("\n\n---\n\n");
  return h;
}

std::string encode_entry(const Entry& e, const EncodeOptions& opts) {
  const std::string ts = e.timestamp.empty() ? timestamp_of(e.id) : e.timestamp;
  std::string out;
  out.reserve(256 + e.body.size());
  out.append("---\n");
  out.append("id: ").append(e.id).append("\n");
  out.append("timestamp: ").append(ts).append("\n");
  if (opts.frontmatter_title) out.append("title: ").append(e.title).append("\n");
  if (e.external_state) out.append("external_state: ").append(escape_value(*e.external_state)).append("\n");
  if (!e.mode.empty()) out.append("mode: ").append(e.mode).append("\n");
  out.append("---\n");
  out.append("## ").append(ts).append(kEmDash).append(e.title).append("\n\n");

  std::string_view body(e.body);
  while (!body.empty() && (body.back() == '\n' || body.back() == '\r')) body.remove_suffix(1);
  if (!body.empty()) {
    append_body(out, body);
    out.append("\n\n");
  }

  if (!e.files_touched.empty()) {
    out.append(kTouchedMarker).append("\n");
    for (const auto& t : e.files_touched) {
      out.append("- `").append(t.path).append("`");
      if (!t.description.empty()) out.append(kEmDash).append(t.description);
      out.append("\n");
    }
    out.append("\n");
  }
  if (!e.archived.empty()) {
    out.append(kArchivedMarker).append("\n");
    for (const auto& a : e.archived) {
      out.append("- `").append(a.original_path).append("`").append(kArrow)
         .append("[`").append(a.asset_id).append("`](assets/").append(a.asset_id).append(")");
      if (!a.description.empty()) out.append(kEmDash).append(a.description);
      out.append("\n");
    }
    out.append("\n");
  }
  if (!e.related.empty()) {
    out.append(kRelatedMarker).append("\n");
    for (const auto& r : e.related) {
      out.append("- ").append(r.id);
      if (!r.title.empty()) out.append(kEmDash).append(r.title);
      out.append("\n");
    }
    out.append("\n");
  }
  out.append("---\n\n");
  return out;
}

std::vector<ParsedRecord> decode_records(std::string_view text) {
  const auto lines = split_lines(text);
  struct Start { std::size_t line; std::size_t fm_end; };
  std::vector<Start> starts;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (auto j = frontmatter_end(lines, i); j != 0) {
      starts.push_back(Start{i, j});
      i = j;
    }
  }

  std::vector<ParsedRecord> out;
  out.reserve(starts.size());
  for (std::size_t s = 0; s < starts.size(); ++s) {
    const auto end_line = (s + 1 < starts.size()) ? starts[s + 1].line : lines.size();
    ParsedRecord rec;
    rec.offset = lines[starts[s].line].offset;
    const auto end_offset = (s + 1 < starts.size()) ? lines[starts[s + 1].line].offset : text.size();
    rec.length = end_offset - rec.offset;
    for (std::size_t k = starts[s].line + 1; k < starts[s].fm_end; ++k) apply_key(lines[k].text, rec);
    parse_content(lines, starts[s].fm_end + 1, end_line, rec);
    if (rec.entry.timestamp.empty()) rec.entry.timestamp = timestamp_of(rec.entry.id);
    out.push_back(std::move(rec));
  }
  return out;
}

auto decode_replacement(std::string_view markdown) -> std::expected<Entry, core::error> {
  using core::error; using core::error_code;
  const auto lines = split_lines(markdown);
  std::size_t i = 0;
  while (i < lines.size() && is_blank(lines[i].text)) ++i;
  if (i == lines.size()) {
    return std::unexpected(error{error_code::invalid_argument, "replacement entry is empty", "entry.codec"});
  }

  ParsedRecord rec;
  if (frontmatter_end(lines, i) != 0) {
    auto recs = decode_records(markdown.substr(lines[i].offset));
    rec = std::move(recs.front());
  } else if (lines[i].text.substr(0, 3) == "## ") {
    parse_content(lines, i, lines.size(), rec);
  } else {
    return std::unexpected(error{error_code::invalid_argument, "replacement entry must start with '## Title'", "entry.codec"});
  }

  Entry e = std::move(rec.entry);
  if (!rec.heading_title.empty()) e.title = rec.heading_title;
  e.id.clear();
  if (e.title.empty()) {
    return std::unexpected(error{error_code::invalid_argument, "replacement entry has an empty title", "entry.codec"});
  }
  return e;
}

std::string escape_value(std::string_view raw) {
  std::string out;
  out.reserve(raw.size());
  for (unsigned char c : raw) {
    switch (c) {
      case '\\': out.append("\\\\"); break;
      case '\n': out.append("\\n"); break;
      case '\r': out.append("\\r"); break;
      case '\t': out.append("\\t"); break;
      default:
        if (c < 0x20 || c == 0x7F) {
          char buf[5];
          std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned>(c));
          out.append(buf);
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  return out;
}

std::string unescape_value(std::string_view escaped) {
  auto hex = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  std::string out;
  out.reserve(escaped.size());
  for (std::size_t i = 0; i < escaped.size(); ++i) {
    const char c = escaped[i];
    if (c != '\\' || i + 1 == escaped.size()) { out.push_back(c); continue; }
    const char n = escaped[++i];
    switch (n) {
      case '\\': out.push_back('\\'); break;
      case 'n': out.push_back('\n'); break;
      case 'r': out.push_back('\r'); break;
      case 't': out.push_back('\t'); break;
      case 'x':
        if (i + 2 < escaped.size() && hex(escaped[i + 1]) >= 0 && hex(escaped[i + 2]) >= 0) {
          out.push_back(static_cast<char>(hex(escaped[i + 1]) * 16 + hex(escaped[i + 2])));
          i += 2;
        } else {
          out.append("\\x");
        }
        break;
      default:
        out.push_back('\\');
        out.push_back(n);
    }
  }
  return out;
}

} // namespace inkwell::entry
