#include <catch2/catch_all.hpp>
#include <string>

#include "inkwell/entry/codec.hpp"

using namespace inkwell::entry;

namespace {

Entry sample() {
  Entry e;
  e.id = "2026-01-23-14-35";
  e.timestamp = "14:35";
  e.title = "Tune the learning rate";
  e.body = "Lowered lr to 3e-4.\n\nLoss curve is smoother.";
  e.files_touched = {{"train.py", "new schedule"}, {"config.yaml", ""}};
  e.archived = {{"model.py", "2026-01-23-14-35-model.py", "before refactor"}};
  e.related = {{"2026-01-22-09-10", "Baseline run"}};
  return e;
}

} // namespace

TEST_CASE("encoded entry has frontmatter, heading, and sections", "[entry][codec]") {
  const auto text = encode_entry(sample());
  REQUIRE(text.rfind("---\nid: 2026-01-23-14-35\ntimestamp: 14:35\ntitle: Tune the learning rate\n---\n", 0) == 0);
  REQUIRE(text.find("## 14:35 \xE2\x80\x94 Tune the learning rate\n") != std::string::npos);
  REQUIRE(text.find("**Files touched:**\n- `train.py` \xE2\x80\x94 new schedule\n- `config.yaml`\n") != std::string::npos);
  REQUIRE(text.find("- `model.py` \xE2\x86\x92 [`2026-01-23-14-35-model.py`](assets/2026-01-23-14-35-model.py) \xE2\x80\x94 before refactor\n") != std::string::npos);
  REQUIRE(text.find("**Related:**\n- 2026-01-22-09-10 \xE2\x80\x94 Baseline run\n") != std::string::npos);
  REQUIRE(text.size() >= 5);
  REQUIRE(text.substr(text.size() - 5) == "---\n\n");
}

TEST_CASE("decode recovers every field and record offsets", "[entry][codec]") {
  auto second = sample();
  second.id = "2026-01-23-14-35-02";
  second.title = "Second";
  second.body.clear();
  second.files_touched.clear();
  second.archived.clear();
  second.related.clear();
  second.external_state = std::string("abc123\n\tline two \\ end");
  second.mode = std::string(kExternalCommitMode);

  const auto header = daily_log_header("2026-01-23");
  const auto first_text = encode_entry(sample());
  const auto text = header + first_text + encode_entry(second);
  auto recs = decode_records(text);
  REQUIRE(recs.size() == 2);

  const auto& a = recs[0];
  REQUIRE(a.has_id);
  REQUIRE(a.has_title);
  REQUIRE(a.offset == header.size());
  REQUIRE(a.length == first_text.size());
  REQUIRE(a.entry.title == "Tune the learning rate");
  REQUIRE(a.heading_title == "Tune the learning rate");
  REQUIRE(a.entry.body == "Lowered lr to 3e-4.\n\nLoss curve is smoother.");
  REQUIRE(a.entry.files_touched.size() == 2);
  REQUIRE(a.entry.files_touched[1].path == "config.yaml");
  REQUIRE(a.entry.files_touched[1].description.empty());
  REQUIRE(a.entry.archived.size() == 1);
  REQUIRE(a.entry.archived[0].asset_id == "2026-01-23-14-35-model.py");
  REQUIRE(a.entry.archived[0].description == "before refactor");
  REQUIRE(a.entry.related.size() == 1);
  REQUIRE(a.entry.related[0].title == "Baseline run");
  REQUIRE_FALSE(a.entry.external_state.has_value());

  const auto& b = recs[1];
  REQUIRE(b.entry.id == "2026-01-23-14-35-02");
  REQUIRE(b.entry.body.empty());
  REQUIRE(b.entry.external_state == second.external_state);
  REQUIRE(b.entry.mode == kExternalCommitMode);
  REQUIRE(b.offset + b.length == text.size());
}

TEST_CASE("decode is lenient about records missing id or title", "[entry][codec]") {
  const std::string text =
    "# 2026-01-23\n\n---\n\n"
    "---\ntimestamp: 10:00\ntitle: No id here\n---\n## 10:00 \xE2\x80\x94 No id here\n\n---\n\n"
    "---\nid: 2026-01-23-11-00\ntimestamp: 11:00\n---\n## 11:00 \xE2\x80\x94 Heading only\n\n---\n\n";
  auto recs = decode_records(text);
  REQUIRE(recs.size() == 2);
  REQUIRE_FALSE(recs[0].has_id);
  REQUIRE(recs[0].has_title);
  REQUIRE(recs[1].has_id);
  REQUIRE_FALSE(recs[1].has_title);
  REQUIRE(recs[1].heading_title == "Heading only");
}

TEST_CASE("a header-only log and plain markdown decode to no records", "[entry][codec]") {
  REQUIRE(decode_records("").empty());
  REQUIRE(decode_records(daily_log_header("2026-01-23")).empty());
  REQUIRE(decode_records("# notes\n\n---\n\nsome text\n---\n").empty());
}

TEST_CASE("replacement markdown parses heading, body, and sections", "[entry][codec]") {
  const std::string md =
    "\n## 09:15 \xE2\x80\x94 Rewritten title\n\nNew body text.\n\n"
    "**Files touched:**\n- `a.cpp` \xE2\x80\x94 fix\n\n";
  auto e = decode_replacement(md);
  REQUIRE(e.has_value());
  REQUIRE(e->id.empty());
  REQUIRE(e->title == "Rewritten title");
  REQUIRE(e->timestamp == "09:15");
  REQUIRE(e->body == "New body text.");
  REQUIRE(e->files_touched.size() == 1);

  auto plain = decode_replacement("## Just a title\nbody");
  REQUIRE(plain.has_value());
  REQUIRE(plain->title == "Just a title");
  REQUIRE(plain->body == "body");

  auto bad = decode_replacement("no heading");
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(bad.error().code == inkwell::core::error_code::invalid_argument);
  REQUIRE_FALSE(decode_replacement("   \n\n").has_value());
}

TEST_CASE("opaque values escape to a single line and back", "[entry][codec]") {
  const std::string raw = std::string("diff --git a/x b/x\n+\tline\r\n\\ end") + '\x01';
  const auto esc = escape_value(raw);
  REQUIRE(esc.find('\n') == std::string::npos);
  REQUIRE(esc.find('\r') == std::string::npos);
  REQUIRE(unescape_value(esc) == raw);
  REQUIRE(unescape_value("trailing\\") == "trailing\\");
}

TEST_CASE("body lines that look like delimiters or section markers round-trip", "[entry][codec]") {
  auto e = sample();
  e.body =
    "Intro.\n\n---\nNote: remember this\n---\n\n"
    "**Archived:**\n- `fake.py` \xE2\x86\x92 [`x`](assets/x)\n\n"
    "\\---\n\\\\**Related:**\n**Files touched:**\nTail paragraph.\n---";
  const auto header = daily_log_header("2026-01-23");
  const auto text = header + encode_entry(e);
  REQUIRE(text.find("\n\\---\nNote: remember this\n\\---\n") != std::string::npos);

  auto recs = decode_records(text);
  REQUIRE(recs.size() == 1);
  REQUIRE(recs[0].has_id);
  REQUIRE(recs[0].entry.body == e.body);
  REQUIRE(recs[0].entry.archived.size() == 1);
  REQUIRE(recs[0].entry.archived[0].asset_id == "2026-01-23-14-35-model.py");
  REQUIRE(recs[0].entry.files_touched.size() == 2);
  REQUIRE(recs[0].entry.related.size() == 1);
  REQUIRE(recs[0].offset + recs[0].length == text.size());

  // Two such records side by side stay two records.
  auto next = e;
  next.id = "2026-01-23-15-00";
  const auto both = text + encode_entry(next);
  auto pair = decode_records(both);
  REQUIRE(pair.size() == 2);
  REQUIRE(pair[1].entry.id == "2026-01-23-15-00");
  REQUIRE(pair[1].entry.body == e.body);

  // Other backslash-led lines are left alone.
  auto plain = sample();
  plain.body = "\\n is a newline\n\\-- not a delimiter";
  auto one = decode_records(encode_entry(plain));
  REQUIRE(one[0].entry.body == plain.body);
}
