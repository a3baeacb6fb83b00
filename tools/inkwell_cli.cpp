#include "inkwell/config.hpp"
#include "inkwell/entry/codec.hpp"
#include "inkwell/entry/entry.hpp"
#include "inkwell/store/asset_store.hpp"
#include "inkwell/store/file_ops.hpp"
#include "inkwell/store/id_allocator.hpp"
#include "inkwell/store/log_store.hpp"
#include "inkwell/store/recovery.hpp"
#include "inkwell/store/staging.hpp"
#include "inkwell/store/validator.hpp"
#include "inkwell/vcs/git_state.hpp"

#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using inkwell::StoreConfig;
using inkwell::core::error;
using inkwell::store::AssetStore;
using inkwell::store::LogStore;
using inkwell::store::RecoveryController;
using inkwell::store::StagingArea;

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kDash = " \xE2\x80\x94 ";   // " — "

struct Context {
    fs::path worktree;
    StoreConfig cfg;
    LogStore log;
    AssetStore assets;

    explicit Context(fs::path wt)
        : worktree(wt), cfg(inkwell::load_config(wt)), log(cfg.root), assets(cfg.assets_path()) {}
};

static void print_usage() {
    std::cout << "inkwell: narrative work log with staged commits and archived assets\n"
              << "Usage: inkwell <command> [options]\n"
              << "  new-id\n"
              << "  last [--global | --date=YYYY-MM-DD] [--with-title]\n"
              << "  prepare [--touched=F[:DESC]]... [--archive=F[:DESC]]... [--related=ID]...\n"
              << "          [--external-commit] [--external-state=S]\n"
              << "  fill --title=T [--body=B | --body-file=P]\n"
              << "  finalize [--no-validate]\n"
              << "  abort\n"
              << "  status\n"
              << "  edit-latest show | delete | replace [--file=P] | rearchive FILE [--desc=D] | unarchive\n"
              << "  assets save ID FILE... | get ASSET [--dest=DIR] | list [FILTER]\n"
              << "  validate [--quiet] [--since=ID]\n"
              << "Options accept both --key=value and --key value. Environment: INKWELL_DIR, INKWELL_VALIDATE, INKWELL_DEBUG.\n";
}

static int fail(const error& e) {
    std::cerr << "Error: " << e.message << " [" << inkwell::core::to_string(e.code) << "]" << std::endl;
    return 1;
}

static int fail(std::string_view msg) {
    std::cerr << "Error: " << msg << std::endl;
    return 1;
}

// Option cursor over argv[first..]; supports "--key=value" and "--key value".
class Args {
public:
    Args(int argc, char** argv, int first) {
        for (int i = first; i < argc; ++i) items_.emplace_back(argv[i]);
    }

    bool done() const { return pos_ >= items_.size(); }
    const std::string& peek() const { return items_[pos_]; }
    std::string next() { return items_[pos_++]; }

    bool flag(std::string_view key) {
        if (!done() && peek() == key) { ++pos_; return true; }
        return false;
    }

    std::optional<std::string> value(std::string_view key) {
        if (done()) return std::nullopt;
        const auto& a = peek();
        if (a.rfind(key, 0) != 0) return std::nullopt;
        if (a.size() > key.size() && a[key.size()] == '=') { ++pos_; return a.substr(key.size() + 1); }
        if (a.size() == key.size() && pos_ + 1 < items_.size()) { pos_ += 2; return items_[pos_ - 1]; }
        return std::nullopt;
    }

private:
    std::vector<std::string> items_;
    std::size_t pos_{0};
};

static std::pair<std::string, std::string> split_path_desc(const std::string& s) {
    const auto colon = s.find(':');
    if (colon == std::string::npos) return {s, {}};
    return {s.substr(0, colon), s.substr(colon + 1)};
}

static void print_violations(const std::vector<inkwell::store::Violation>& issues) {
    for (const auto& v : issues) {
        std::cerr << "  [" << inkwell::store::to_string(v.kind) << "] " << v.message << std::endl;
    }
}

static std::optional<std::string> read_stream(std::istream& in) {
    std::string s{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad()) return std::nullopt;
    return s;
}

static int cmd_new_id(Context& ctx) {
    auto id = inkwell::store::allocate_entry_id(ctx.log, inkwell::entry::local_now());
    if (!id) return fail(id.error());
    std::cout << *id << "\n";
    return 0;
}

static int cmd_last(Context& ctx, Args& args) {
    bool global = false, with_title = false;
    std::string date = inkwell::entry::format_date(inkwell::entry::local_now());
    while (!args.done()) {
        if (args.flag("--global")) { global = true; continue; }
        if (args.flag("--with-title")) { with_title = true; continue; }
        if (auto v = args.value("--date")) { date = *v; continue; }
        return fail("unknown option for last: " + args.peek());
    }
    auto id = global ? ctx.log.latest_entry_id() : ctx.log.last_entry_id(date);
    if (!id) return fail(id.error());
    if (!*id) {
        std::cout << (global ? "No entries found" : "No entries for " + date) << "\n";
        return 0;
    }
    if (with_title) {
        auto e = ctx.log.find(**id);
        if (!e) return fail(e.error());
        if (*e && !(*e)->title.empty()) {
            std::cout << **id << kDash << (*e)->title << "\n";
            return 0;
        }
    }
    std::cout << **id << "\n";
    return 0;
}

static int cmd_prepare(Context& ctx, Args& args) {
    inkwell::store::PrepareOptions opts;
    while (!args.done()) {
        if (auto v = args.value("--touched")) {
            auto [path, desc] = split_path_desc(*v);
            opts.touched.push_back(inkwell::entry::TouchedFile{path, desc});
            continue;
        }
        if (auto v = args.value("--archive")) {
            auto [path, desc] = split_path_desc(*v);
            opts.archives.push_back(inkwell::store::ArchiveRequest{path, desc});
            continue;
        }
        if (auto v = args.value("--related")) { opts.related.push_back(*v); continue; }
        if (auto v = args.value("--external-state")) { opts.external_state = *v; continue; }
        if (args.flag("--external-commit")) { opts.external_commit = true; continue; }
        return fail("unknown option for prepare: " + args.peek());
    }
    if (!opts.external_state) opts.external_state = inkwell::vcs::short_head(ctx.worktree);

    if (auto lx = inkwell::ensure_layout(ctx.cfg, ctx.worktree); !lx) return fail(lx.error());
    StagingArea staging(ctx.cfg, ctx.log, ctx.assets);
    auto path = staging.prepare(opts);
    if (!path) return fail(path.error());
    std::cout << path->string() << "\n";
    return 0;
}

static int cmd_fill(Context& ctx, Args& args) {
    std::optional<std::string> title, body;
    while (!args.done()) {
        if (auto v = args.value("--title")) { title = *v; continue; }
        if (auto v = args.value("--body")) { body = *v; continue; }
        if (auto v = args.value("--body-file")) {
            auto text = inkwell::store::read_file(*v, "cli");
            if (!text) return fail(text.error());
            body = std::move(*text);
            continue;
        }
        return fail("unknown option for fill: " + args.peek());
    }
    if (!title) return fail("fill requires --title");
    StagingArea staging(ctx.cfg, ctx.log, ctx.assets);
    if (auto fx = staging.fill(*title, body.value_or(std::string{})); !fx) return fail(fx.error());
    std::cout << "Filled pending entry\n";
    return 0;
}

static int cmd_finalize(Context& ctx, Args& args) {
    inkwell::store::FinalizeOptions opts;
    while (!args.done()) {
        if (args.flag("--no-validate")) { opts.validate = false; continue; }
        return fail("unknown option for finalize: " + args.peek());
    }
    opts.hook = inkwell::vcs::make_commit_hook(ctx.worktree);
    StagingArea staging(ctx.cfg, ctx.log, ctx.assets);
    auto res = staging.finalize(opts);
    if (!res) return fail(res.error());
    for (const auto& a : res->archived_assets) std::cout << "Archived: " << a << "\n";
    std::cout << "Entry finalized: " << res->id << "\n";
    if (!res->violations.empty()) {
        print_violations(res->violations);
        return fail(error{inkwell::core::error_code::integrity_violation,
                          "entry " + res->id + " was committed but validation found " +
                              std::to_string(res->violations.size()) + " problem(s)", "cli"});
    }
    return 0;
}

static int cmd_abort(Context& ctx) {
    StagingArea staging(ctx.cfg, ctx.log, ctx.assets);
    auto id = staging.abort();
    if (!id) return fail(id.error());
    if (*id) std::cout << "Aborted pending entry: " << **id << "\n";
    else std::cout << "No pending entry to abort.\n";
    return 0;
}

static int cmd_status(Context& ctx) {
    StagingArea staging(ctx.cfg, ctx.log, ctx.assets);
    auto rec = staging.status();
    if (!rec) return fail(rec.error());
    if (!*rec) {
        std::cout << "No pending entry\n";
        return 0;
    }
    const auto& r = **rec;
    std::cout << "Pending entry: " << r.draft.id << "\n"
              << "Staging file: " << r.path.string() << "\n"
              << "Title filled: " << (r.title_filled ? "yes" : "no") << "\n"
              << "Body filled: " << (r.body_filled ? "yes" : "no") << "\n";
    if (r.external_commit) std::cout << "Mode: " << inkwell::entry::kExternalCommitMode << "\n";
    if (!r.draft.archived.empty()) std::cout << "Archives: " << r.draft.archived.size() << " file(s)\n";
    return 0;
}

static int cmd_edit_latest(Context& ctx, Args& args) {
    if (args.done()) return fail("edit-latest needs one of: show, delete, replace, rearchive, unarchive");
    const auto sub = args.next();
    RecoveryController recovery(ctx.log, ctx.assets);

    if (sub == "show") {
        auto e = recovery.show_last();
        if (!e) return fail(e.error());
        std::cout << "Latest entry from " << ctx.log.path_for(inkwell::entry::entry_date(e->id)).filename().string()
                  << " (ID: " << e->id << "):\n\n" << inkwell::entry::encode_entry(*e);
        return 0;
    }
    if (sub == "delete") {
        auto res = recovery.delete_last();
        if (!res) return fail(res.error());
        for (const auto& a : res->deleted_assets) std::cout << "Deleted asset: " << a << "\n";
        std::cout << "Deleted entry: " << res->removed.id << "\n";
        return 0;
    }
    if (sub == "replace") {
        std::optional<std::string> file;
        while (!args.done()) {
            if (auto v = args.value("--file")) { file = *v; continue; }
            return fail("unknown option for edit-latest replace: " + args.peek());
        }
        std::string markdown;
        if (file) {
            auto text = inkwell::store::read_file(*file, "cli");
            if (!text) return fail(text.error());
            markdown = std::move(*text);
        } else {
            auto text = read_stream(std::cin);
            if (!text) return fail("failed to read replacement entry from stdin");
            markdown = std::move(*text);
        }
        auto content = inkwell::entry::decode_replacement(markdown);
        if (!content) return fail(content.error());
        auto replaced = recovery.replace_last(*content);
        if (!replaced) return fail(replaced.error());
        std::cout << "Replaced entry: " << replaced->id << "\n";
        return 0;
    }
    if (sub == "rearchive") {
        if (args.done()) return fail("edit-latest rearchive needs a FILE");
        const auto file = args.next();
        std::string desc;
        while (!args.done()) {
            if (auto v = args.value("--desc")) { desc = *v; continue; }
            return fail("unknown option for edit-latest rearchive: " + args.peek());
        }
        auto asset = recovery.rearchive(file, desc);
        if (!asset) return fail(asset.error());
        std::cout << "Archived: " << *asset << "\n";
        return 0;
    }
    if (sub == "unarchive") {
        auto deleted = recovery.unarchive();
        if (!deleted) return fail(deleted.error());
        if (deleted->empty()) std::cout << "No assets found for latest entry\n";
        for (const auto& a : *deleted) std::cout << "Deleted asset: " << a << "\n";
        return 0;
    }
    return fail("unknown edit-latest action: " + sub);
}

static int cmd_assets(Context& ctx, Args& args) {
    if (args.done()) return fail("assets needs one of: save, get, list");
    const auto sub = args.next();

    if (sub == "save") {
        if (args.done()) return fail("assets save needs an entry ID");
        const auto id = args.next();
        if (args.done()) return fail("assets save needs at least one FILE");
        if (auto lx = inkwell::ensure_layout(ctx.cfg, ctx.worktree); !lx) return fail(lx.error());
        while (!args.done()) {
            auto asset = ctx.assets.save(id, args.next());
            if (!asset) return fail(asset.error());
            std::cout << "Archived: " << *asset << "\n";
        }
        return 0;
    }
    if (sub == "get") {
        if (args.done()) return fail("assets get needs an ASSET id");
        const auto asset = args.next();
        fs::path dest = ctx.worktree;
        while (!args.done()) {
            if (auto v = args.value("--dest")) { dest = *v; continue; }
            return fail("unknown option for assets get: " + args.peek());
        }
        auto restored = ctx.assets.restore(asset, dest);
        if (!restored) return fail(restored.error());
        std::cout << "Restored: " << restored->string() << "\n";
        return 0;
    }
    if (sub == "list") {
        std::string filter = args.done() ? std::string{} : args.next();
        auto names = ctx.assets.list(filter);
        if (!names) return fail(names.error());
        for (const auto& n : *names) std::cout << n << "\n";
        return 0;
    }
    return fail("unknown assets action: " + sub);
}

static int cmd_validate(Context& ctx, Args& args) {
    bool quiet = false;
    inkwell::store::ValidateOptions opts;
    while (!args.done()) {
        if (args.flag("--quiet")) { quiet = true; continue; }
        if (auto v = args.value("--since")) { opts.since_id = *v; continue; }
        return fail("unknown option for validate: " + args.peek());
    }
    auto issues = inkwell::store::validate_store(ctx.log, ctx.assets, opts);
    if (!issues) return fail(issues.error());
    if (issues->empty()) {
        if (!quiet) std::cout << "All checks passed\n";
        return 0;
    }
    print_violations(*issues);
    return fail(error{inkwell::core::error_code::integrity_violation,
                      std::to_string(issues->size()) + " integrity problem(s) found", "cli"});
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) { print_usage(); return 1; }
    const std::string cmd(argv[1]);
    if (cmd == "--help" || cmd == "-h" || cmd == "help") { print_usage(); return 0; }

    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) return fail("cannot determine working directory: " + ec.message());
    Context ctx(cwd);
    Args args(argc, argv, 2);

    if (cmd == "new-id") return cmd_new_id(ctx);
    if (cmd == "last") return cmd_last(ctx, args);
    if (cmd == "prepare") return cmd_prepare(ctx, args);
    if (cmd == "fill") return cmd_fill(ctx, args);
    if (cmd == "finalize") return cmd_finalize(ctx, args);
    if (cmd == "abort") return cmd_abort(ctx);
    if (cmd == "status") return cmd_status(ctx);
    if (cmd == "edit-latest") return cmd_edit_latest(ctx, args);
    if (cmd == "assets") return cmd_assets(ctx, args);
    if (cmd == "validate") return cmd_validate(ctx, args);

    std::cerr << "Unknown command: " << cmd << std::endl;
    print_usage();
    return 1;
}
