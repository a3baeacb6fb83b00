#include "inkwell/config.hpp"
#include "inkwell/core/platform_utils.hpp"
#include "inkwell/store/file_ops.hpp"

#include <iostream>
#include <set>
#include <sstream>
#include <vector>

namespace inkwell {

auto load_config(const std::filesystem::path& worktree) -> StoreConfig {
  StoreConfig cfg;
  cfg.root = worktree / ".inkwell";
  if (auto dir = core::safe_getenv("INKWELL_DIR"); dir && !dir->empty()) {
    std::filesystem::path p(*dir);
    cfg.root = p.is_absolute() ? p : worktree / p;
  }
  if (auto v = core::safe_getenv("INKWELL_VALIDATE"); v && !v->empty() && (*v)[0] == '0') {
    cfg.validate_after_finalize = false;
  }
  if (core::debug_enabled()) {
    std::cerr << "[inkwell][config] root=" << cfg.root.string()
              << " validate_after_finalize=" << (cfg.validate_after_finalize ? 1 : 0) << std::endl;
  }
  return cfg;
}

auto ensure_layout(const StoreConfig& cfg, const std::filesystem::path& worktree)
    -> std::expected<void, core::error> {
  using core::error; using core::error_code;
  std::error_code ec;
  std::filesystem::create_directories(cfg.assets_path(), ec);
  if (ec) {
    return std::unexpected(error{error_code::io_failed, "mkdir failed: " + cfg.assets_path().string() + " (" + ec.message() + ")", "config"});
  }

  std::vector<std::string> wanted;
  const auto rel = cfg.root.lexically_normal().lexically_relative(worktree.lexically_normal());
  if (!rel.empty() && rel.begin()->string() != "..") {
    const auto base = rel.generic_string();
    wanted.push_back(base + "/" + cfg.assets_dir + "/");
    wanted.push_back(base + "/__*__.md");
  }
  wanted.push_back("_20*-*");

  const auto gitignore = worktree / ".gitignore";
  std::string existing;
  if (auto rx = store::read_file(gitignore, "config"); rx) {
    existing = std::move(*rx);
  } else if (rx.error().code != error_code::not_found) {
    return std::unexpected(rx.error());
  }

  std::set<std::string> present;
  {
    std::istringstream in(existing);
    std::string line;
    while (std::getline(in, line)) present.insert(line);
  }
  std::string add;
  for (const auto& w : wanted) {
    if (!present.count(w)) add.append(w).append("\n");
  }
  if (add.empty()) return {};
  if (!existing.empty() && existing.back() != '\n') add.insert(0, "\n");
  return store::append_file(gitignore, add, "config");
}

} // namespace inkwell
