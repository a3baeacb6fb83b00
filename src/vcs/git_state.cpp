#include "inkwell/vcs/git_state.hpp"
#include "inkwell/store/file_ops.hpp"
#include "inkwell/core/platform_utils.hpp"

#include <chrono>
#include <cstdio>
#include <iostream>

#if defined(_WIN32)
#define popen _popen
#define pclose _pclose
#else
#include <sys/wait.h>
#endif

namespace inkwell::vcs {

namespace {

constexpr const char* kComponent = "vcs.git";

std::string shell_quote(std::string_view s) {
  std::string out("'");
  for (char c : s) {
    if (c == '\'') out.append("'\\''");
    else out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

std::string git(const std::filesystem::path& worktree, std::string_view args) {
  return "git -C " + shell_quote(worktree.string()) + " " + std::string(args) + " 2>&1";
}

std::string trim(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  return s;
}

} // namespace

auto run_command(const std::string& cmd) -> std::expected<CommandResult, core::error> {
  using core::error; using core::error_code;
  if (core::debug_enabled()) std::cerr << "[inkwell][git] " << cmd << std::endl;
  FILE* pipe = popen(cmd.c_str(), "r");
  if (!pipe) {
    return std::unexpected(error{error_code::io_failed, "popen failed to start: " + cmd, kComponent});
  }
  CommandResult r;
  char buffer[256];
  while (std::fgets(buffer, sizeof(buffer), pipe) != nullptr) r.output.append(buffer);
  int rc = pclose(pipe);
#if defined(_WIN32)
  r.status = rc;
#else
  r.status = (rc != -1 && WIFEXITED(rc)) ? WEXITSTATUS(rc) : -1;
#endif
  return r;
}

auto short_head(const std::filesystem::path& worktree) -> std::optional<std::string> {
  auto r = run_command(git(worktree, "rev-parse --short HEAD"));
  if (!r || r->status != 0) return std::nullopt;
  auto hash = trim(std::move(r->output));
  if (hash.empty()) return std::nullopt;
  return hash;
}

auto commit_tracked(const std::filesystem::path& worktree, std::string_view title, std::string_view body)
    -> std::expected<std::string, core::error> {
  using core::error; using core::error_code;
  auto add = run_command(git(worktree, "add -u"));
  if (!add) return std::unexpected(add.error());
  if (add->status != 0) {
    return std::unexpected(error{error_code::external_commit_failed, "git add -u failed: " + trim(add->output), kComponent});
  }
  auto staged = run_command(git(worktree, "diff --cached --quiet"));
  if (!staged) return std::unexpected(staged.error());
  if (staged->status == 0) {
    return std::unexpected(error{error_code::external_commit_failed, "no changes to commit", kComponent});
  }

  std::string message(title);
  if (!body.empty()) message.append("\n\n").append(body);
  message.push_back('\n');
  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto msg_file = std::filesystem::temp_directory_path() / ("inkwell_commit_" + std::to_string(stamp) + ".txt");
  if (auto wx = store::write_file_atomic(msg_file, message, kComponent); !wx) return std::unexpected(wx.error());

  auto commit = run_command(git(worktree, "commit -q -F " + shell_quote(msg_file.string())));
  std::error_code ec;
  std::filesystem::remove(msg_file, ec);
  if (!commit) return std::unexpected(commit.error());
  if (commit->status != 0) {
    return std::unexpected(error{error_code::external_commit_failed, "git commit failed: " + trim(commit->output), kComponent});
  }
  auto hash = short_head(worktree);
  if (!hash) {
    return std::unexpected(error{error_code::external_commit_failed, "git rev-parse --short HEAD failed after commit", kComponent});
  }
  return *hash;
}

auto make_commit_hook(std::filesystem::path worktree) -> store::ExternalCommitHook {
  return [worktree = std::move(worktree)](std::string_view title, std::string_view body) {
    return commit_tracked(worktree, title, body);
  };
}

} // namespace inkwell::vcs
