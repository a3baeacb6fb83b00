#pragma once

/** \file git_state.hpp
 *  \brief Git-backed external commit provider for external-commit entries.
 *
 * Runs the git executable through popen(3). Used by the CLI only; the store itself never
 * interprets the returned hash.
 */

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "inkwell/error.hpp"
#include "inkwell/store/staging.hpp"

namespace inkwell::vcs {

struct CommandResult {
  int status{0};
  std::string output;   // stdout and stderr combined
};

auto run_command(const std::string& cmd) -> std::expected<CommandResult, core::error>;

/** \brief `git rev-parse --short HEAD` in worktree, or nullopt outside a repository. */
auto short_head(const std::filesystem::path& worktree) -> std::optional<std::string>;

/** \brief Commit tracked changes with "title\n\nbody" and return the new short hash.
 *
 * Steps: git add -u; fail if nothing is staged; git commit -F <msgfile>; git rev-parse --short HEAD.
 */
auto commit_tracked(const std::filesystem::path& worktree, std::string_view title, std::string_view body)
    -> std::expected<std::string, core::error>;

/** \brief ExternalCommitHook bound to worktree. */
auto make_commit_hook(std::filesystem::path worktree) -> store::ExternalCommitHook;

} // namespace inkwell::vcs
