/**
 * @file repository_inspector.hpp
 * @brief Read-only queries against the working repository.
 *
 * Every method issues one or more executor queries and parses git's fixed
 * output formats. Failures are thrown as CommandFailure.
 */

#ifndef GITEXT_REPOSITORY_INSPECTOR_HPP
#define GITEXT_REPOSITORY_INSPECTOR_HPP

#include "command_executor.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gitext {

/** Commit counts of the current branch relative to a remote branch. */
struct AheadBehind {
  int ahead{0};
  int behind{0};

  bool up_to_date() const { return ahead == 0 && behind == 0; }
};

/** Point-in-time view of the repository, recomputed per operation. */
struct RepositoryState {
  std::string current_branch;
  bool is_clean{true};
  bool is_detached_head{false};
  bool on_remote{false}; ///< Current branch is published on the remote
  int ahead{0};
  int behind{0};
  std::vector<std::string> recent_authors;
  std::vector<std::string> merged_branches;
};

class RepositoryInspector {
public:
  explicit RepositoryInspector(CommandExecutor &executor);

  /** True when the working directory is inside a git repository. */
  bool is_repository();

  /** Absolute path of the working tree root. */
  std::string repository_root();

  std::string current_branch();
  bool is_clean();

  /** HEAD is detached when `symbolic-ref -q HEAD` fails or prints nothing. */
  bool is_detached_head();

  /** Local branch existence. */
  bool branch_exists(const std::string &branch);

  /** Branch existence on @p remote, as reported by `ls-remote --heads`. */
  bool remote_branch_exists(const std::string &remote,
                            const std::string &branch);

  /** URL of @p remote, or std::nullopt when the remote is not configured. */
  std::optional<std::string> remote_url(const std::string &remote);

  /** Counts of @p head relative to `<remote>/<branch>`. */
  AheadBehind ahead_behind(const std::string &remote,
                           const std::string &branch,
                           const std::string &head);

  /** Same as above, measured from the current branch. */
  AheadBehind ahead_behind(const std::string &remote,
                           const std::string &branch);

  /** Distinct authors of the last @p count commits, first-seen order. */
  std::vector<std::string> recent_authors(int count);

  /**
   * Local branches merged into @p into, excluding @p into itself and the
   * marked current branch.
   */
  std::vector<std::string> merged_branches(const std::string &into);

  std::string staged_diff();

  /** A failing `diff --cached --quiet` means changes are staged. */
  bool has_staged_changes();

  /** One-line summaries of commits in @p head but not in @p base. */
  std::vector<std::string> commits_between(const std::string &base,
                                           const std::string &head);

  /**
   * Collect a RepositoryState for the current branch.
   *
   * Ahead/behind and recent authors are collected only when the current
   * branch exists on @p remote. An unreachable remote leaves the branch
   * unpublished, a timeout still throws. Merged branches are filled only
   * when @p merged_into is given.
   */
  RepositoryState snapshot(const std::string &remote, int author_window,
                           const std::optional<std::string> &merged_into =
                               std::nullopt);

private:
  std::string checked(const std::vector<std::string> &args);

  CommandExecutor &executor_;
};

/** Split @p text into trimmed non-empty lines, dropping repeats. */
std::vector<std::string> unique_lines(const std::string &text);

} // namespace gitext

#endif // GITEXT_REPOSITORY_INSPECTOR_HPP
