#include "repository_inspector.hpp"
#include "log.hpp"

#include <algorithm>
#include <sstream>
#include <unordered_set>

namespace gitext {

namespace {

std::shared_ptr<spdlog::logger> inspector_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("inspector");
  }();
  return logger;
}

[[noreturn]] void throw_unexpected(const std::string &command,
                                   const std::string &output) {
  throw CommandFailure(ExecutionError{ExecutionErrorKind::UnexpectedOutput,
                                      command, output, 0});
}

} // namespace

std::vector<std::string> unique_lines(const std::string &text) {
  std::vector<std::string> lines;
  std::unordered_set<std::string> seen;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty())
      continue;
    if (seen.insert(line).second) {
      lines.push_back(line);
    }
  }
  return lines;
}

RepositoryInspector::RepositoryInspector(CommandExecutor &executor)
    : executor_(executor) {}

std::string RepositoryInspector::checked(const std::vector<std::string> &args) {
  auto result = executor_.query(args);
  if (result.error) {
    throw CommandFailure(*result.error);
  }
  return result.output;
}

bool RepositoryInspector::is_repository() {
  auto result = executor_.query({"rev-parse", "--git-dir"});
  if (result.error &&
      result.error->kind == ExecutionErrorKind::SpawnFailure) {
    throw CommandFailure(*result.error);
  }
  return result.ok();
}

std::string RepositoryInspector::repository_root() {
  auto root = checked({"rev-parse", "--show-toplevel"});
  if (root.empty()) {
    throw_unexpected(executor_.render({"rev-parse", "--show-toplevel"}), root);
  }
  return root;
}

std::string RepositoryInspector::current_branch() {
  auto branch = checked({"rev-parse", "--abbrev-ref", "HEAD"});
  if (branch.empty() || branch.find('\n') != std::string::npos) {
    throw_unexpected(executor_.render({"rev-parse", "--abbrev-ref", "HEAD"}),
                     branch);
  }
  return branch;
}

bool RepositoryInspector::is_clean() {
  return checked({"status", "--porcelain"}).empty();
}

bool RepositoryInspector::is_detached_head() {
  auto result = executor_.query({"symbolic-ref", "-q", "HEAD"});
  if (!result.ok()) {
    if (result.error->kind == ExecutionErrorKind::SpawnFailure ||
        result.error->kind == ExecutionErrorKind::Timeout) {
      throw CommandFailure(*result.error);
    }
    return true;
  }
  return result.output.empty();
}

bool RepositoryInspector::branch_exists(const std::string &branch) {
  return !checked({"branch", "--list", branch}).empty();
}

bool RepositoryInspector::remote_branch_exists(const std::string &remote,
                                               const std::string &branch) {
  return !checked({"ls-remote", "--heads", remote, branch}).empty();
}

std::optional<std::string>
RepositoryInspector::remote_url(const std::string &remote) {
  auto result = executor_.query({"remote", "get-url", remote});
  if (!result.ok()) {
    if (result.error->kind != ExecutionErrorKind::NonZeroExit) {
      throw CommandFailure(*result.error);
    }
    inspector_log()->debug("remote '{}' not configured", remote);
    return std::nullopt;
  }
  if (result.output.empty()) {
    return std::nullopt;
  }
  return result.output;
}

AheadBehind RepositoryInspector::ahead_behind(const std::string &remote,
                                              const std::string &branch,
                                              const std::string &head) {
  std::vector<std::string> args{"rev-list", "--left-right", "--count",
                                remote + "/" + branch + "..." + head};
  auto output = checked(args);
  std::istringstream in(output);
  AheadBehind counts;
  std::string extra;
  // Left side counts commits only on the remote branch.
  if (!(in >> counts.behind >> counts.ahead) || (in >> extra)) {
    throw_unexpected(executor_.render(args), output);
  }
  return counts;
}

AheadBehind RepositoryInspector::ahead_behind(const std::string &remote,
                                              const std::string &branch) {
  return ahead_behind(remote, branch, current_branch());
}

std::vector<std::string> RepositoryInspector::recent_authors(int count) {
  if (count < 1) {
    count = 1;
  }
  return unique_lines(
      checked({"log", "-n", std::to_string(count), "--format=%an"}));
}

std::vector<std::string>
RepositoryInspector::merged_branches(const std::string &into) {
  auto lines = unique_lines(
      checked({"branch", "--merged", into, "--format", "%(refname:short)"}));
  lines.erase(std::remove_if(lines.begin(), lines.end(),
                             [&into](const std::string &name) {
                               return name == into || name.rfind('*', 0) == 0;
                             }),
              lines.end());
  return lines;
}

std::string RepositoryInspector::staged_diff() {
  return checked({"diff", "--cached"});
}

bool RepositoryInspector::has_staged_changes() {
  auto result = executor_.query({"diff", "--cached", "--quiet"});
  if (!result.ok() &&
      result.error->kind != ExecutionErrorKind::NonZeroExit) {
    throw CommandFailure(*result.error);
  }
  return !result.ok();
}

std::vector<std::string>
RepositoryInspector::commits_between(const std::string &base,
                                     const std::string &head) {
  auto output = checked({"log", "--oneline", base + ".." + head});
  std::vector<std::string> commits;
  std::istringstream in(output);
  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (!line.empty())
      commits.push_back(line);
  }
  return commits;
}

RepositoryState
RepositoryInspector::snapshot(const std::string &remote, int author_window,
                              const std::optional<std::string> &merged_into) {
  RepositoryState state;
  state.is_detached_head = is_detached_head();
  state.current_branch = current_branch();
  state.is_clean = is_clean();
  if (!state.is_detached_head) {
    auto listed = executor_.query(
        {"ls-remote", "--heads", remote, state.current_branch});
    if (listed.ok()) {
      state.on_remote = !listed.output.empty();
    } else if (listed.error->kind == ExecutionErrorKind::NonZeroExit) {
      inspector_log()->debug("cannot list '{}' heads: {}", remote,
                             listed.error->output);
    } else {
      throw CommandFailure(*listed.error);
    }
  }
  if (state.on_remote) {
    try {
      auto counts = ahead_behind(remote, state.current_branch,
                                 state.current_branch);
      state.ahead = counts.ahead;
      state.behind = counts.behind;
    } catch (const CommandFailure &e) {
      // The tracking ref is missing until the first fetch.
      if (e.error().kind != ExecutionErrorKind::NonZeroExit) {
        throw;
      }
      inspector_log()->debug("no tracking ref for {}/{}", remote,
                             state.current_branch);
    }
    state.recent_authors = recent_authors(author_window);
  }
  if (merged_into) {
    state.merged_branches = merged_branches(*merged_into);
  }
  inspector_log()->debug("snapshot: branch={} clean={} ahead={} behind={}",
                         state.current_branch, state.is_clean, state.ahead,
                         state.behind);
  return state;
}

} // namespace gitext
