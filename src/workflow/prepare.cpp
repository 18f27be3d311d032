#include "operation.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>

namespace gitext {

using detail::Narrative;

namespace {

std::vector<std::string> split_words(const std::string &command) {
  std::istringstream in(command);
  std::vector<std::string> words;
  std::string word;
  while (in >> word) {
    words.push_back(word);
  }
  return words;
}

/// Template contents, or empty when unset or unreadable.
std::string read_template(const Policy &policy, const std::string &root,
                          Narrative &out) {
  if (policy.pr_template_path.empty()) {
    return "";
  }
  std::filesystem::path path = policy.pr_template_path;
  if (path.is_relative() && !root.empty()) {
    path = std::filesystem::path(root) / path;
  }
  std::ifstream in(path);
  if (!in) {
    out.warning("PR template not found at " + path.string());
    return "";
  }
  std::ostringstream text;
  text << in.rdbuf();
  return text.str();
}

} // namespace

std::string extract_ticket(const std::string &branch) {
  auto slash = branch.find('/');
  if (slash == std::string::npos) {
    return "";
  }
  auto rest = branch.substr(slash + 1);
  auto end = rest.find('/');
  if (end != std::string::npos) {
    rest.erase(end);
  }
  auto first = rest.find('-');
  if (first == std::string::npos) {
    return "";
  }
  auto second = rest.find('-', first + 1);
  auto project = rest.substr(0, first);
  auto number = rest.substr(first + 1, second == std::string::npos
                                           ? std::string::npos
                                           : second - first - 1);
  if (project.size() < 2 || number.empty()) {
    return "";
  }
  return project + "-" + number;
}

std::string render_pr_text(const std::string &template_text,
                           const std::string &branch,
                           const std::string &target_branch,
                           const std::optional<std::vector<std::string>>
                               &commits) {
  std::ostringstream text;
  if (!template_text.empty()) {
    text << template_text << "\n\n---\n\n";
  }
  text << "## Branch: " << branch << "\n\n";
  auto ticket = extract_ticket(branch);
  if (!ticket.empty()) {
    text << "**Ticket:** " << ticket << "\n\n";
  }
  text << "**Target:** " << target_branch << "\n\n";
  if (commits) {
    text << "## Commits\n\n";
    if (commits->empty()) {
      text << "No commits (branch is up to date or behind)\n";
    }
    for (const auto &line : *commits) {
      text << "- " << line << "\n";
    }
  }
  text << "\n## Description\n\n<!-- Add description here -->\n";
  return text.str();
}

/**
 * Run the target's CI commands in order, then build pull request text.
 *
 * The first failing command stops the run. Commands are split on
 * whitespace and run directly, not through a shell. A failed commit listing
 * only drops the commit section from the text.
 */
OperationResult prepare_pr(const Policy &policy, const PrepareRequest &request,
                           CommandExecutor &executor) {
  return detail::run_guarded("prepare", [&](OperationResult &result,
                                            Narrative &out) {
    RepositoryInspector inspector(executor);
    const auto target_name = std::string(to_string(request.to));
    const auto &target_branch = policy.branch_for(request.to);
    const auto current = inspector.current_branch();

    std::vector<std::string> ci;
    auto configured = policy.ci_commands.find(target_name);
    if (configured != policy.ci_commands.end()) {
      ci = configured->second;
    }
    if (ci.empty()) {
      out.info("No CI commands configured for " + target_name);
    } else {
      out.doing("Running CI checks for " + target_name);
      for (const auto &command : ci) {
        auto argv = split_words(command);
        if (argv.empty()) {
          continue;
        }
        if (executor.options().dry_run) {
          out.detail("[DRY RUN] " + command);
          continue;
        }
        out.detail("Running: " + command);
        auto ran = executor.run_program(argv);
        if (!ran.ok()) {
          out.error("CI check failed: " + command);
          out.fail(OperationStatus::ExecutionFailed,
                   "CI check failed: " + command, *ran.error);
          result.suggestion = "fix the failing check and run prepare again";
          return;
        }
      }
      out.did("All CI checks passed");
    }

    out.doing("Generating PR text");
    std::optional<std::vector<std::string>> commits;
    try {
      commits = inspector.commits_between(
          policy.remote_name + "/" + target_branch, current);
    } catch (const CommandFailure &e) {
      out.warning("Could not list commits against " + policy.remote_name +
                  "/" + target_branch);
      detail::workflow_log()->debug("commit summary failed: {}", e.what());
    }
    result.body =
        render_pr_text(read_template(policy, request.repository_root, out),
                       current, target_branch, commits);
    out.did("PR text generated");
    result.next = "create the PR on your hosting service using the text above";
  });
}

} // namespace gitext
