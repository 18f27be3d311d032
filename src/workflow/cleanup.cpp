#include "operation.hpp"

#include <unordered_set>

namespace gitext {

using detail::Narrative;

/**
 * Collect local branches merged into stage or production.
 *
 * Without `hard` the candidates are only listed. With it each one is
 * deleted with `branch -d`, falling back to `branch -D`. Protected branches
 * and the checked out branch are never deleted.
 */
OperationResult cleanup(const Policy &policy, const CleanupRequest &request,
                        CommandExecutor &executor) {
  return detail::run_guarded("cleanup", [&](OperationResult &result,
                                            Narrative &out) {
    RepositoryInspector inspector(executor);
    auto state = inspector.snapshot(policy.remote_name,
                                    policy.shared_author_window);
    const auto current = state.current_branch;

    std::vector<std::string> candidates;
    std::unordered_set<std::string> seen;
    for (const auto *into : {&policy.stage_branch, &policy.production_branch}) {
      std::vector<std::string> merged;
      try {
        merged = inspector.merged_branches(*into);
      } catch (const CommandFailure &e) {
        out.warning("Could not list branches merged into " + *into);
        detail::workflow_log()->debug("merged listing failed: {}", e.what());
        continue;
      }
      for (const auto &branch : merged) {
        if (branch != current && seen.insert(branch).second) {
          candidates.push_back(branch);
        }
      }
    }

    state.merged_branches = candidates;
    result.state = state;

    if (candidates.empty()) {
      out.info("No merged branches to clean up");
      return;
    }
    out.info("Found " + std::to_string(candidates.size()) +
             " merged branch(es):");
    for (const auto &branch : candidates) {
      out.plain("  - " + branch);
    }

    if (!request.hard) {
      out.warning("Report only - no branches deleted");
      result.next = "gitext cleanup --hard";
      return;
    }

    out.doing("Deleting merged branches");
    int deleted = 0;
    int failed = 0;
    for (const auto &branch : candidates) {
      if (is_protected(branch, policy)) {
        out.warning("Skipping protected branch: " + branch);
        continue;
      }
      auto soft = executor.execute({"branch", "-d", branch});
      if (soft.ok()) {
        out.detail("Deleted " + branch);
        ++deleted;
        continue;
      }
      out.warning("Failed to delete " + branch + ": " + soft.error->output);
      auto forced = executor.execute({"branch", "-D", branch});
      if (forced.ok()) {
        out.detail("Force deleted " + branch);
        ++deleted;
      } else {
        out.error("Failed to force delete " + branch + ": " +
                  forced.error->output);
        ++failed;
      }
    }
    std::string summary = executor.options().dry_run ? "Would delete "
                                                      : "Deleted ";
    summary += std::to_string(deleted) + " branch(es)";
    if (failed > 0) {
      summary += ", " + std::to_string(failed) + " failed";
    }
    out.did(summary);
    result.next = "gitext status";
  });
}

} // namespace gitext
