#include "operation.hpp"

namespace gitext {

using detail::Narrative;

/**
 * Fast-forward a protected branch.
 *
 * Checks out the target when needed, fetches, then pulls with `--ff-only`
 * so local commits are never merged in silently. A rejected pull is an
 * ExecutionFailed result suggesting `git pull --rebase`. The ahead/behind
 * report afterwards is best effort because under dry-run the checkout never
 * happened.
 */
OperationResult sync(const Policy &policy, const SyncRequest &request,
                     CommandExecutor &executor) {
  return detail::run_guarded("sync", [&](OperationResult &result,
                                         Narrative &out) {
    RepositoryInspector inspector(executor);
    const auto &remote = policy.remote_name;
    const auto &branch = policy.branch_for(request.target);
    const auto remote_ref = remote + "/" + branch;

    detail::validate_remote(inspector, remote);
    detail::validate_branch(inspector, branch, remote);
    require_clean(inspector.is_clean());

    if (inspector.current_branch() != branch) {
      out.doing("Checking out " + branch);
      if (!detail::run_step(result, executor, {"checkout", branch},
                            "failed to checkout " + branch)) {
        return;
      }
      out.did("Checked out " + branch);
    }

    out.doing("Fetching from " + remote);
    if (!detail::run_step(result, executor, {"fetch", remote},
                          "failed to fetch from " + remote)) {
      return;
    }
    out.did("Fetched from " + remote);

    out.doing("Pulling with --ff-only");
    auto pulled = executor.execute({"pull", "--ff-only", remote, branch});
    if (!pulled.ok()) {
      out.error("Fast-forward pull failed");
      out.fail(OperationStatus::ExecutionFailed,
               "fast-forward not possible, " + branch + " has diverged from " +
                   remote_ref,
               *pulled.error,
               "git pull --rebase " + remote + " " + branch);
      return;
    }
    out.did("Pulled " + remote_ref);

    try {
      auto counts = inspector.ahead_behind(remote, branch, branch);
      if (counts.up_to_date()) {
        out.success(branch + " is up to date with " + remote_ref);
      } else {
        out.info("Ahead: " + std::to_string(counts.ahead) +
                 ", Behind: " + std::to_string(counts.behind));
      }
      RepositoryState state;
      state.current_branch = inspector.current_branch();
      state.is_clean = inspector.is_clean();
      state.ahead = counts.ahead;
      state.behind = counts.behind;
      result.state = state;
    } catch (const CommandFailure &e) {
      // Local branch may not exist yet under dry-run.
      detail::workflow_log()->debug("ahead/behind unavailable: {}", e.what());
    }
    result.next = "gitext status";
  });
}

} // namespace gitext
