#include "operation.hpp"

namespace gitext {

using detail::Narrative;

/**
 * Replay or merge the current feature branch on top of `<remote>/<source>`.
 *
 * Refuses detached HEAD, non-feature branches and dirty trees. Conflicts
 * stop the operation as RecoverableFailure with the git command that
 * continues it.
 */
OperationResult update(const Policy &policy, const UpdateRequest &request,
                       CommandExecutor &executor) {
  return detail::run_guarded("update", [&](OperationResult &result,
                                           Narrative &out) {
    RepositoryInspector inspector(executor);
    const auto &remote = policy.remote_name;
    const auto &source = policy.branch_for(request.with);
    const auto remote_ref = remote + "/" + source;

    detail::validate_remote(inspector, remote);
    result.state = inspector.snapshot(remote, policy.shared_author_window);
    require_attached(result.state->is_detached_head);
    const auto current = result.state->current_branch;
    require_pattern(current, policy.feature_pattern);
    require_clean(result.state->is_clean);

    out.doing("Fetching latest from " + remote);
    if (!detail::run_step(result, executor, {"fetch", remote},
                          "failed to fetch from " + remote)) {
      return;
    }

    out.doing("Updating " + source);
    if (!executor.execute({"fetch", remote, source + ":" + source}).ok()) {
      out.detail(source + " may not exist locally, using " + remote_ref);
    }

    if (request.mode == UpdateMode::Rebase) {
      out.doing("Rebasing onto " + remote_ref);
      auto rebased = executor.execute({"rebase", remote_ref});
      if (!rebased.ok()) {
        out.error("Rebase encountered conflicts");
        out.fail(OperationStatus::RecoverableFailure,
                 "rebase onto " + remote_ref + " stopped", *rebased.error,
                 "git rebase --continue");
        result.suggestion = "resolve conflicts, then continue the rebase";
        return;
      }
      out.did("Rebased onto " + remote_ref);
    } else {
      out.doing("Merging " + remote_ref);
      auto merged = executor.execute({"merge", remote_ref});
      if (!merged.ok()) {
        out.error("Merge encountered conflicts");
        out.fail(OperationStatus::RecoverableFailure,
                 "merge of " + remote_ref + " stopped", *merged.error,
                 "git commit");
        result.suggestion = "resolve conflicts, then commit the merge";
        return;
      }
      out.did("Merged " + remote_ref);
    }
    result.next = "git push " + remote + " " + current;
  });
}

} // namespace gitext
