#include "operation.hpp"

namespace gitext {

using detail::Narrative;

/**
 * Move the current branch from stage onto production.
 *
 * Runs `rebase --onto <remote>/production <remote>/stage`, which keeps only
 * the commits made on top of stage. A published branch with more than one
 * recent author counts as shared and is refused unless acknowledged, since
 * the rebase rewrites history others have pulled.
 */
OperationResult retarget(const Policy &policy, const RetargetRequest &request,
                         CommandExecutor &executor) {
  return detail::run_guarded("retarget", [&](OperationResult &result,
                                             Narrative &out) {
    if (request.onto != Target::Production || request.from != Target::Stage) {
      throw PreconditionError(PreconditionKind::InvalidArgument,
                              "retarget only moves branches from stage onto "
                              "production",
                              "use --onto production --from stage");
    }
    RepositoryInspector inspector(executor);
    const auto &remote = policy.remote_name;
    const auto &onto = policy.branch_for(request.onto);
    const auto &from = policy.branch_for(request.from);

    detail::validate_remote(inspector, remote);
    result.state = inspector.snapshot(remote, policy.shared_author_window);
    const auto &state = *result.state;
    require_attached(state.is_detached_head);
    const auto current = state.current_branch;
    if (!request.override_pattern) {
      require_pattern(current, policy.feature_pattern, "--override");
    }
    require_clean(state.is_clean);

    const bool on_remote = state.on_remote;
    const bool shared = is_shared_branch(on_remote, state.recent_authors);
    require_not_shared(current, shared, request.acknowledge_shared);
    if (shared) {
      out.warning("Branch appears shared, proceeding with "
                  "--i-know-what-im-doing flag");
    }

    out.doing("Fetching latest from " + remote);
    if (!detail::run_step(result, executor, {"fetch", remote},
                          "failed to fetch from " + remote)) {
      return;
    }
    detail::validate_branch(inspector, onto, remote);
    detail::validate_branch(inspector, from, remote);

    const auto onto_ref = remote + "/" + onto;
    const auto from_ref = remote + "/" + from;
    out.doing("Retargeting " + current + " onto " + onto_ref + " (from " +
              from_ref + ")");
    out.warning("This will rewrite history. If the branch is pushed, you'll "
                "need to force push.");
    auto rebased = executor.execute({"rebase", "--onto", onto_ref, from_ref});
    if (!rebased.ok()) {
      out.error("Rebase encountered conflicts");
      out.fail(OperationStatus::RecoverableFailure,
               "retarget of " + current + " stopped", *rebased.error,
               "git rebase --continue");
      result.suggestion = "resolve conflicts, then continue the rebase";
      return;
    }
    out.did("Retargeted " + current + " onto " + onto_ref);

    if (on_remote) {
      out.warning("Remote branch exists. You'll need to force push with "
                  "--force-with-lease");
      result.next = "git push --force-with-lease " + remote + " " + current;
    } else {
      result.next = "git push " + remote + " " + current;
    }
  });
}

} // namespace gitext
