#include "operation.hpp"

namespace gitext {

using detail::Narrative;

std::string feature_branch_name(const std::string &ticket,
                                const std::string &slug) {
  return "feature/" + ticket + "-" + slug;
}

/**
 * Create a feature branch from a freshly pulled source.
 *
 * The derived name must match the feature pattern and must not exist yet.
 * A failed fast-forward of the source is reported as a warning and the
 * branch is still created from what was fetched.
 */
OperationResult start(const Policy &policy, const StartRequest &request,
                      CommandExecutor &executor) {
  return detail::run_guarded("start", [&](OperationResult &result,
                                          Narrative &out) {
    if (request.ticket.empty() || request.slug.empty()) {
      throw PreconditionError(PreconditionKind::InvalidArgument,
                              "ticket and slug are required",
                              "pass --ticket <id> --slug <name>");
    }
    RepositoryInspector inspector(executor);
    const auto &remote = policy.remote_name;
    const auto &source = policy.branch_for(request.from);
    const auto branch = feature_branch_name(request.ticket, request.slug);

    detail::validate_remote(inspector, remote);
    detail::validate_branch(inspector, source, remote);
    result.state = inspector.snapshot(remote, policy.shared_author_window);
    require_clean(result.state->is_clean);
    require_pattern(branch, policy.feature_pattern);
    require_absent(branch, inspector.branch_exists(branch));

    out.doing("Fetching latest from " + remote);
    if (!detail::run_step(result, executor, {"fetch", remote},
                          "failed to fetch from " + remote)) {
      return;
    }

    out.doing("Checking out " + source);
    if (!detail::run_step(result, executor, {"checkout", source},
                          "failed to checkout " + source)) {
      return;
    }

    out.doing("Pulling latest changes");
    if (!executor.execute({"pull", "--ff-only", remote, source}).ok()) {
      out.warning("Fast-forward pull failed, continuing anyway");
    }

    out.doing("Creating branch " + branch);
    if (!detail::run_step(result, executor, {"checkout", "-b", branch},
                          "failed to create " + branch)) {
      return;
    }
    out.did("Created and checked out " + branch);
    result.next = "gitext prepare pr --to stage";
  });
}

} // namespace gitext
