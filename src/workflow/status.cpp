#include "operation.hpp"

namespace gitext {

using detail::Narrative;

namespace {

/// Remote branch existence, treating a failed lookup as absent.
bool published_on(RepositoryInspector &inspector, const std::string &remote,
                  const std::string &branch) {
  try {
    return inspector.remote_branch_exists(remote, branch);
  } catch (const CommandFailure &e) {
    detail::workflow_log()->debug("ls-remote for {} failed: {}", branch,
                                  e.what());
    return false;
  }
}

} // namespace

/// Read-only report; the next command is chosen from tree state first.
OperationResult status(const Policy &policy, CommandExecutor &executor) {
  return detail::run_guarded("status", [&](OperationResult &result,
                                           Narrative &out) {
    RepositoryInspector inspector(executor);
    const auto &remote = policy.remote_name;

    RepositoryState state;
    state.is_detached_head = inspector.is_detached_head();
    if (state.is_detached_head) {
      result.state = state;
      out.warning("HEAD is detached");
      result.next = "git checkout -b <branch-name>";
      return;
    }
    state.current_branch = inspector.current_branch();
    state.is_clean = inspector.is_clean();
    const auto &current = state.current_branch;
    const bool protected_branch = is_protected(current, policy);

    out.info("Current branch: " + current);
    if (state.is_clean) {
      out.success("Working tree is clean");
    } else {
      out.warning("Working tree has uncommitted changes");
    }
    result.state = state;

    if (!inspector.remote_url(remote)) {
      out.warning("Remote '" + remote + "' not configured");
      result.next = "git remote add " + remote + " <url>";
      return;
    }

    auto fetched = executor.execute({"fetch", remote});
    if (!fetched.ok()) {
      out.warning("Failed to fetch from remote: " + fetched.error->output);
    }

    std::string next;
    if (published_on(inspector, remote, current)) {
      auto own = inspector.ahead_behind(remote, current, current);
      state.ahead = own.ahead;
      state.behind = own.behind;
      if (own.ahead > 0) {
        out.info("Ahead of " + remote + "/" + current + " by " +
                 std::to_string(own.ahead) + " commit(s)");
      }
      if (own.behind > 0) {
        out.warning("Behind " + remote + "/" + current + " by " +
                    std::to_string(own.behind) + " commit(s)");
        if (current == policy.stage_branch) {
          next = "gitext sync stage";
        } else if (current == policy.production_branch) {
          next = "gitext sync production";
        } else {
          next = "git pull --rebase " + remote + " " + current;
        }
      } else if (own.ahead > 0) {
        next = "git push " + remote + " " + current;
      }
    }

    bool behind_stage = false;
    for (auto target : {Target::Stage, Target::Production}) {
      const auto &branch = policy.branch_for(target);
      if (branch == current || !published_on(inspector, remote, branch)) {
        continue;
      }
      auto counts = inspector.ahead_behind(remote, branch, current);
      if (counts.behind > 0) {
        out.info("Behind " + branch + " by " + std::to_string(counts.behind) +
                 " commit(s)");
        if (target == Target::Stage) {
          behind_stage = true;
        }
      }
    }
    result.state = state;

    if (!state.is_clean) {
      result.next = "git commit -am 'message' or git stash";
    } else if (!next.empty()) {
      result.next = next;
    } else if (protected_branch) {
      result.next = std::string("gitext sync ") +
                    (current == policy.stage_branch ? "stage" : "production");
    } else if (behind_stage) {
      result.next = "gitext update feature --with stage";
    } else {
      result.next = "gitext prepare pr --to stage";
    }
  });
}

} // namespace gitext
