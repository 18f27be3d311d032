#include "operation.hpp"

namespace gitext {

using detail::Narrative;

/// Commit staged changes; the provider is asked only when `-m` is absent.
OperationResult commit(const Policy & /*policy*/, const CommitRequest &request,
                       CommandExecutor &executor,
                       CommitMessageProvider *provider) {
  return detail::run_guarded("commit", [&](OperationResult &result,
                                           Narrative &out) {
    RepositoryInspector inspector(executor);
    if (!inspector.has_staged_changes()) {
      throw PreconditionError(PreconditionKind::NothingStaged,
                              "no staged changes",
                              "stage your changes first with 'git add'");
    }

    std::string message;
    if (request.message && !request.message->empty()) {
      message = *request.message;
      out.info("Using provided commit message");
    } else if (provider) {
      out.doing("Getting staged changes");
      auto diff = inspector.staged_diff();
      if (diff.empty()) {
        throw PreconditionError(PreconditionKind::NothingStaged,
                                "no changes in diff",
                                "ensure you have staged changes");
      }
      message = provider->generate(diff);
      if (message.empty()) {
        throw PreconditionError(PreconditionKind::InvalidArgument,
                                "generated commit message is empty",
                                "pass -m <message>");
      }
    } else {
      throw PreconditionError(PreconditionKind::InvalidArgument,
                              "no commit message given",
                              "pass -m <message>");
    }
    out.detail("Commit message: " + message);

    out.doing("Creating commit");
    if (!detail::run_step(result, executor, {"commit", "-m", message},
                          "failed to create commit")) {
      return;
    }
    out.success("Commit created successfully");
    result.next = "gitext status";
  });
}

} // namespace gitext
