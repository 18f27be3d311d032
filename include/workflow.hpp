/**
 * @file workflow.hpp
 * @brief Guarded branch lifecycle operations.
 *
 * Every operation follows Validate, Fetch, Mutate, Report. A failing check
 * in Validate or Fetch stops the operation before anything is mutated. A
 * failure during Mutate leaves the repository as git left it and the result
 * names the exact command that continues or recovers.
 */

#ifndef GITEXT_WORKFLOW_HPP
#define GITEXT_WORKFLOW_HPP

#include "command_executor.hpp"
#include "errors.hpp"
#include "policy.hpp"
#include "repository_inspector.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitext {

/** Final classification of an operation. */
enum class OperationStatus {
  Success,
  PreconditionFailed, ///< Refused before any mutation
  ExecutionFailed,    ///< A git command failed; nothing to continue
  RecoverableFailure  ///< Stopped mid-mutation; `next` continues it
};

std::string_view to_string(OperationStatus status);

/** Presentation hint for a report line. */
enum class StepKind { Info, Success, Warning, Error, Doing, Did, Detail, Plain };

struct ReportLine {
  StepKind kind{StepKind::Info};
  std::string text;
};

/** Narrative and outcome of one operation. */
struct OperationResult {
  OperationStatus status{OperationStatus::Success};
  std::vector<ReportLine> steps;
  std::string message;    ///< Failure summary, empty on success
  std::string suggestion; ///< Corrective hint attached to a failure
  std::string next;       ///< Exact command the operator should run next
  std::string body;       ///< Free-form output such as generated PR text
  std::optional<RepositoryState> state;
  std::optional<ExecutionError> error;
  std::optional<PreconditionKind> precondition;

  bool ok() const { return status == OperationStatus::Success; }
};

enum class UpdateMode { Rebase, Merge };

std::string_view to_string(UpdateMode mode);
std::optional<UpdateMode> parse_update_mode(std::string_view name);

struct SyncRequest {
  Target target{Target::Stage};
};

struct StartRequest {
  std::string ticket;
  std::string slug;
  Target from{Target::Stage};
};

struct UpdateRequest {
  Target with{Target::Stage};
  UpdateMode mode{UpdateMode::Rebase};
};

struct RetargetRequest {
  Target onto{Target::Production};
  Target from{Target::Stage};
  bool override_pattern{false};   ///< Skip the feature naming check
  bool acknowledge_shared{false}; ///< Proceed on a branch that looks shared
};

struct CleanupRequest {
  bool hard{false};
};

struct PrepareRequest {
  Target to{Target::Stage};
  std::string repository_root; ///< Base for the PR template path
};

struct CommitRequest {
  std::optional<std::string> message;
};

/**
 * Source of generated commit messages. No implementation ships; callers that
 * have one pass it to commit().
 */
class CommitMessageProvider {
public:
  virtual ~CommitMessageProvider() = default;

  /** Produce a commit message for the staged @p diff. */
  virtual std::string generate(const std::string &diff) = 0;
};

/** Fast-forward a protected branch from its remote counterpart. */
OperationResult sync(const Policy &policy, const SyncRequest &request,
                     CommandExecutor &executor);

/** Create `feature/<ticket>-<slug>` from stage or production. */
OperationResult start(const Policy &policy, const StartRequest &request,
                      CommandExecutor &executor);

/** Bring the current feature branch up to date by rebase or merge. */
OperationResult update(const Policy &policy, const UpdateRequest &request,
                       CommandExecutor &executor);

/** Move the current branch from stage onto production with `rebase --onto`. */
OperationResult retarget(const Policy &policy, const RetargetRequest &request,
                         CommandExecutor &executor);

/** List, and with `hard` delete, branches merged into stage or production. */
OperationResult cleanup(const Policy &policy, const CleanupRequest &request,
                        CommandExecutor &executor);

/** Describe the current branch and suggest the next command. */
OperationResult status(const Policy &policy, CommandExecutor &executor);

/** Run CI commands for the target and generate pull request text. */
OperationResult prepare_pr(const Policy &policy, const PrepareRequest &request,
                           CommandExecutor &executor);

/** Commit staged changes with an explicit or generated message. */
OperationResult commit(const Policy &policy, const CommitRequest &request,
                       CommandExecutor &executor,
                       CommitMessageProvider *provider = nullptr);

/** Branch name Start derives from a ticket and slug. */
std::string feature_branch_name(const std::string &ticket,
                                const std::string &slug);

/**
 * Ticket id embedded in a branch name, e.g. "ABC-12" for
 * "feature/ABC-12-login". Empty when the name carries none.
 */
std::string extract_ticket(const std::string &branch);

/** Assemble pull request text from its parts. */
std::string render_pr_text(const std::string &template_text,
                           const std::string &branch,
                           const std::string &target_branch,
                           const std::optional<std::vector<std::string>>
                               &commits);

} // namespace gitext

#endif // GITEXT_WORKFLOW_HPP
