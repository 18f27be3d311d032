// Shared plumbing for the workflow operations. Not installed.

#ifndef GITEXT_WORKFLOW_OPERATION_HPP
#define GITEXT_WORKFLOW_OPERATION_HPP

#include "log.hpp"
#include "safety_validator.hpp"
#include "workflow.hpp"

#include <string>
#include <utility>
#include <vector>

namespace gitext {
namespace detail {

std::shared_ptr<spdlog::logger> workflow_log();

/** Appends report lines to an OperationResult. */
class Narrative {
public:
  explicit Narrative(OperationResult &result) : result_(result) {}

  void info(std::string text) { add(StepKind::Info, std::move(text)); }
  void success(std::string text) { add(StepKind::Success, std::move(text)); }
  void warning(std::string text) { add(StepKind::Warning, std::move(text)); }
  void error(std::string text) { add(StepKind::Error, std::move(text)); }
  void doing(std::string text) { add(StepKind::Doing, std::move(text)); }
  void did(std::string text) { add(StepKind::Did, std::move(text)); }
  void detail(std::string text) { add(StepKind::Detail, std::move(text)); }
  void plain(std::string text) { add(StepKind::Plain, std::move(text)); }

  /**
   * Mark the operation failed at a git step. Timeouts and spawn failures are
   * never recoverable regardless of @p status.
   */
  void fail(OperationStatus status, std::string message,
            const ExecutionError &error, std::string next = "");

private:
  void add(StepKind kind, std::string text) {
    result_.steps.push_back({kind, std::move(text)});
  }

  OperationResult &result_;
};

/**
 * Run a mutating git step. On failure the result is marked ExecutionFailed
 * with @p failure_message and @p next, and false is returned.
 */
bool run_step(OperationResult &result, CommandExecutor &executor,
              const std::vector<std::string> &args,
              const std::string &failure_message,
              const std::string &next = "");

/** Throw RemoteNotFound unless @p remote has a URL. */
void validate_remote(RepositoryInspector &inspector, const std::string &remote);

/** Throw BranchNotFound unless @p branch exists locally or on @p remote. */
void validate_branch(RepositoryInspector &inspector, const std::string &branch,
                     const std::string &remote);

/**
 * Invoke @p body with a fresh result, converting precondition and
 * inspection exceptions into the matching status.
 */
template <typename Body>
OperationResult run_guarded(const char *operation, Body &&body) {
  OperationResult result;
  Narrative out(result);
  try {
    body(result, out);
  } catch (const PreconditionError &e) {
    result.status = OperationStatus::PreconditionFailed;
    result.message = e.message();
    result.suggestion = e.suggestion();
    result.precondition = e.kind();
  } catch (const CommandFailure &e) {
    result.status = OperationStatus::ExecutionFailed;
    result.message = "could not inspect the repository";
    result.error = e.error();
  }
  workflow_log()->debug("{} finished: {}", operation, to_string(result.status));
  return result;
}

} // namespace detail
} // namespace gitext

#endif // GITEXT_WORKFLOW_OPERATION_HPP
