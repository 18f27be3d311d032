#include "operation.hpp"

namespace gitext {

std::string_view to_string(OperationStatus status) {
  switch (status) {
  case OperationStatus::Success:
    return "success";
  case OperationStatus::PreconditionFailed:
    return "precondition-failed";
  case OperationStatus::ExecutionFailed:
    return "execution-failed";
  case OperationStatus::RecoverableFailure:
    return "recoverable-failure";
  }
  return "unknown";
}

std::string_view to_string(UpdateMode mode) {
  return mode == UpdateMode::Merge ? "merge" : "rebase";
}

std::optional<UpdateMode> parse_update_mode(std::string_view name) {
  if (name == "rebase")
    return UpdateMode::Rebase;
  if (name == "merge")
    return UpdateMode::Merge;
  return std::nullopt;
}

namespace detail {

std::shared_ptr<spdlog::logger> workflow_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("workflow");
  }();
  return logger;
}

void Narrative::fail(OperationStatus status, std::string message,
                     const ExecutionError &error, std::string next) {
  if (status == OperationStatus::RecoverableFailure &&
      error.kind != ExecutionErrorKind::NonZeroExit) {
    status = OperationStatus::ExecutionFailed;
  }
  result_.status = status;
  result_.message = std::move(message);
  result_.error = error;
  result_.next = std::move(next);
  workflow_log()->warn("{}: {}", result_.message, error.describe());
}

bool run_step(OperationResult &result, CommandExecutor &executor,
              const std::vector<std::string> &args,
              const std::string &failure_message, const std::string &next) {
  auto outcome = executor.execute(args);
  if (outcome.ok()) {
    return true;
  }
  Narrative(result).fail(OperationStatus::ExecutionFailed, failure_message,
                         *outcome.error, next);
  return false;
}

void validate_remote(RepositoryInspector &inspector,
                     const std::string &remote) {
  require_remote(remote, inspector.remote_url(remote).has_value());
}

void validate_branch(RepositoryInspector &inspector, const std::string &branch,
                     const std::string &remote) {
  bool exists = inspector.branch_exists(branch) ||
                inspector.remote_branch_exists(remote, branch);
  require_branch(branch, remote, exists);
}

} // namespace detail
} // namespace gitext
