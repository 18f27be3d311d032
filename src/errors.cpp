#include "errors.hpp"

#include <utility>

namespace gitext {

std::string_view to_string(ExecutionErrorKind kind) {
  switch (kind) {
  case ExecutionErrorKind::NonZeroExit:
    return "non-zero-exit";
  case ExecutionErrorKind::Timeout:
    return "timeout";
  case ExecutionErrorKind::UnexpectedOutput:
    return "unexpected-output";
  case ExecutionErrorKind::SpawnFailure:
    return "spawn-failure";
  }
  return "unknown";
}

std::string ExecutionError::describe() const {
  std::string text = command;
  switch (kind) {
  case ExecutionErrorKind::NonZeroExit:
    text += ": exited with status " + std::to_string(exit_code);
    break;
  case ExecutionErrorKind::Timeout:
    text += ": timed out";
    break;
  case ExecutionErrorKind::UnexpectedOutput:
    text += ": unexpected output";
    break;
  case ExecutionErrorKind::SpawnFailure:
    text += ": could not be started";
    break;
  }
  if (!output.empty()) {
    text += "\n" + output;
  }
  return text;
}

CommandFailure::CommandFailure(ExecutionError error)
    : std::runtime_error(error.describe()), error_(std::move(error)) {}

std::string_view to_string(PreconditionKind kind) {
  switch (kind) {
  case PreconditionKind::NotARepository:
    return "not-a-repository";
  case PreconditionKind::InvalidArgument:
    return "invalid-argument";
  case PreconditionKind::DirtyWorkingTree:
    return "dirty-working-tree";
  case PreconditionKind::RemoteNotFound:
    return "remote-not-found";
  case PreconditionKind::BranchNotFound:
    return "branch-not-found";
  case PreconditionKind::BranchExists:
    return "branch-exists";
  case PreconditionKind::PatternMismatch:
    return "pattern-mismatch";
  case PreconditionKind::SharedBranch:
    return "shared-branch";
  case PreconditionKind::DetachedHead:
    return "detached-head";
  case PreconditionKind::NothingStaged:
    return "nothing-staged";
  }
  return "unknown";
}

PreconditionError::PreconditionError(PreconditionKind kind,
                                     std::string message,
                                     std::string suggestion)
    : std::runtime_error(suggestion.empty() ? message
                                            : message + " → " + suggestion),
      kind_(kind), message_(std::move(message)),
      suggestion_(std::move(suggestion)) {}

} // namespace gitext
