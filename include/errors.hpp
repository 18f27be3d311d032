/**
 * @file errors.hpp
 * @brief Error taxonomy shared by the executor, inspector, and workflows.
 *
 * Execution failures describe what happened to a git invocation. Precondition
 * failures describe why an operation refused to start. Both carry enough
 * context for the report to tell the operator what to do next.
 */

#ifndef GITEXT_ERRORS_HPP
#define GITEXT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace gitext {

/** Classification of a failed git invocation. */
enum class ExecutionErrorKind {
  NonZeroExit,      ///< The command ran and exited with a non-zero status
  Timeout,          ///< The command exceeded its per-invocation timeout
  UnexpectedOutput, ///< The command succeeded but its output did not parse
  SpawnFailure      ///< The command could not be started at all
};

/** Return a stable lowercase name for @p kind. */
std::string_view to_string(ExecutionErrorKind kind);

/** Structured description of a failed git invocation. */
struct ExecutionError {
  ExecutionErrorKind kind{ExecutionErrorKind::NonZeroExit};
  std::string command; ///< Rendered command line, e.g. `git pull --ff-only`
  std::string output;  ///< Combined stdout/stderr captured from the command
  int exit_code{0};    ///< Exit status, or -1 when not applicable

  /** Human-readable one-line summary followed by captured output. */
  std::string describe() const;
};

/**
 * Thrown by read-only repository queries when git fails or prints something
 * the parser does not understand.
 */
class CommandFailure : public std::runtime_error {
public:
  explicit CommandFailure(ExecutionError error);

  /** Access the structured failure. */
  const ExecutionError &error() const noexcept { return error_; }

private:
  ExecutionError error_;
};

/** Reasons an operation refuses to run before touching the repository. */
enum class PreconditionKind {
  NotARepository,
  InvalidArgument,
  DirtyWorkingTree,
  RemoteNotFound,
  BranchNotFound,
  BranchExists,
  PatternMismatch,
  SharedBranch,
  DetachedHead,
  NothingStaged
};

/** Return a stable lowercase name for @p kind. */
std::string_view to_string(PreconditionKind kind);

/**
 * Raised by safety checks. Always carries a corrective suggestion that is
 * shown to the operator next to the message.
 */
class PreconditionError : public std::runtime_error {
public:
  PreconditionError(PreconditionKind kind, std::string message,
                    std::string suggestion);

  PreconditionKind kind() const noexcept { return kind_; }
  const std::string &message() const noexcept { return message_; }
  const std::string &suggestion() const noexcept { return suggestion_; }

private:
  PreconditionKind kind_;
  std::string message_;
  std::string suggestion_;
};

/** Raised when a configuration file cannot be read or fails validation. */
class ConfigError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

} // namespace gitext

#endif // GITEXT_ERRORS_HPP
