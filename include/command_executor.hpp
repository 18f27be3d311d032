/**
 * @file command_executor.hpp
 * @brief Runs git subcommands with timeout, dry-run and verbose echo.
 *
 * Process creation is isolated behind the CommandRunner interface so the
 * engine can be exercised against scripted runners in tests.
 */

#ifndef GITEXT_COMMAND_EXECUTOR_HPP
#define GITEXT_COMMAND_EXECUTOR_HPP

#include "errors.hpp"

#include <chrono>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gitext {

/** Raw outcome of one child process. */
struct ProcessOutput {
  int exit_code{0};          ///< Exit status, 128+N when killed by signal N
  std::string output;        ///< Interleaved stdout and stderr
  bool timed_out{false};     ///< Child was killed after the deadline
  bool spawn_failed{false};  ///< Child never reached exec
};

/**
 * Abstract process launcher.
 *
 * Implementations run @p argv (argv[0] resolved through PATH) inside
 * @p cwd and capture its combined output.
 */
class CommandRunner {
public:
  virtual ~CommandRunner() = default;

  /**
   * Run a program to completion or until the timeout expires.
   *
   * @param argv Program name followed by its arguments.
   * @param timeout Maximum wall time; zero or negative disables the limit.
   * @param cwd Working directory; empty keeps the current one.
   */
  virtual ProcessOutput run(const std::vector<std::string> &argv,
                            std::chrono::milliseconds timeout,
                            const std::string &cwd) = 0;
};

/** fork/exec based runner for POSIX systems. */
class PosixCommandRunner : public CommandRunner {
public:
  ProcessOutput run(const std::vector<std::string> &argv,
                    std::chrono::milliseconds timeout,
                    const std::string &cwd) override;
};

/** Global execution switches shared by every invocation of a run. */
struct ExecutorOptions {
  bool dry_run{false};
  bool verbose{false};
  std::chrono::milliseconds timeout{std::chrono::seconds(30)};
  std::string git_binary{"git"};
  std::string working_directory; ///< Empty runs in the process cwd
};

/** Outcome of a single git invocation. */
struct CommandResult {
  std::string output; ///< Trimmed combined output
  std::optional<ExecutionError> error;

  bool ok() const { return !error.has_value(); }
};

/**
 * Front door for every git invocation issued by the engine.
 *
 * Mutating commands go through execute(), which honours dry-run by echoing
 * `[DRY RUN] git <args>` and returning an empty success. Read-only commands
 * go through query(), which always runs so that inspections stay accurate
 * under dry-run.
 */
class CommandExecutor {
public:
  /**
   * @param options Dry-run, verbose and timeout settings.
   * @param runner Process launcher; defaults to PosixCommandRunner.
   * @param echo Stream receiving dry-run and verbose echoes; defaults to
   *        std::cout.
   */
  explicit CommandExecutor(ExecutorOptions options,
                           std::shared_ptr<CommandRunner> runner = nullptr,
                           std::ostream *echo = nullptr);

  /** Run a mutating git subcommand. */
  CommandResult execute(const std::vector<std::string> &args);

  /** Run a read-only git subcommand, even under dry-run. */
  CommandResult query(const std::vector<std::string> &args);

  /**
   * Run an arbitrary program (CI hooks). Dry-run is not applied here; the
   * caller decides whether external programs may run.
   */
  CommandResult run_program(const std::vector<std::string> &argv);

  const ExecutorOptions &options() const { return options_; }

  /** Render a git command line for messages, e.g. `git push origin x`. */
  std::string render(const std::vector<std::string> &args) const;

private:
  CommandResult invoke(const std::vector<std::string> &argv);

  ExecutorOptions options_;
  std::shared_ptr<CommandRunner> runner_;
  std::ostream *echo_;
};

/** Join @p argv with spaces, quoting arguments that contain whitespace. */
std::string render_command(const std::vector<std::string> &argv);

/** Strip leading and trailing whitespace. */
std::string trim(const std::string &text);

} // namespace gitext

#endif // GITEXT_COMMAND_EXECUTOR_HPP
