#ifndef GITEXT_CLI_HPP
#define GITEXT_CLI_HPP

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include <unordered_map>

namespace gitext {

/**
 * Exception signalling that CLI parsing requested early termination.
 *
 * Thrown for `--help`, `--version` and parse errors once CLI11 has printed
 * its message. Carries the exit code the process should return.
 */
class CliParseExit : public std::exception {
public:
  explicit CliParseExit(int exit_code) noexcept : exit_code_(exit_code) {}

  int exit_code() const noexcept { return exit_code_; }

  const char *what() const noexcept override {
    return "CLI parsing requested exit";
  }

private:
  int exit_code_;
};

/// Subcommand selected on the command line.
enum class Command {
  Sync,
  Start,
  Update,
  Retarget,
  Cleanup,
  Status,
  PreparePr,
  Commit,
  Init
};

/// Options parsed from the command line.
struct CliOptions {
  Command command = Command::Status;

  bool dry_run = false;        ///< Echo mutating commands instead of running
  bool verbose = false;        ///< Echo every git command and its output
  std::string config_file;     ///< Explicit configuration file
  std::string log_level;       ///< Empty defers to config or verbosity
  std::string log_file;        ///< Optional path to rotating log file
  int log_rotate = 3;          ///< Rotated log files to keep
  bool log_rotate_explicit = false;
  std::unordered_map<std::string, std::string> log_categories;
  bool log_categories_explicit = false;
  std::optional<std::chrono::milliseconds> timeout; ///< Per-command timeout

  std::string target;          ///< sync: stage | production
  std::string ticket;          ///< start --ticket
  std::string slug;            ///< start --slug
  std::string from = "stage";  ///< start --from, retarget --from
  std::string with;            ///< update --with
  std::string mode = "rebase"; ///< update --mode
  std::string onto = "production"; ///< retarget --onto
  bool override_pattern = false;   ///< retarget --override
  bool acknowledge_shared = false; ///< retarget --i-know-what-im-doing
  bool hard = false;               ///< cleanup --hard
  std::string to;                  ///< prepare pr --to
  std::optional<std::string> message; ///< commit -m
  bool install_hooks = false;         ///< init --install-hooks
};

/**
 * Parse command line arguments into a CliOptions structure.
 *
 * @throws CliParseExit For help, version, and parse errors.
 */
CliOptions parse_cli(int argc, char **argv);

} // namespace gitext

#endif // GITEXT_CLI_HPP
