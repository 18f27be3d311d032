/**
 * @file app.hpp
 * @brief Command line front end for gitext.
 *
 * Declares the App class, which parses the command line, resolves the
 * repository configuration, initialises logging and dispatches to the
 * workflow engine.
 */

#ifndef GITEXT_APP_HPP
#define GITEXT_APP_HPP

#include "cli.hpp"
#include "command_executor.hpp"
#include "config.hpp"
#include "workflow.hpp"
#include <iostream>
#include <memory>
#include <string>

namespace gitext {

/// Process exit status when the run could not start at all.
constexpr int kExitFatal = 2;

/// Map an operation outcome to a process exit status.
int exit_code_for(const OperationResult &result);

/**
 * Main application entry point responsible for orchestrating CLI parsing,
 * configuration loading and workflow dispatch.
 */
class App {
public:
  /**
   * @param runner Process launcher handed to the executor; the POSIX runner
   *        is used when null.
   * @param out Stream for reports and command echoes.
   * @param err Stream for error lines.
   * @param working_directory Directory git is asked about; empty uses the
   *        process working directory.
   */
  explicit App(std::shared_ptr<CommandRunner> runner = nullptr,
               std::ostream &out = std::cout, std::ostream &err = std::cerr,
               std::string working_directory = "");

  /**
   * Run the application with the given command line arguments.
   *
   * @return 0 on success, 1 when the operation failed, 2 when it could not
   *         start (not in a repository, invalid configuration), or CLI11's
   *         code for parse errors.
   */
  int run(int argc, char **argv);

  /// Parsed command line options.
  const CliOptions &options() const { return options_; }

  /// Resolved configuration.
  const Config &config() const { return config_; }

  /**
   * Optional commit message generator used when `commit` runs without
   * `-m`. Not owned.
   */
  void set_commit_message_provider(CommitMessageProvider *provider) {
    provider_ = provider;
  }

private:
  std::string locate_repository();
  void apply_logging();
  OperationResult dispatch(CommandExecutor &executor);
  OperationResult run_init();

  std::shared_ptr<CommandRunner> runner_;
  std::ostream &out_;
  std::ostream &err_;
  std::string working_directory_;
  CommitMessageProvider *provider_{nullptr};
  CliOptions options_;
  Config config_;
  std::string repository_root_;
  bool config_file_found_{false};
  std::string config_path_;
};

} // namespace gitext

#endif // GITEXT_APP_HPP
