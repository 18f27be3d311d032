#include "cli.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include "version.hpp"
#include <CLI/CLI.hpp>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

namespace gitext {

namespace {
std::shared_ptr<spdlog::logger> cli_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("cli");
  }();
  return logger;
}

std::string log_category_help_text() {
  const auto &categories = known_log_categories();
  std::ostringstream oss;
  oss << "Logging categories: ";
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (i != 0) {
      oss << ", ";
    }
    oss << categories[i];
  }
  oss << "\nUse --log-category NAME=LEVEL to override (e.g., "
         "executor=debug).";
  oss << " Configuration files accept the same mapping under "
         "'logging.categories'.";
  return oss.str();
}

const std::vector<std::string> kTargets{"stage", "production"};
} // namespace

/**
 * Parse command line arguments using CLI11.
 *
 * Global options may appear before or after the subcommand.
 */
CliOptions parse_cli(int argc, char **argv) {
  CLI::App app{"gitext: guarded git branch workflows"};
  app.footer(log_category_help_text());
  app.require_subcommand(1);
  app.fallthrough();
  CliOptions options;

  app.add_flag("-n,--dry-run", options.dry_run,
               "Print mutating git commands instead of running them")
      ->group("General");
  app.add_flag("-v,--verbose", options.verbose,
               "Echo every git command and its output")
      ->group("General");
  app.add_option("-C,--config", options.config_file,
                 "Path to configuration file (default: <repo>/.gitext)")
      ->type_name("FILE")
      ->group("General");
  app.add_option_function<std::string>(
         "-t,--timeout",
         [&options](const std::string &value) {
           try {
             auto parsed = parse_duration(value);
             if (parsed.count() <= 0) {
               throw std::invalid_argument("timeout must be positive");
             }
             options.timeout = parsed;
           } catch (const std::invalid_argument &e) {
             throw CLI::ValidationError("--timeout", e.what());
           }
         },
         "Per-command git timeout, e.g. 30s, 2m, 1500ms")
      ->type_name("DURATION")
      ->group("General");
  app.add_flag_function(
         "--version",
         [](std::int64_t) {
           std::cout << "gitext " << kVersionString << std::endl;
           throw CliParseExit(0);
         },
         "Show version information and exit")
      ->group("General");
  app.add_option(
         "-G,--log-level", options.log_level,
         "Set logging level (trace, debug, info, warn, error, critical, off)")
      ->type_name("LEVEL")
      ->group("Logging");
  app.add_option("-F,--log-file", options.log_file, "Path to rotating log file")
      ->type_name("FILE")
      ->group("Logging");
  app.add_option_function<std::string>(
         "--log-category",
         [&options](const std::string &value) {
           auto pos = value.find('=');
           std::string name =
               pos == std::string::npos ? value : value.substr(0, pos);
           std::string level = pos == std::string::npos ? std::string{"debug"}
                                                        : value.substr(pos + 1);
           if (name.empty()) {
             throw CLI::ValidationError("--log-category",
                                        "category name must not be empty");
           }
           if (level.empty()) {
             level = "debug";
           }
           options.log_categories[name] = level;
           options.log_categories_explicit = true;
         },
         "Set a logging category level (NAME or NAME=LEVEL)")
      ->type_name("NAME[=LEVEL]")
      ->group("Logging");
  app.add_option_function<int>(
         "--log-rotate",
         [&options](int value) {
           if (value < 0) {
             throw CLI::ValidationError("--log-rotate",
                                        "rotation count must be non-negative");
           }
           options.log_rotate = value;
           options.log_rotate_explicit = true;
         },
         "Number of rotated log files to retain (0 disables rotation)")
      ->type_name("N")
      ->group("Logging");

  auto *sync = app.add_subcommand(
      "sync", "Fast-forward a protected branch from the remote");
  sync->add_option("target", options.target, "stage or production")
      ->required()
      ->check(CLI::IsMember(kTargets));

  std::string start_kind;
  auto *start = app.add_subcommand("start", "Start a new feature branch");
  start->add_option("kind", start_kind, "Branch kind (feature)")
      ->required()
      ->check(CLI::IsMember({"feature"}));
  start->add_option("--ticket", options.ticket, "Ticket ID (e.g., KWS-123)")
      ->required();
  start->add_option("--slug", options.slug, "Feature slug (e.g., retry-policy)")
      ->required();
  start->add_option("--from", options.from, "Source branch (stage or production)")
      ->required()
      ->check(CLI::IsMember(kTargets));

  std::string update_kind;
  auto *update = app.add_subcommand(
      "update", "Update the current feature branch from stage or production");
  update->add_option("kind", update_kind, "Branch kind (feature)")
      ->required()
      ->check(CLI::IsMember({"feature"}));
  update->add_option("--with", options.with,
                     "Source branch to update from (stage or production)")
      ->required()
      ->check(CLI::IsMember(kTargets));
  update->add_option("--mode", options.mode, "Update mode: rebase or merge")
      ->capture_default_str()
      ->check(CLI::IsMember({"rebase", "merge"}));

  std::string retarget_kind;
  auto *retarget = app.add_subcommand(
      "retarget", "Move a feature branch from stage onto production");
  retarget->add_option("kind", retarget_kind, "Branch kind (feature)")
      ->required()
      ->check(CLI::IsMember({"feature"}));
  retarget->add_option("--onto", options.onto, "Target branch (production)")
      ->capture_default_str()
      ->check(CLI::IsMember({"production"}));
  retarget->add_option("--from", options.from, "Source branch (stage)")
      ->capture_default_str()
      ->check(CLI::IsMember({"stage"}));
  retarget->add_flag("--override", options.override_pattern,
                     "Allow retargeting branches outside the feature pattern");
  retarget->add_flag("--i-know-what-im-doing", options.acknowledge_shared,
                     "Bypass the shared branch safety check");

  auto *cleanup = app.add_subcommand(
      "cleanup", "List branches merged into stage or production");
  cleanup->add_flag("--hard", options.hard, "Actually delete the branches");

  auto *status = app.add_subcommand(
      "status", "Show branch state and suggest the next command");

  std::string prepare_kind;
  auto *prepare = app.add_subcommand(
      "prepare", "Run CI checks and generate pull request text");
  prepare->add_option("kind", prepare_kind, "What to prepare (pr)")
      ->required()
      ->check(CLI::IsMember({"pr"}));
  prepare->add_option("--to", options.to, "PR target (stage or production)")
      ->required()
      ->check(CLI::IsMember(kTargets));

  std::string message;
  auto *commit = app.add_subcommand("commit", "Commit staged changes");
  auto *message_opt =
      commit->add_option("-m,--message", message, "Commit message");

  auto *init = app.add_subcommand(
      "init", "Create .gitext and optionally install the pre-push hook");
  init->add_flag("--install-hooks", options.install_hooks,
                 "Install a hook rejecting direct pushes to protected "
                 "branches");

  try {
    app.parse(argc, argv);
  } catch (const CLI::ParseError &e) {
    int exit_code = app.exit(e);
    throw CliParseExit(exit_code);
  }

  if (sync->parsed()) {
    options.command = Command::Sync;
  } else if (start->parsed()) {
    options.command = Command::Start;
  } else if (update->parsed()) {
    options.command = Command::Update;
  } else if (retarget->parsed()) {
    options.command = Command::Retarget;
  } else if (cleanup->parsed()) {
    options.command = Command::Cleanup;
  } else if (status->parsed()) {
    options.command = Command::Status;
  } else if (prepare->parsed()) {
    options.command = Command::PreparePr;
  } else if (commit->parsed()) {
    options.command = Command::Commit;
    if (message_opt->count() > 0U) {
      options.message = message;
    }
  } else if (init->parsed()) {
    options.command = Command::Init;
  }
  cli_log()->debug("Parsed command line ({} args)", argc);
  return options;
}

} // namespace gitext
