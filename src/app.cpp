#include "app.hpp"
#include "config_manager.hpp"
#include "errors.hpp"
#include "hook_installer.hpp"
#include "log.hpp"
#include "reporter.hpp"
#include "util/duration.hpp"
#include <filesystem>
#include <spdlog/spdlog.h>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace gitext {

namespace {
std::shared_ptr<spdlog::logger> app_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("app");
  }();
  return logger;
}

/// Parse a level name, keeping @p fallback for unknown names.
spdlog::level::level_enum level_or(const std::string &name,
                                   spdlog::level::level_enum fallback) {
  auto level = spdlog::level::from_str(name);
  if (level == spdlog::level::off && name != "off") {
    app_log()->warn("Ignoring invalid log level '{}'", name);
    return fallback;
  }
  return level;
}

Target target_or_stage(const std::string &name) {
  return parse_target(name).value_or(Target::Stage);
}
} // namespace

int exit_code_for(const OperationResult &result) {
  if (result.ok()) {
    return 0;
  }
  if (result.precondition == PreconditionKind::NotARepository) {
    return kExitFatal;
  }
  return 1;
}

App::App(std::shared_ptr<CommandRunner> runner, std::ostream &out,
         std::ostream &err, std::string working_directory)
    : runner_(std::move(runner)), out_(out), err_(err),
      working_directory_(std::move(working_directory)) {}

/**
 * Execute the main application flow.
 *
 * CLI flags take precedence over the configuration file, which takes
 * precedence over built-in defaults.
 */
int App::run(int argc, char **argv) {
  try {
    options_ = parse_cli(argc, argv);
  } catch (const CliParseExit &exit) {
    return exit.exit_code();
  }

  Reporter reporter(out_, err_, options_.verbose);
  ConfigManager manager;
  try {
    auto resolved =
        manager.load_repository(locate_repository(), options_.config_file);
    config_ = std::move(resolved.config);
    repository_root_ = resolved.root;
    config_path_ = resolved.path;
    config_file_found_ = resolved.file_found;
  } catch (const PreconditionError &e) {
    reporter.line(StepKind::Error, e.what());
    return kExitFatal;
  } catch (const CommandFailure &e) {
    reporter.line(StepKind::Error,
                  std::string("could not inspect the repository: ") +
                      e.what());
    return kExitFatal;
  } catch (const ConfigError &e) {
    std::string text = e.what();
    if (text.rfind("invalid configuration", 0) != 0) {
      text = "invalid configuration: " + text;
    }
    reporter.line(StepKind::Error, text);
    return kExitFatal;
  }

  options_.dry_run = options_.dry_run || config_.dry_run();
  options_.verbose = options_.verbose || config_.verbose();
  if (!options_.log_rotate_explicit) {
    options_.log_rotate = config_.log_rotate();
  }
  if (!options_.log_categories_explicit) {
    options_.log_categories = config_.log_categories();
  } else {
    config_.set_log_categories(options_.log_categories);
  }
  if (options_.timeout) {
    config_.set_command_timeout(*options_.timeout);
  }
  apply_logging();
  app_log()->debug("Repository root {}, configuration {} ({})",
                   repository_root_, config_path_,
                   config_file_found_ ? "loaded" : "defaults");
  app_log()->debug("Git command timeout {}",
                   format_duration(config_.command_timeout()));
  if (options_.dry_run) {
    app_log()->info("Dry run mode enabled");
  }

  OperationResult result;
  if (options_.command == Command::Init) {
    result = run_init();
  } else {
    ExecutorOptions exec_options;
    exec_options.dry_run = options_.dry_run;
    exec_options.verbose = options_.verbose;
    exec_options.timeout = config_.command_timeout();
    exec_options.working_directory = repository_root_;
    CommandExecutor executor(exec_options, runner_, &out_);
    result = dispatch(executor);
  }
  Reporter(out_, err_, options_.verbose).render(result);
  app_log()->debug("Finished with status {}", to_string(result.status));
  return exit_code_for(result);
}

/// Ask git for the working tree root containing the working directory.
std::string App::locate_repository() {
  ExecutorOptions lookup;
  lookup.verbose = options_.verbose;
  lookup.working_directory = working_directory_;
  CommandExecutor executor(lookup, runner_, &out_);
  RepositoryInspector inspector(executor);
  if (!inspector.is_repository()) {
    throw PreconditionError(PreconditionKind::NotARepository,
                            "not in a git repository",
                            "run this command from within a git repository");
  }
  return inspector.repository_root();
}

void App::apply_logging() {
  auto fallback = level_or(config_.log_level(), spdlog::level::warn);
  spdlog::level::level_enum level = fallback;
  if (!options_.log_level.empty()) {
    level = level_or(options_.log_level, fallback);
  } else if (options_.verbose) {
    level = spdlog::level::debug;
  }
  std::string log_file = config_.log_file();
  if (!options_.log_file.empty()) {
    log_file = options_.log_file;
  }
  init_logger(level, config_.log_pattern(), log_file,
              static_cast<std::size_t>(options_.log_rotate));
  std::unordered_map<std::string, spdlog::level::level_enum> category_levels;
  for (const auto &[category, name] : options_.log_categories) {
    auto parsed = spdlog::level::from_str(name);
    if (parsed == spdlog::level::off && name != "off") {
      app_log()->warn("Ignoring invalid log level '{}' for category '{}'",
                      name, category);
      continue;
    }
    category_levels[category] = parsed;
  }
  configure_log_categories(category_levels);
}

OperationResult App::dispatch(CommandExecutor &executor) {
  const auto &policy = config_.policy();
  switch (options_.command) {
  case Command::Sync:
    return sync(policy, SyncRequest{target_or_stage(options_.target)},
                executor);
  case Command::Start: {
    StartRequest request;
    request.ticket = options_.ticket;
    request.slug = options_.slug;
    request.from = target_or_stage(options_.from);
    return start(policy, request, executor);
  }
  case Command::Update: {
    UpdateRequest request;
    request.with = target_or_stage(options_.with);
    request.mode = parse_update_mode(options_.mode).value_or(UpdateMode::Rebase);
    return update(policy, request, executor);
  }
  case Command::Retarget: {
    RetargetRequest request;
    request.onto = parse_target(options_.onto).value_or(Target::Production);
    request.from = target_or_stage(options_.from);
    request.override_pattern = options_.override_pattern;
    request.acknowledge_shared = options_.acknowledge_shared;
    return retarget(policy, request, executor);
  }
  case Command::Cleanup:
    return cleanup(policy, CleanupRequest{options_.hard}, executor);
  case Command::Status:
    return status(policy, executor);
  case Command::PreparePr: {
    PrepareRequest request;
    request.to = target_or_stage(options_.to);
    request.repository_root = repository_root_;
    return prepare_pr(policy, request, executor);
  }
  case Command::Commit:
    return commit(policy, CommitRequest{options_.message}, executor,
                  provider_);
  case Command::Init:
    break;
  }
  return run_init();
}

OperationResult App::run_init() {
  OperationResult result;
  auto add = [&result](StepKind kind, std::string text) {
    result.steps.push_back({kind, std::move(text)});
  };
  ConfigManager manager;
  const auto path =
      (std::filesystem::path(repository_root_) / ConfigManager::kFileName)
          .string();
  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    add(StepKind::Info, ".gitext already exists at " + path);
    result.next = "edit .gitext to customize configuration";
  } else if (options_.dry_run) {
    add(StepKind::Doing, "[DRY RUN] would create " + path);
  } else {
    add(StepKind::Doing, "Creating .gitext configuration file");
    try {
      manager.save(config_, repository_root_);
    } catch (const ConfigError &e) {
      result.status = OperationStatus::ExecutionFailed;
      result.message = e.what();
      return result;
    }
    add(StepKind::Did, "Created .gitext at " + path);
  }

  if (!options_.install_hooks) {
    if (result.next.empty()) {
      result.next = "gitext init --install-hooks";
    }
    return result;
  }
  add(StepKind::Doing, "Installing pre-push hook");
  if (options_.dry_run) {
    add(StepKind::Detail, "[DRY RUN] would write .git/hooks/pre-push");
    return result;
  }
  try {
    auto hook = install_pre_push_hook(repository_root_, config_.policy());
    add(StepKind::Did, "Installed pre-push hook at " + hook);
  } catch (const std::runtime_error &e) {
    result.status = OperationStatus::ExecutionFailed;
    result.message = std::string("failed to install hooks: ") + e.what();
  }
  return result;
}

} // namespace gitext
