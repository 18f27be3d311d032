#ifndef GITEXT_CONFIG_HPP
#define GITEXT_CONFIG_HPP

#include "policy.hpp"
#include <chrono>
#include <nlohmann/json_fwd.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace gitext {

/// Repository configuration loaded from a YAML, TOML, or JSON file.
class Config {
public:
  /// Branch policy consumed by the workflows.
  const Policy &policy() const { return policy_; }

  /// Mutable access used by the loader and by tests.
  Policy &policy() { return policy_; }

  /** Check whether dry-run mode is enabled by default. */
  bool dry_run() const { return dry_run_; }

  /// Set default dry-run mode.
  void set_dry_run(bool dry_run) { dry_run_ = dry_run; }

  /** Check whether verbose output is enabled. */
  bool verbose() const { return verbose_; }

  /// Set verbose output mode.
  void set_verbose(bool verbose) { verbose_ = verbose; }

  /// Per-command timeout for git invocations.
  std::chrono::milliseconds command_timeout() const { return command_timeout_; }

  /// Set per-command timeout; non-positive values are ignored.
  void set_command_timeout(std::chrono::milliseconds timeout) {
    if (timeout.count() > 0)
      command_timeout_ = timeout;
  }

  /// Logging verbosity level name.
  const std::string &log_level() const { return log_level_; }

  /// Set logging verbosity level.
  void set_log_level(const std::string &level) { log_level_ = level; }

  /// Logging pattern.
  const std::string &log_pattern() const { return log_pattern_; }

  /// Set logging pattern.
  void set_log_pattern(const std::string &pattern) { log_pattern_ = pattern; }

  /// Path to the log file, empty when file logging is off.
  const std::string &log_file() const { return log_file_; }

  /// Set path to the log file.
  void set_log_file(const std::string &file) { log_file_ = file; }

  /// Number of rotated log files to keep.
  int log_rotate() const { return log_rotate_; }

  /// Set rotated log file count.
  void set_log_rotate(int count) { log_rotate_ = count < 0 ? 0 : count; }

  /// Per-category log level overrides.
  const std::unordered_map<std::string, std::string> &log_categories() const {
    return log_categories_;
  }

  /// Replace per-category log level overrides.
  void set_log_categories(std::unordered_map<std::string, std::string> levels) {
    log_categories_ = std::move(levels);
  }

  /**
   * Load configuration from a file on disk.
   *
   * The format follows the extension: `.yaml`/`.yml`, `.json`, `.toml`.
   * A file without extension (such as `.gitext`) is read as YAML.
   *
   * @throws ConfigError When the file cannot be read or parsed.
   */
  static Config from_file(const std::string &path);

  /// Create a configuration from a parsed JSON document.
  static Config from_json(const nlohmann::json &j);

  /// Populate this configuration from a JSON document.
  void load_json(const nlohmann::json &j);

  /// Serialize the persisted sections back to JSON.
  nlohmann::json to_json() const;

  /**
   * Write the configuration as YAML.
   *
   * @throws ConfigError When the file cannot be written.
   */
  void save_yaml(const std::string &path) const;

  /// YAML text that save_yaml() writes.
  std::string to_yaml() const;

private:
  Policy policy_;
  bool dry_run_ = false;
  bool verbose_ = false;
  std::chrono::milliseconds command_timeout_{std::chrono::seconds(30)};
  std::string log_level_ = "warn";
  std::string log_pattern_;
  std::string log_file_;
  int log_rotate_ = 3;
  std::unordered_map<std::string, std::string> log_categories_;
};

} // namespace gitext

#endif // GITEXT_CONFIG_HPP
