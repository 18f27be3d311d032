#ifndef GITEXT_CONFIG_MANAGER_HPP
#define GITEXT_CONFIG_MANAGER_HPP

#include "config.hpp"
#include <string>

namespace gitext {

/// Configuration resolved for one repository.
struct RepositoryConfig {
  std::string root;        ///< Working tree root reported by git
  std::string path;        ///< Configuration file consulted
  bool file_found = false; ///< False when defaults were used
  Config config;
};

/// Locates, loads, and saves the per-repository `.gitext` file.
class ConfigManager {
public:
  /// Name of the configuration file at the repository root.
  static constexpr const char *kFileName = ".gitext";

  /**
   * Load a configuration from a YAML, TOML, or JSON file.
   *
   * @throws ConfigError When the file cannot be read or parsed.
   */
  Config load(const std::string &path) const;

  /**
   * Resolve the configuration for the working tree at @p root.
   *
   * Uses @p explicit_path when given, otherwise `<root>/.gitext` when it
   * exists, otherwise defaults. The resulting policy is validated.
   *
   * @throws ConfigError When the file is unreadable or the policy invalid.
   */
  RepositoryConfig load_repository(const std::string &root,
                                   const std::string &explicit_path = "") const;

  /**
   * Write @p config as YAML to `<root>/.gitext`.
   *
   * @return Path written.
   */
  std::string save(const Config &config, const std::string &root) const;
};

} // namespace gitext

#endif // GITEXT_CONFIG_MANAGER_HPP
