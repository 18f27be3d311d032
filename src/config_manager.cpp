/**
 * @file config_manager.cpp
 * @brief Repository-scoped configuration discovery for gitext.
 */

#include "config_manager.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <filesystem>
#include <system_error>

namespace gitext {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

} // namespace

Config ConfigManager::load(const std::string &path) const {
  return Config::from_file(path);
}

RepositoryConfig
ConfigManager::load_repository(const std::string &root,
                               const std::string &explicit_path) const {
  RepositoryConfig resolved;
  resolved.root = root;
  resolved.path = explicit_path.empty()
                      ? (fs::path(root) / kFileName).string()
                      : explicit_path;

  std::error_code ec;
  if (fs::exists(resolved.path, ec)) {
    resolved.config = load(resolved.path);
    resolved.file_found = true;
  } else if (!explicit_path.empty()) {
    throw ConfigError("config file " + explicit_path + " does not exist");
  } else {
    config_log()->debug("no {} in {}, using defaults", kFileName, root);
  }
  resolved.config.policy().validate();
  return resolved;
}

std::string ConfigManager::save(const Config &config,
                                const std::string &root) const {
  auto path = (fs::path(root) / kFileName).string();
  config.save_yaml(path);
  return path;
}

} // namespace gitext
