#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "util/duration.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <toml++/toml.h>
#include <yaml-cpp/yaml.h>

namespace gitext {

namespace {

std::shared_ptr<spdlog::logger> config_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("config");
  }();
  return logger;
}

std::string to_lower_copy(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

/**
 * Convert a YAML node into a structurally equivalent JSON value.
 *
 * Plain scalars that spell a boolean or an integer become typed JSON values;
 * everything else stays a string.
 */
nlohmann::json yaml_to_json(const YAML::Node &node) {
  using nlohmann::json;
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return nullptr;
  case YAML::NodeType::Scalar: {
    const std::string s = node.Scalar();
    if (node.Tag() == "!") {
      return s; // quoted scalar
    }
    const auto lower = to_lower_copy(s);
    if (lower == "true")
      return true;
    if (lower == "false")
      return false;
    if (!s.empty()) {
      errno = 0;
      char *end = nullptr;
      long long i = std::strtoll(s.c_str(), &end, 10);
      if (errno == 0 && end && *end == '\0')
        return i;
    }
    return s;
  }
  case YAML::NodeType::Sequence: {
    json arr = json::array();
    for (const auto &item : node) {
      arr.push_back(yaml_to_json(item));
    }
    return arr;
  }
  case YAML::NodeType::Map: {
    json obj = json::object();
    for (const auto &kv : node) {
      obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
    }
    return obj;
  }
  default:
    return nullptr;
  }
}

/** Translate a TOML node to a JSON representation. */
nlohmann::json toml_to_json(const toml::node &node) {
  using nlohmann::json;
  if (const auto *table = node.as_table()) {
    json obj = json::object();
    for (const auto &kv : *table) {
      obj[std::string(kv.first.str())] = toml_to_json(kv.second);
    }
    return obj;
  }
  if (const auto *array = node.as_array()) {
    json arr = json::array();
    for (const auto &item : *array) {
      arr.push_back(toml_to_json(item));
    }
    return arr;
  }
  if (const auto *value = node.as_boolean())
    return value->get();
  if (const auto *value = node.as_integer())
    return value->get();
  if (const auto *value = node.as_floating_point())
    return value->get();
  if (const auto *value = node.as_string())
    return value->get();
  return nullptr;
}

/**
 * Merge the `core` and `logging` sections into the root so both grouped and
 * flat files expose the same keys. Policy sections stay nested because their
 * keys overlap (`branch.stage` and `ci.stage`).
 */
nlohmann::json normalize_config_sections(const nlohmann::json &source) {
  nlohmann::json normalized = source;
  for (std::string_view name : {"core", "logging"}) {
    auto it = normalized.find(std::string{name});
    if (it == normalized.end() || !it->is_object()) {
      continue;
    }
    const nlohmann::json section = *it;
    for (const auto &[key, value] : section.items()) {
      normalized[key] = value;
    }
  }
  return normalized;
}

/// Scalar rendered as text; numbers keep their literal form.
std::string scalar_text(const nlohmann::json &value, std::string_view key) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number() || value.is_boolean())
    return value.dump();
  if (value.is_null())
    return "";
  throw ConfigError("invalid configuration: '" + std::string(key) +
                    "' must be a string");
}

/// Read `section.key` as text when present and non-empty.
void read_text(const nlohmann::json &root, std::string_view section,
               std::string_view key, std::string &out) {
  auto sec = root.find(std::string{section});
  if (sec == root.end() || !sec->is_object())
    return;
  auto it = sec->find(std::string{key});
  if (it == sec->end())
    return;
  auto text = scalar_text(*it, std::string(section) + "." + std::string(key));
  if (!text.empty())
    out = text;
}

std::vector<std::string> read_commands(const nlohmann::json &value,
                                       std::string_view key) {
  std::vector<std::string> commands;
  if (value.is_null())
    return commands;
  if (value.is_string()) {
    commands.push_back(value.get<std::string>());
    return commands;
  }
  if (!value.is_array()) {
    throw ConfigError("invalid configuration: 'ci." + std::string(key) +
                      "' must be a list of commands");
  }
  for (const auto &item : value) {
    commands.push_back(scalar_text(item, "ci." + std::string(key)));
  }
  return commands;
}

std::chrono::milliseconds read_timeout(const nlohmann::json &value) {
  if (value.is_number_integer()) {
    return std::chrono::seconds(value.get<long long>());
  }
  if (value.is_string()) {
    try {
      return parse_duration(value.get<std::string>());
    } catch (const std::invalid_argument &e) {
      throw ConfigError(std::string("invalid configuration: command_timeout: ") +
                        e.what());
    }
  }
  throw ConfigError(
      "invalid configuration: command_timeout must be a duration");
}

} // namespace

void Config::load_json(const nlohmann::json &j) {
  if (j.is_null()) {
    return;
  }
  if (!j.is_object()) {
    throw ConfigError("invalid configuration: top level must be a mapping");
  }
  nlohmann::json cfg = normalize_config_sections(j);

  read_text(cfg, "branch", "production", policy_.production_branch);
  read_text(cfg, "branch", "stage", policy_.stage_branch);
  read_text(cfg, "naming", "feature", policy_.feature_pattern);
  read_text(cfg, "naming", "hotfix", policy_.hotfix_pattern);
  read_text(cfg, "remote", "name", policy_.remote_name);
  read_text(cfg, "pr", "templatePath", policy_.pr_template_path);

  if (cfg.contains("merge") && cfg["merge"].is_object()) {
    const auto &merge = cfg["merge"];
    if (merge.contains("requireRetargetForProdFromStage")) {
      const auto &flag = merge["requireRetargetForProdFromStage"];
      if (!flag.is_boolean()) {
        throw ConfigError("invalid configuration: "
                          "merge.requireRetargetForProdFromStage must be a "
                          "boolean");
      }
      policy_.require_retarget_for_prod_from_stage = flag.get<bool>();
    }
  }
  if (cfg.contains("ci") && cfg["ci"].is_object()) {
    for (const auto &[key, value] : cfg["ci"].items()) {
      policy_.ci_commands[key] = read_commands(value, key);
    }
  }
  if (cfg.contains("safety") && cfg["safety"].is_object()) {
    const auto &safety = cfg["safety"];
    if (safety.contains("sharedAuthorWindow")) {
      if (!safety["sharedAuthorWindow"].is_number_integer()) {
        throw ConfigError("invalid configuration: "
                          "safety.sharedAuthorWindow must be an integer");
      }
      const auto &window = safety["sharedAuthorWindow"];
      bool in_range =
          window.is_number_unsigned()
              ? window.get<std::uint64_t>() <=
                    static_cast<std::uint64_t>(
                        std::numeric_limits<int>::max())
              : window.get<std::int64_t>() >=
                        std::numeric_limits<int>::min() &&
                    window.get<std::int64_t>() <=
                        std::numeric_limits<int>::max();
      if (!in_range) {
        throw ConfigError("invalid configuration: "
                          "safety.sharedAuthorWindow is out of range");
      }
      policy_.shared_author_window = window.get<int>();
    }
  }

  if (cfg.contains("dry_run") && cfg["dry_run"].is_boolean()) {
    set_dry_run(cfg["dry_run"].get<bool>());
  }
  if (cfg.contains("verbose") && cfg["verbose"].is_boolean()) {
    set_verbose(cfg["verbose"].get<bool>());
  }
  if (cfg.contains("command_timeout")) {
    set_command_timeout(read_timeout(cfg["command_timeout"]));
  }
  if (cfg.contains("log_level")) {
    set_log_level(scalar_text(cfg["log_level"], "log_level"));
  }
  if (cfg.contains("log_pattern")) {
    set_log_pattern(scalar_text(cfg["log_pattern"], "log_pattern"));
  }
  if (cfg.contains("log_file")) {
    set_log_file(scalar_text(cfg["log_file"], "log_file"));
  }
  if (cfg.contains("log_rotate") && cfg["log_rotate"].is_number_integer()) {
    set_log_rotate(cfg["log_rotate"].get<int>());
  }
  auto categories = cfg.find("log_categories");
  if (categories == cfg.end()) {
    categories = cfg.find("categories");
  }
  if (categories != cfg.end() && categories->is_object()) {
    std::unordered_map<std::string, std::string> levels;
    for (const auto &[name, level] : categories->items()) {
      levels[name] = scalar_text(level, "log_categories." + name);
    }
    set_log_categories(std::move(levels));
  }
}

Config Config::from_json(const nlohmann::json &j) {
  Config cfg;
  cfg.load_json(j);
  return cfg;
}

/**
 * Load configuration from a file on disk.
 *
 * Errors during parsing are logged and rethrown as ConfigError.
 */
Config Config::from_file(const std::string &path) {
  ensure_default_logger();
  config_log()->debug("Loading config from {}", path);
  const auto ext = to_lower_copy(std::filesystem::path(path).extension().string());
  nlohmann::json j;
  try {
    if (ext.empty() || ext == ".yaml" || ext == ".yml") {
      YAML::Node node = YAML::LoadFile(path);
      j = yaml_to_json(node);
    } else if (ext == ".json") {
      std::ifstream f(path);
      if (!f) {
        throw ConfigError("failed to open config file " + path);
      }
      f >> j;
    } else if (ext == ".toml" || ext == ".tml") {
      toml::table tbl = toml::parse_file(path);
      j = toml_to_json(tbl);
    } else {
      throw ConfigError("unsupported config format '" + ext + "'");
    }
  } catch (const ConfigError &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw;
  } catch (const std::exception &e) {
    config_log()->error("Failed to load config {}: {}", path, e.what());
    throw ConfigError("invalid configuration in " + path + ": " + e.what());
  }
  Config cfg;
  try {
    cfg.load_json(j);
  } catch (const nlohmann::json::exception &e) {
    throw ConfigError("invalid configuration in " + path + ": " + e.what());
  }
  config_log()->info("Config loaded successfully from {}", path);
  return cfg;
}

nlohmann::json Config::to_json() const {
  nlohmann::json j;
  j["branch"]["production"] = policy_.production_branch;
  j["branch"]["stage"] = policy_.stage_branch;
  j["naming"]["feature"] = policy_.feature_pattern;
  j["naming"]["hotfix"] = policy_.hotfix_pattern;
  j["merge"]["requireRetargetForProdFromStage"] =
      policy_.require_retarget_for_prod_from_stage;
  for (const char *target : {"stage", "production"}) {
    auto it = policy_.ci_commands.find(target);
    j["ci"][target] = it == policy_.ci_commands.end()
                          ? nlohmann::json::array()
                          : nlohmann::json(it->second);
  }
  j["pr"]["templatePath"] = policy_.pr_template_path;
  j["remote"]["name"] = policy_.remote_name;
  j["safety"]["sharedAuthorWindow"] = policy_.shared_author_window;
  return j;
}

std::string Config::to_yaml() const {
  YAML::Emitter out;
  out << YAML::BeginMap;
  out << YAML::Key << "branch" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "production" << YAML::Value << policy_.production_branch;
  out << YAML::Key << "stage" << YAML::Value << policy_.stage_branch;
  out << YAML::EndMap;
  out << YAML::Key << "naming" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "feature" << YAML::Value << policy_.feature_pattern;
  out << YAML::Key << "hotfix" << YAML::Value << policy_.hotfix_pattern;
  out << YAML::EndMap;
  out << YAML::Key << "merge" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "requireRetargetForProdFromStage" << YAML::Value
      << policy_.require_retarget_for_prod_from_stage;
  out << YAML::EndMap;
  out << YAML::Key << "ci" << YAML::Value << YAML::BeginMap;
  for (const char *target : {"stage", "production"}) {
    auto it = policy_.ci_commands.find(target);
    out << YAML::Key << target << YAML::Value << YAML::Flow << YAML::BeginSeq;
    if (it != policy_.ci_commands.end()) {
      for (const auto &command : it->second) {
        out << command;
      }
    }
    out << YAML::EndSeq;
  }
  out << YAML::EndMap;
  out << YAML::Key << "pr" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "templatePath" << YAML::Value
      << YAML::DoubleQuoted << policy_.pr_template_path;
  out << YAML::EndMap;
  out << YAML::Key << "remote" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "name" << YAML::Value << policy_.remote_name;
  out << YAML::EndMap;
  out << YAML::Key << "safety" << YAML::Value << YAML::BeginMap;
  out << YAML::Key << "sharedAuthorWindow" << YAML::Value
      << policy_.shared_author_window;
  out << YAML::EndMap;
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

void Config::save_yaml(const std::string &path) const {
  std::ofstream f(path, std::ios::trunc);
  if (!f) {
    throw ConfigError("failed to write config file " + path);
  }
  f << to_yaml();
  if (!f) {
    throw ConfigError("failed to write config file " + path);
  }
  config_log()->info("Config written to {}", path);
}

} // namespace gitext
