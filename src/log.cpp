#include "log.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
std::weak_ptr<spdlog::logger> g_logger;
std::mutex g_logger_mutex;

constexpr std::size_t kRotateBytes = 1024 * 1024 * 5;
constexpr spdlog::level::level_enum kDefaultLevel = spdlog::level::warn;
} // namespace

namespace gitext {

/**
 * Initialize the global spdlog logger with optional file rotation.
 *
 * Loggers are synchronous; every gitext invocation runs a single workflow on
 * one thread and log lines must interleave correctly with report output.
 *
 * @param level Logging verbosity level for the default logger.
 * @param pattern Log message pattern; empty string retains the default.
 * @param file Optional log file path used to enable file output.
 * @param rotate_files Maximum number of rotated files to keep.
 */
void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!file.empty()) {
    if (rotate_files > 0) {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          file, kRotateBytes, rotate_files));
    } else {
      sinks.push_back(
          std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, true));
    }
  }
  auto logger = spdlog::get("gitext");
  if (!logger) {
    logger =
        std::make_shared<spdlog::logger>("gitext", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    g_logger = logger;
  } else {
    logger->flush();
    logger->sinks() = sinks;
  }
  // Category loggers created before this call keep their identity but pick
  // up the new sinks and level.
  spdlog::apply_all([&sinks, level](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name().rfind("gitext.", 0) == 0) {
      l->flush();
      l->sinks() = sinks;
      l->set_level(level);
    }
  });
  lock.unlock();
  logger->set_level(level);
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={})",
                spdlog::level::to_string_view(level), file, rotate_files);
}

/**
 * Ensure that the default logger exists before logging.
 *
 * Creates a new logger when previous initialization was skipped or lost.
 */
void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(kDefaultLevel);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get("gitext." + category);
  if (logger) {
    return logger;
  }
  auto default_logger = spdlog::default_logger();
  if (!default_logger || !g_logger.lock()) {
    lock.unlock();
    init_logger(kDefaultLevel);
    lock.lock();
    logger = spdlog::get("gitext." + category);
    if (logger) {
      return logger;
    }
    default_logger = spdlog::default_logger();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (default_logger) {
    sinks = default_logger->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }
  auto new_logger = std::make_shared<spdlog::logger>(
      "gitext." + category, sinks.begin(), sinks.end());
  auto level = default_logger ? default_logger->level() : kDefaultLevel;
  new_logger->set_level(level);
  spdlog::register_logger(new_logger);
  return new_logger;
}

const std::vector<std::string> &known_log_categories() {
  static const std::vector<std::string> categories{
      "app",       "cli",     "config",    "executor", "hooks",
      "inspector", "logging", "validator", "workflow"};
  return categories;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  const auto &known = known_log_categories();
  for (const auto &[category, level] : overrides) {
    if (std::find(known.begin(), known.end(), category) == known.end()) {
      category_logger("logging")->warn("Unknown log category '{}'",
                                       category);
    }
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  auto log = category_logger("logging");
  log->debug("Applied {} log category override(s)", overrides.size());
}

} // namespace gitext
