/**
 * @file log.hpp
 * @brief Logging utilities for gitext.
 *
 * Declares logger initialization, category loggers, and log category
 * configuration.
 */

#ifndef GITEXT_LOG_HPP
#define GITEXT_LOG_HPP

#include <cstddef>
#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace gitext {

/**
 * Initialize the global logger with a console sink and an optional rotating
 * file sink.
 *
 * The console sink writes to stderr so that operation reports printed on
 * stdout stay free of diagnostics.
 *
 * @param level Logging verbosity level to use for all loggers.
 * @param pattern Log message pattern. Provide an empty string to keep the
 *        underlying spdlog default.
 * @param file Optional log file path. When empty no file output is
 *        configured.
 * @param rotate_files Maximum number of rotated files to retain when @p file
 *        is provided. Zero writes a single non-rotating file.
 */
void init_logger(spdlog::level::level_enum level,
                 const std::string &pattern = "", const std::string &file = "",
                 std::size_t rotate_files = 3);

/**
 * Retrieve or create a logger dedicated to a specific category.
 *
 * Category loggers share sinks with the default logger so messages appear in
 * the same destinations. They allow fine-grained log-level overrides.
 *
 * @param category Arbitrary category name used as the logger identifier.
 * @return Shared pointer to the category logger.
 */
std::shared_ptr<spdlog::logger> category_logger(const std::string &category);

/**
 * Names of the category loggers gitext creates, one per subsystem:
 * app, cli, config, executor, hooks, inspector, logging, validator and
 * workflow.
 */
const std::vector<std::string> &known_log_categories();

/**
 * Apply log level overrides for specific categories.
 *
 * A name outside known_log_categories() is still applied but logged as a
 * warning, since it usually means a typo on the command line.
 *
 * @param overrides Mapping of category name to desired log level.
 */
void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides);

/**
 * Ensure a default logger exists before logging.
 *
 * Calling spdlog logging macros requires a default logger. This helper creates
 * one on demand when the logging subsystem has not been explicitly
 * initialized.
 */
void ensure_default_logger();

} // namespace gitext

#endif // GITEXT_LOG_HPP
