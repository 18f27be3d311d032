/**
 * @file duration.hpp
 * @brief Parsing of command timeout strings.
 *
 * Timeouts are written as number/unit pairs such as "30s", "1m30s" or
 * "500ms" and resolve to milliseconds.
 */
#ifndef GITEXT_UTIL_DURATION_HPP
#define GITEXT_UTIL_DURATION_HPP

#include <chrono>
#include <string>

namespace gitext {

/**
 * Parse a timeout string into milliseconds.
 *
 * Recognised units are `ms`, `s`, `m` and `h`; several pairs may be chained
 * ("1m30s"). A bare number is read as seconds.
 *
 * @param str Duration string; must be non-empty.
 * @return Parsed duration.
 * @throws std::invalid_argument on an empty string, a malformed number, an
 *         unknown unit, or a trailing number after a unit.
 */
std::chrono::milliseconds parse_duration(const std::string &str);

/** Render @p d compactly, e.g. "30s" or "1500ms". */
std::string format_duration(std::chrono::milliseconds d);

} // namespace gitext

#endif // GITEXT_UTIL_DURATION_HPP
