#include "util/duration.hpp"

#include <cctype>
#include <stdexcept>

namespace gitext {

std::chrono::milliseconds parse_duration(const std::string &str) {
  if (str.empty()) {
    throw std::invalid_argument("empty duration");
  }
  using std::chrono::milliseconds;
  long long total = 0;
  std::size_t i = 0;
  bool has_unit = false;
  while (i < str.size()) {
    if (!std::isdigit(static_cast<unsigned char>(str[i]))) {
      throw std::invalid_argument("invalid duration '" + str + "'");
    }
    long long value = 0;
    while (i < str.size() && std::isdigit(static_cast<unsigned char>(str[i]))) {
      value = value * 10 + (str[i] - '0');
      ++i;
    }
    if (i == str.size()) {
      if (has_unit) {
        throw std::invalid_argument("missing unit in duration '" + str + "'");
      }
      total += value * 1000;
      break;
    }
    char unit = static_cast<char>(
        std::tolower(static_cast<unsigned char>(str[i])));
    ++i;
    if (unit == 'm' && i < str.size() &&
        std::tolower(static_cast<unsigned char>(str[i])) == 's') {
      ++i;
      total += value;
    } else if (unit == 's') {
      total += value * 1000;
    } else if (unit == 'm') {
      total += value * 60 * 1000;
    } else if (unit == 'h') {
      total += value * 3600 * 1000;
    } else {
      throw std::invalid_argument("unknown duration unit '" +
                                  std::string(1, unit) + "'");
    }
    has_unit = true;
  }
  return milliseconds{total};
}

std::string format_duration(std::chrono::milliseconds d) {
  auto ms = d.count();
  if (ms % 1000 == 0) {
    return std::to_string(ms / 1000) + "s";
  }
  return std::to_string(ms) + "ms";
}

} // namespace gitext
