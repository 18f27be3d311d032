/**
 * @file reporter.hpp
 * @brief Terminal rendering of operation results.
 */

#ifndef GITEXT_REPORTER_HPP
#define GITEXT_REPORTER_HPP

#include "workflow.hpp"

#include <ostream>
#include <string>

namespace gitext {

/**
 * Writes report lines with a leading status symbol. Errors go to the error
 * stream, everything else to the output stream. Detail lines appear only in
 * verbose mode.
 */
class Reporter {
public:
  Reporter(std::ostream &out, std::ostream &err, bool verbose);

  /** Render steps, body, failure summary and next command of @p result. */
  void render(const OperationResult &result);

  void line(StepKind kind, const std::string &text);
  void next(const std::string &command);

  /**
   * Echo captured git output to the error stream, indented, so conflict
   * markers and rejection reasons are visible without --verbose.
   */
  void command_output(const std::string &output);

  /** Symbol prefix used for @p kind. */
  static std::string symbol(StepKind kind);

private:
  std::ostream &out_;
  std::ostream &err_;
  bool verbose_;
};

} // namespace gitext

#endif // GITEXT_REPORTER_HPP
