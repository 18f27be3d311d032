#include "reporter.hpp"

#include <sstream>

namespace gitext {

Reporter::Reporter(std::ostream &out, std::ostream &err, bool verbose)
    : out_(out), err_(err), verbose_(verbose) {}

std::string Reporter::symbol(StepKind kind) {
  switch (kind) {
  case StepKind::Info:
    return "ℹ  ";
  case StepKind::Success:
  case StepKind::Did:
    return "✓  ";
  case StepKind::Warning:
    return "⚠  ";
  case StepKind::Error:
    return "✗  ";
  case StepKind::Doing:
    return "→  ";
  case StepKind::Detail:
    return "   ";
  case StepKind::Plain:
    return "";
  }
  return "";
}

void Reporter::line(StepKind kind, const std::string &text) {
  if (kind == StepKind::Detail && !verbose_) {
    return;
  }
  auto &stream = kind == StepKind::Error ? err_ : out_;
  stream << symbol(kind) << text << '\n';
}

void Reporter::next(const std::string &command) {
  out_ << "→  Next: " << command << '\n';
}

void Reporter::command_output(const std::string &output) {
  std::istringstream in(output);
  std::string text;
  while (std::getline(in, text)) {
    err_ << "   " << text << '\n';
  }
}

void Reporter::render(const OperationResult &result) {
  for (const auto &step : result.steps) {
    line(step.kind, step.text);
  }
  if (!result.body.empty()) {
    out_ << '\n' << result.body << '\n';
  }
  if (!result.ok()) {
    std::string summary = result.message;
    if (!result.suggestion.empty()) {
      summary += " → " + result.suggestion;
    }
    line(StepKind::Error, summary);
    if (result.error && !result.error->output.empty()) {
      line(StepKind::Detail, result.error->command);
      command_output(result.error->output);
    }
  }
  if (!result.next.empty()) {
    next(result.next);
  }
}

} // namespace gitext
