#include "policy.hpp"
#include "errors.hpp"

#include <algorithm>

namespace gitext {

std::string_view to_string(Target target) {
  return target == Target::Production ? "production" : "stage";
}

std::optional<Target> parse_target(std::string_view name) {
  if (name == "stage")
    return Target::Stage;
  if (name == "production")
    return Target::Production;
  return std::nullopt;
}

const std::string &Policy::branch_for(Target target) const {
  return target == Target::Production ? production_branch : stage_branch;
}

void Policy::validate() const {
  if (production_branch.empty()) {
    throw ConfigError("branch.production cannot be empty");
  }
  if (stage_branch.empty()) {
    throw ConfigError("branch.stage cannot be empty");
  }
  if (production_branch == stage_branch) {
    throw ConfigError("branch.production and branch.stage must be different");
  }
  if (remote_name.empty()) {
    throw ConfigError("remote.name cannot be empty");
  }
  for (const auto *pattern : {&feature_pattern, &hotfix_pattern}) {
    if (std::count(pattern->begin(), pattern->end(), '*') != 1) {
      throw ConfigError("naming pattern '" + *pattern +
                        "' must contain exactly one '*'");
    }
  }
  if (shared_author_window < 1) {
    throw ConfigError("safety.sharedAuthorWindow must be at least 1");
  }
}

} // namespace gitext
