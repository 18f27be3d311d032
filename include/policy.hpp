/**
 * @file policy.hpp
 * @brief Resolved branch policy for a single run.
 */

#ifndef GITEXT_POLICY_HPP
#define GITEXT_POLICY_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace gitext {

/** Protected integration branches an operation can aim at. */
enum class Target { Stage, Production };

/** "stage" or "production". */
std::string_view to_string(Target target);

/** Parse "stage" or "production"; std::nullopt for anything else. */
std::optional<Target> parse_target(std::string_view name);

/**
 * Branch names, naming patterns and remote that every workflow consults.
 *
 * Built once from configuration and not modified afterwards.
 */
struct Policy {
  std::string production_branch{"production"};
  std::string stage_branch{"stage"};
  std::string feature_pattern{"feature/*"};
  std::string hotfix_pattern{"hotfix/*"};
  std::string remote_name{"origin"};
  std::map<std::string, std::vector<std::string>> ci_commands;
  std::string pr_template_path;
  bool require_retarget_for_prod_from_stage{false};
  int shared_author_window{10}; ///< Commits sampled for authorship

  /** Branch name configured for @p target. */
  const std::string &branch_for(Target target) const;

  /**
   * Check structural constraints.
   *
   * @throws ConfigError naming the offending key.
   */
  void validate() const;
};

} // namespace gitext

#endif // GITEXT_POLICY_HPP
