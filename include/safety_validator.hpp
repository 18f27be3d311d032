/**
 * @file safety_validator.hpp
 * @brief Pure safety decisions over inspection results and policy.
 *
 * Nothing here touches the repository. The `require_*` helpers throw
 * PreconditionError with a corrective suggestion when a check fails.
 */

#ifndef GITEXT_SAFETY_VALIDATOR_HPP
#define GITEXT_SAFETY_VALIDATOR_HPP

#include "errors.hpp"
#include "policy.hpp"

#include <regex>
#include <string>
#include <vector>

namespace gitext {

/**
 * Compile a branch naming pattern into an anchored regex. `*` matches any
 * run of characters (including none); all other characters are literal.
 */
std::regex pattern_to_regex(const std::string &pattern);

/** Case-sensitive, whole-name match of @p branch against @p pattern. */
bool matches_pattern(const std::string &branch, const std::string &pattern);

/**
 * Shared-branch heuristic: the branch exists on the remote and more than one
 * distinct author appears among @p recent_authors.
 */
bool is_shared_branch(bool remote_exists,
                      const std::vector<std::string> &recent_authors);

/** True for the configured production or stage branch. */
bool is_protected(const std::string &branch, const Policy &policy);

void require_clean(bool is_clean);
void require_remote(const std::string &remote, bool configured);
void require_branch(const std::string &branch, const std::string &remote,
                    bool exists);
void require_absent(const std::string &branch, bool exists);
void require_attached(bool detached);

/**
 * @param override_hint Appended to the suggestion, e.g. the flag that skips
 *        the check. Empty when no override exists.
 */
void require_pattern(const std::string &branch, const std::string &pattern,
                     const std::string &override_hint = "");

/** Refuse a shared branch unless the operator acknowledged the risk. */
void require_not_shared(const std::string &branch, bool shared,
                        bool acknowledged);

} // namespace gitext

#endif // GITEXT_SAFETY_VALIDATOR_HPP
