#include "safety_validator.hpp"
#include "log.hpp"

#include <unordered_set>

namespace gitext {

namespace {

std::shared_ptr<spdlog::logger> validator_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("validator");
  }();
  return logger;
}

} // namespace

std::regex pattern_to_regex(const std::string &pattern) {
  std::string rx = "^";
  for (char c : pattern) {
    switch (c) {
    case '*':
      rx += ".*";
      break;
    case '.':
    case '?':
    case '+':
    case '(':
    case ')':
    case '{':
    case '}':
    case '^':
    case '$':
    case '|':
    case '\\':
    case '[':
    case ']':
      rx += '\\';
      rx += c;
      break;
    default:
      rx += c;
    }
  }
  rx += '$';
  return std::regex(rx);
}

bool matches_pattern(const std::string &branch, const std::string &pattern) {
  return std::regex_match(branch, pattern_to_regex(pattern));
}

bool is_shared_branch(bool remote_exists,
                      const std::vector<std::string> &recent_authors) {
  if (!remote_exists) {
    return false;
  }
  std::unordered_set<std::string> distinct(recent_authors.begin(),
                                           recent_authors.end());
  return distinct.size() > 1;
}

bool is_protected(const std::string &branch, const Policy &policy) {
  return branch == policy.production_branch || branch == policy.stage_branch;
}

void require_clean(bool is_clean) {
  if (!is_clean) {
    validator_log()->debug("working tree is dirty");
    throw PreconditionError(PreconditionKind::DirtyWorkingTree,
                            "working tree has uncommitted changes",
                            "commit or stash changes first");
  }
}

void require_remote(const std::string &remote, bool configured) {
  if (!configured) {
    throw PreconditionError(PreconditionKind::RemoteNotFound,
                            "remote '" + remote + "' does not exist",
                            "run 'git remote add " + remote + " <url>'");
  }
}

void require_branch(const std::string &branch, const std::string &remote,
                    bool exists) {
  if (!exists) {
    throw PreconditionError(
        PreconditionKind::BranchNotFound,
        "branch '" + branch + "' does not exist locally or on '" + remote +
            "'",
        "run 'git fetch " + remote + "' or check the branch name in .gitext");
  }
}

void require_absent(const std::string &branch, bool exists) {
  if (exists) {
    throw PreconditionError(PreconditionKind::BranchExists,
                            "branch '" + branch + "' already exists",
                            "run 'git checkout " + branch +
                                "' or choose a different slug");
  }
}

void require_attached(bool detached) {
  if (detached) {
    throw PreconditionError(PreconditionKind::DetachedHead,
                            "HEAD is detached",
                            "run 'git checkout <branch>' first");
  }
}

void require_pattern(const std::string &branch, const std::string &pattern,
                     const std::string &override_hint) {
  if (matches_pattern(branch, pattern)) {
    return;
  }
  std::string suggestion = "use a branch named like '" + pattern + "'";
  if (!override_hint.empty()) {
    suggestion += " or pass " + override_hint;
  }
  throw PreconditionError(PreconditionKind::PatternMismatch,
                          "branch '" + branch + "' does not match pattern '" +
                              pattern + "'",
                          suggestion);
}

void require_not_shared(const std::string &branch, bool shared,
                        bool acknowledged) {
  if (!shared) {
    return;
  }
  if (acknowledged) {
    validator_log()->info("branch '{}' looks shared; acknowledged", branch);
    return;
  }
  throw PreconditionError(PreconditionKind::SharedBranch,
                          "branch '" + branch +
                              "' appears shared (multiple authors in recent "
                              "commits)",
                          "use --i-know-what-im-doing to proceed");
}

} // namespace gitext
