#include "hook_installer.hpp"
#include "log.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace gitext {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<spdlog::logger> hooks_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("hooks");
  }();
  return logger;
}

} // namespace

std::string pre_push_hook_script(const Policy &policy) {
  std::string script;
  script += "#!/bin/sh\n";
  script += "# gitext pre-push hook\n";
  script += "# Rejects direct pushes to protected branches.\n\n";
  script += "protected_branches=\"" + policy.production_branch + " " +
            policy.stage_branch + "\"\n";
  script += R"(remote="$1"
url="$2"

while read local_ref local_sha remote_ref remote_sha
do
    branch=$(echo "$remote_ref" | sed 's|refs/heads/||')

    for protected in $protected_branches; do
        if [ "$branch" = "$protected" ]; then
            if [ -n "$CI" ] || [ -n "$GITHUB_ACTIONS" ] || [ -n "$GITLAB_CI" ]; then
                exit 0
            fi

            echo "Error: Direct push to protected branch '$branch' is not allowed."
            echo "Please create a pull request instead."
            exit 1
        fi
    done
done

exit 0
)";
  return script;
}

std::string install_pre_push_hook(const std::string &root,
                                  const Policy &policy) {
  fs::path hooks_dir = fs::path(root) / ".git" / "hooks";
  std::error_code ec;
  fs::create_directories(hooks_dir, ec);
  if (ec) {
    throw std::runtime_error("failed to create hooks directory " +
                             hooks_dir.string() + ": " + ec.message());
  }
  fs::path hook_path = hooks_dir / "pre-push";
  {
    std::ofstream out(hook_path, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("failed to write hook " + hook_path.string());
    }
    out << pre_push_hook_script(policy);
  }
  fs::permissions(hook_path,
                  fs::perms::owner_all | fs::perms::group_read |
                      fs::perms::group_exec | fs::perms::others_read |
                      fs::perms::others_exec,
                  fs::perm_options::replace, ec);
  if (ec) {
    throw std::runtime_error("failed to mark hook executable: " +
                             ec.message());
  }
  hooks_log()->info("Installed pre-push hook at {}", hook_path.string());
  return hook_path.string();
}

} // namespace gitext
