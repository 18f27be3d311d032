/**
 * @file hook_installer.hpp
 * @brief Generation and installation of the protected-branch pre-push hook.
 */

#ifndef GITEXT_HOOK_INSTALLER_HPP
#define GITEXT_HOOK_INSTALLER_HPP

#include "policy.hpp"

#include <string>

namespace gitext {

/**
 * Shell script rejecting pushes to the production and stage branches. CI
 * environments (`CI`, `GITHUB_ACTIONS`, `GITLAB_CI`) are let through.
 */
std::string pre_push_hook_script(const Policy &policy);

/**
 * Write the pre-push hook into `<root>/.git/hooks` with mode 0755.
 *
 * @param root Working tree root.
 * @return Path of the installed hook.
 * @throws std::runtime_error When the hooks directory or file cannot be
 *         written.
 */
std::string install_pre_push_hook(const std::string &root,
                                  const Policy &policy);

} // namespace gitext

#endif // GITEXT_HOOK_INSTALLER_HPP
