#include "hook_installer.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <iterator>

using namespace gitext;
namespace fs = std::filesystem;

TEST_CASE("hook script protects the configured branches", "[hooks]") {
  Policy policy;
  policy.production_branch = "main";
  policy.stage_branch = "develop";
  auto script = pre_push_hook_script(policy);
  REQUIRE(script.rfind("#!/bin/sh\n", 0) == 0);
  REQUIRE(script.find("protected_branches=\"main develop\"") !=
          std::string::npos);
  REQUIRE(script.find("$GITHUB_ACTIONS") != std::string::npos);
  REQUIRE(script.find("is not allowed") != std::string::npos);
}

TEST_CASE("hook is installed executable under .git/hooks", "[hooks]") {
  auto root = fs::temp_directory_path() / "gitext_hook_install";
  fs::remove_all(root);
  fs::create_directories(root / ".git");
  auto path = install_pre_push_hook(root.string(), Policy{});
  REQUIRE(fs::path(path) == root / ".git" / "hooks" / "pre-push");
  auto perms = fs::status(path).permissions();
  REQUIRE((perms & fs::perms::owner_exec) != fs::perms::none);
  REQUIRE((perms & fs::perms::others_exec) != fs::perms::none);
  std::ifstream in(path);
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());
  REQUIRE(text == pre_push_hook_script(Policy{}));

  // Reinstalling overwrites the previous hook.
  Policy other;
  other.stage_branch = "qa";
  install_pre_push_hook(root.string(), other);
  std::ifstream again(path);
  std::string updated((std::istreambuf_iterator<char>(again)),
                      std::istreambuf_iterator<char>());
  REQUIRE(updated.find("\"production qa\"") != std::string::npos);
  fs::remove_all(root);
}
