#include "fake_runner.hpp"
#include "workflow.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

using namespace gitext;

TEST_CASE("ticket ids are read from branch names", "[prepare]") {
  REQUIRE(extract_ticket("feature/ABC-123-login") == "ABC-123");
  REQUIRE(extract_ticket("hotfix/OPS-7-db-timeout") == "OPS-7");
  REQUIRE(extract_ticket("feature/A-1-x") == "");
  REQUIRE(extract_ticket("feature/login") == "");
  REQUIRE(extract_ticket("stage") == "");
}

TEST_CASE("pr text layout", "[prepare]") {
  auto text = render_pr_text("", "feature/ABC-1-x", "stage",
                             std::vector<std::string>{"a1b2 Add login"});
  REQUIRE(text == "## Branch: feature/ABC-1-x\n\n"
                  "**Ticket:** ABC-1\n\n"
                  "**Target:** stage\n\n"
                  "## Commits\n\n"
                  "- a1b2 Add login\n"
                  "\n## Description\n\n<!-- Add description here -->\n");

  auto templated = render_pr_text("## Checklist", "fix", "production",
                                   std::vector<std::string>{});
  REQUIRE(templated.rfind("## Checklist\n\n---\n\n## Branch: fix", 0) == 0);
  REQUIRE(templated.find("**Ticket:**") == std::string::npos);
  REQUIRE(templated.find("No commits (branch is up to date or behind)") !=
          std::string::npos);

  auto unknown = render_pr_text("", "fix", "stage", std::nullopt);
  REQUIRE(unknown.find("## Commits") == std::string::npos);
}

namespace {
struct PrepareFixture {
  explicit PrepareFixture(bool dry_run = false) {
    test::script_repository(*runner, "feature/ABC-1-x");
    runner->ok("log --oneline origin/stage..feature/ABC-1-x",
               "a1b2 Add login\nc3d4 Fix typo");
    options.dry_run = dry_run;
    policy.ci_commands["stage"] = {"make lint", "make test"};
  }
  OperationResult run(const std::string &root = "") {
    CommandExecutor executor(options, runner, &echo);
    PrepareRequest request;
    request.to = Target::Stage;
    request.repository_root = root;
    return prepare_pr(policy, request, executor);
  }
  std::shared_ptr<test::FakeRunner> runner =
      std::make_shared<test::FakeRunner>();
  std::ostringstream echo;
  ExecutorOptions options;
  Policy policy;
};
} // namespace

TEST_CASE("prepare runs CI in order and renders the PR", "[prepare]") {
  PrepareFixture f;
  auto result = f.run();
  REQUIRE(result.ok());
  REQUIRE(f.runner->index_of("lint") < f.runner->index_of("test"));
  REQUIRE(f.runner->programs[f.runner->index_of("lint")] == "make");
  REQUIRE(result.body.find("- a1b2 Add login\n- c3d4 Fix typo\n") !=
          std::string::npos);
}

TEST_CASE("first failing CI command stops prepare", "[prepare]") {
  PrepareFixture f;
  f.runner->fail("lint", 2, "src/a.cpp:1: error");
  auto result = f.run();
  REQUIRE(result.status == OperationStatus::ExecutionFailed);
  REQUIRE(result.message == "CI check failed: make lint");
  REQUIRE_FALSE(f.runner->called("test"));
  REQUIRE(result.body.empty());
}

TEST_CASE("dry-run skips CI commands", "[prepare]") {
  PrepareFixture f(true);
  auto result = f.run();
  REQUIRE(result.ok());
  REQUIRE_FALSE(f.runner->called("lint"));
  REQUIRE_FALSE(result.body.empty());
}

TEST_CASE("template is read relative to the repository root", "[prepare]") {
  auto root = std::filesystem::temp_directory_path() / "gitext_prepare_tpl";
  std::filesystem::create_directories(root / ".github");
  {
    std::ofstream out(root / ".github" / "pull_request_template.md");
    out << "## Checklist\n- [ ] tests";
  }
  PrepareFixture f;
  f.policy.pr_template_path = ".github/pull_request_template.md";
  auto result = f.run(root.string());
  REQUIRE(result.body.rfind("## Checklist\n- [ ] tests\n\n---\n\n", 0) == 0);

  f.policy.pr_template_path = "missing.md";
  auto without = f.run(root.string());
  REQUIRE(without.ok());
  REQUIRE(without.body.rfind("## Branch:", 0) == 0);
  std::filesystem::remove_all(root);
}
