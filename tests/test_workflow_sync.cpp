#include "fake_runner.hpp"
#include "workflow.hpp"
#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <sstream>

using namespace gitext;

namespace {
struct SyncFixture {
  explicit SyncFixture(const std::string &branch, bool dry_run = false) {
    test::script_repository(*runner, branch);
    ExecutorOptions options;
    options.dry_run = dry_run;
    executor = std::make_unique<CommandExecutor>(options, runner, &echo);
  }
  std::shared_ptr<test::FakeRunner> runner =
      std::make_shared<test::FakeRunner>();
  std::ostringstream echo;
  std::unique_ptr<CommandExecutor> executor;
  Policy policy;
};
} // namespace

TEST_CASE("sync fast-forwards the target branch", "[workflow][sync]") {
  SyncFixture f("feature/ABC-1-x");
  f.runner->ok("rev-list --left-right --count origin/stage...stage", "0\t0");
  auto result = sync(f.policy, SyncRequest{Target::Stage}, *f.executor);
  REQUIRE(result.ok());
  REQUIRE(f.runner->called("checkout stage"));
  REQUIRE(f.runner->index_of("checkout stage") <
          f.runner->index_of("fetch origin"));
  REQUIRE(f.runner->index_of("fetch origin") <
          f.runner->index_of("pull --ff-only origin stage"));
  REQUIRE(result.state);
  REQUIRE(result.state->ahead == 0);
  REQUIRE(result.state->behind == 0);
  REQUIRE(result.next == "gitext status");
}

TEST_CASE("sync on the target branch skips checkout and is repeatable",
          "[workflow][sync]") {
  SyncFixture f("production");
  f.runner->ok("rev-list --left-right --count origin/production...production",
               "0\t0");
  auto first = sync(f.policy, SyncRequest{Target::Production}, *f.executor);
  auto second = sync(f.policy, SyncRequest{Target::Production}, *f.executor);
  REQUIRE(first.ok());
  REQUIRE(second.ok());
  REQUIRE_FALSE(f.runner->called("checkout production"));
  REQUIRE(first.state->current_branch == second.state->current_branch);
  REQUIRE(first.state->behind == second.state->behind);
}

TEST_CASE("diverged branch suggests a rebase pull", "[workflow][sync]") {
  SyncFixture f("stage");
  f.runner->fail("pull --ff-only origin stage", 128,
                 "fatal: Not possible to fast-forward, aborting.");
  auto result = sync(f.policy, SyncRequest{Target::Stage}, *f.executor);
  REQUIRE(result.status == OperationStatus::ExecutionFailed);
  REQUIRE(result.next == "git pull --rebase origin stage");
  REQUIRE(result.error);
  REQUIRE(result.error->output.find("fast-forward") != std::string::npos);
}

TEST_CASE("dirty tree stops sync before any mutation", "[workflow][sync]") {
  auto runner = std::make_shared<test::FakeRunner>();
  runner->ok("status --porcelain", " M src/main.cpp");
  test::script_repository(*runner, "feature/ABC-1-x");
  std::ostringstream echo;
  CommandExecutor executor(ExecutorOptions{}, runner, &echo);
  auto result = sync(Policy{}, SyncRequest{Target::Stage}, executor);
  REQUIRE(result.status == OperationStatus::PreconditionFailed);
  REQUIRE(result.precondition == PreconditionKind::DirtyWorkingTree);
  REQUIRE(result.suggestion == "commit or stash changes first");
  REQUIRE_FALSE(runner->called_prefix("checkout"));
  REQUIRE_FALSE(runner->called_prefix("fetch"));
  REQUIRE_FALSE(runner->called_prefix("pull"));
}

TEST_CASE("missing remote is reported before anything else",
          "[workflow][sync]") {
  auto runner = std::make_shared<test::FakeRunner>();
  runner->fail("remote get-url origin", 2, "error: No such remote 'origin'");
  std::ostringstream echo;
  CommandExecutor executor(ExecutorOptions{}, runner, &echo);
  auto result = sync(Policy{}, SyncRequest{Target::Stage}, executor);
  REQUIRE(result.precondition == PreconditionKind::RemoteNotFound);
  REQUIRE(result.suggestion == "run 'git remote add origin <url>'");
  REQUIRE(runner->calls.size() == 1);
}

TEST_CASE("dry-run sync reports state without mutating", "[workflow][sync]") {
  SyncFixture f("stage", true);
  f.runner->ok("rev-list --left-right --count origin/stage...stage", "2\t0");
  auto result = sync(f.policy, SyncRequest{Target::Stage}, *f.executor);
  REQUIRE(result.ok());
  REQUIRE_FALSE(f.runner->called_prefix("fetch"));
  REQUIRE_FALSE(f.runner->called_prefix("pull"));
  REQUIRE(f.echo.str().find("[DRY RUN] git fetch origin") !=
          std::string::npos);
  REQUIRE(f.echo.str().find("[DRY RUN] git pull --ff-only origin stage") !=
          std::string::npos);
  REQUIRE(result.state);
  REQUIRE(result.state->behind == 2);
}
