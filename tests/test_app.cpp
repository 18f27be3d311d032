#include "app.hpp"
#include "fake_runner.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace gitext;
namespace fs = std::filesystem;

namespace {
struct AppFixture {
  explicit AppFixture(const std::string &name)
      : root(fs::temp_directory_path() / name) {
    fs::remove_all(root);
    fs::create_directories(root / ".git");
    runner->ok("rev-parse --show-toplevel", root.string());
  }
  ~AppFixture() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
  int run(std::vector<std::string> args) {
    args.insert(args.begin(), "gitext");
    std::vector<char *> argv;
    for (auto &arg : args) {
      argv.push_back(arg.data());
    }
    App app(runner, out, err, root.string());
    return app.run(static_cast<int>(argv.size()), argv.data());
  }
  fs::path root;
  std::shared_ptr<test::FakeRunner> runner =
      std::make_shared<test::FakeRunner>();
  std::ostringstream out;
  std::ostringstream err;
};
} // namespace

TEST_CASE("successful operation exits 0", "[app]") {
  AppFixture f("gitext_app_ok");
  test::script_repository(*f.runner, "feature/ABC-1-x");
  f.runner->ok("rev-list --left-right --count origin/stage...feature/ABC-1-x",
               "0\t1");
  f.runner->ok(
      "rev-list --left-right --count origin/production...feature/ABC-1-x",
      "0\t1");
  REQUIRE(f.run({"status"}) == 0);
  REQUIRE(f.out.str().find("Current branch: feature/ABC-1-x") !=
          std::string::npos);
  REQUIRE(f.out.str().find("Next: gitext prepare pr --to stage") !=
          std::string::npos);
}

TEST_CASE("refused operation exits 1 and names the fix", "[app]") {
  AppFixture f("gitext_app_dirty");
  f.runner->ok("status --porcelain", " M a.txt");
  test::script_repository(*f.runner, "stage");
  REQUIRE(f.run({"sync", "stage"}) == 1);
  REQUIRE(f.err.str().find("commit or stash changes first") !=
          std::string::npos);
  REQUIRE_FALSE(f.runner->called_prefix("pull"));
}

TEST_CASE("invalid configuration exits 2", "[app]") {
  AppFixture f("gitext_app_badcfg");
  {
    std::ofstream cfg(f.root / ".gitext");
    cfg << "branch:\n  production: x\n  stage: x\n";
  }
  REQUIRE(f.run({"status"}) == kExitFatal);
  REQUIRE(f.err.str().find("invalid configuration") != std::string::npos);
  REQUIRE(f.runner->calls == std::vector<std::string>{
                                 "rev-parse --git-dir",
                                 "rev-parse --show-toplevel"});
}

TEST_CASE("outside a repository exits 2 before anything runs", "[app]") {
  AppFixture f("gitext_app_norepo");
  f.runner->fail("rev-parse --git-dir", 128,
                 "fatal: not a git repository (or any of the parent "
                 "directories): .git");
  REQUIRE(f.run({"status"}) == kExitFatal);
  REQUIRE(f.err.str().find("not in a git repository") != std::string::npos);
  REQUIRE(f.runner->calls == std::vector<std::string>{"rev-parse --git-dir"});
}

TEST_CASE("configuration is read from the root git reports", "[app]") {
  AppFixture f("gitext_app_subdir");
  fs::create_directories(f.root / "src");
  {
    std::ofstream cfg(f.root / ".gitext");
    cfg << "branch:\n  stage: develop\n";
  }
  auto runner = f.runner;
  App app(runner, f.out, f.err, (f.root / "src").string());
  std::vector<std::string> args{"gitext", "--dry-run", "status"};
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  app.run(static_cast<int>(argv.size()), argv.data());
  REQUIRE(app.config().policy().stage_branch == "develop");
}

TEST_CASE("configuration drives the workflow", "[app]") {
  AppFixture f("gitext_app_cfg");
  {
    std::ofstream cfg(f.root / ".gitext");
    cfg << "branch:\n  stage: develop\nremote:\n  name: upstream\n";
  }
  f.runner->ok("remote get-url upstream", "git@example.com:x.git")
      .ok("branch --list develop", "  develop")
      .ok("rev-parse --abbrev-ref HEAD", "develop")
      .ok("rev-list --left-right --count upstream/develop...develop",
          "0\t0");
  REQUIRE(f.run({"sync", "stage"}) == 0);
  REQUIRE(f.runner->called("pull --ff-only upstream develop"));
}

TEST_CASE("dry-run flag reaches the executor", "[app]") {
  AppFixture f("gitext_app_dry");
  test::script_repository(*f.runner, "stage");
  REQUIRE(f.run({"--dry-run", "sync", "stage"}) == 0);
  REQUIRE_FALSE(f.runner->called_prefix("pull"));
  REQUIRE(f.out.str().find("[DRY RUN] git pull --ff-only origin stage") !=
          std::string::npos);
}

TEST_CASE("parse errors use the CLI exit code", "[app]") {
  AppFixture f("gitext_app_parse");
  REQUIRE(f.run({"sync", "nowhere"}) != 0);
  REQUIRE(f.run({"--help"}) == 0);
  REQUIRE(f.runner->calls.empty());
}

TEST_CASE("init writes .gitext once and installs hooks on request",
          "[app]") {
  AppFixture f("gitext_app_init");
  REQUIRE(f.run({"init"}) == 0);
  REQUIRE(fs::exists(f.root / ".gitext"));
  REQUIRE(f.out.str().find("Next: gitext init --install-hooks") !=
          std::string::npos);

  REQUIRE(f.run({"init", "--install-hooks"}) == 0);
  REQUIRE(f.out.str().find(".gitext already exists") != std::string::npos);
  REQUIRE(fs::exists(f.root / ".git" / "hooks" / "pre-push"));
}

TEST_CASE("dry-run init writes nothing", "[app]") {
  AppFixture f("gitext_app_init_dry");
  REQUIRE(f.run({"-n", "init", "--install-hooks"}) == 0);
  REQUIRE_FALSE(fs::exists(f.root / ".gitext"));
  REQUIRE_FALSE(fs::exists(f.root / ".git" / "hooks" / "pre-push"));
}

TEST_CASE("exit codes follow the result status", "[app]") {
  OperationResult result;
  REQUIRE(exit_code_for(result) == 0);
  result.status = OperationStatus::RecoverableFailure;
  REQUIRE(exit_code_for(result) == 1);
  result.status = OperationStatus::PreconditionFailed;
  result.precondition = PreconditionKind::NotARepository;
  REQUIRE(exit_code_for(result) == kExitFatal);
}
