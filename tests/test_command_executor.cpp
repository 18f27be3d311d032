#include "command_executor.hpp"
#include "fake_runner.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <memory>
#include <sstream>

using namespace gitext;
using namespace std::chrono_literals;

TEST_CASE("posix runner captures combined output and exit status",
          "[executor]") {
  PosixCommandRunner runner;
  auto out = runner.run({"sh", "-c", "echo out; echo err 1>&2; exit 3"}, 5s,
                        "");
  REQUIRE_FALSE(out.spawn_failed);
  REQUIRE_FALSE(out.timed_out);
  REQUIRE(out.exit_code == 3);
  REQUIRE(out.output.find("out") != std::string::npos);
  REQUIRE(out.output.find("err") != std::string::npos);
}

TEST_CASE("posix runner kills commands that exceed the timeout",
          "[executor]") {
  PosixCommandRunner runner;
  auto started = std::chrono::steady_clock::now();
  auto out = runner.run({"sh", "-c", "sleep 5"}, 200ms, "");
  auto elapsed = std::chrono::steady_clock::now() - started;
  REQUIRE(out.timed_out);
  REQUIRE(elapsed < 4s);
}

TEST_CASE("posix runner reports programs that cannot start", "[executor]") {
  PosixCommandRunner runner;
  auto out = runner.run({"gitext-no-such-program-xyz"}, 5s, "");
  REQUIRE(out.spawn_failed);
}

TEST_CASE("posix runner honours the working directory", "[executor]") {
  PosixCommandRunner runner;
  auto out = runner.run({"pwd"}, 5s, "/");
  REQUIRE(out.exit_code == 0);
  REQUIRE(trim(out.output) == "/");
}

TEST_CASE("executor classifies failures", "[executor]") {
  ExecutorOptions options;
  options.git_binary = "sh";
  std::ostringstream echo;
  CommandExecutor executor(options, nullptr, &echo);

  auto ok = executor.execute({"-c", "printf '  hello \\n\\n'"});
  REQUIRE(ok.ok());
  REQUIRE(ok.output == "hello");

  auto failed = executor.execute({"-c", "echo broken; exit 3"});
  REQUIRE_FALSE(failed.ok());
  REQUIRE(failed.error->kind == ExecutionErrorKind::NonZeroExit);
  REQUIRE(failed.error->exit_code == 3);
  REQUIRE(failed.error->output == "broken");

  options.timeout = 200ms;
  CommandExecutor slow(options, nullptr, &echo);
  auto timed_out = slow.execute({"-c", "sleep 5"});
  REQUIRE_FALSE(timed_out.ok());
  REQUIRE(timed_out.error->kind == ExecutionErrorKind::Timeout);
  REQUIRE(echo.str().empty());
}

TEST_CASE("dry-run echoes mutations and still runs queries", "[executor]") {
  auto runner = std::make_shared<test::FakeRunner>();
  runner->ok("status --porcelain", " M file.txt");
  ExecutorOptions options;
  options.dry_run = true;
  std::ostringstream echo;
  CommandExecutor executor(options, runner, &echo);

  auto pushed = executor.execute({"push", "origin", "feature/x"});
  REQUIRE(pushed.ok());
  REQUIRE(pushed.output.empty());
  REQUIRE(echo.str() == "[DRY RUN] git push origin feature/x\n");
  REQUIRE(runner->calls.empty());

  auto status = executor.query({"status", "--porcelain"});
  REQUIRE(status.output == "M file.txt");
  REQUIRE(runner->calls.size() == 1);
}

TEST_CASE("verbose mode echoes the command and its output", "[executor]") {
  auto runner = std::make_shared<test::FakeRunner>();
  runner->fail("pull --ff-only origin stage", 1, "fatal: Not possible");
  ExecutorOptions options;
  options.verbose = true;
  std::ostringstream echo;
  CommandExecutor executor(options, runner, &echo);

  auto result = executor.execute({"pull", "--ff-only", "origin", "stage"});
  REQUIRE_FALSE(result.ok());
  REQUIRE(echo.str() ==
          "$ git pull --ff-only origin stage\nfatal: Not possible\n");
}

TEST_CASE("render_command quotes arguments with spaces", "[executor]") {
  REQUIRE(render_command({"git", "commit", "-m", "fix: it's done"}) ==
          "git commit -m 'fix: it'\\''s done'");
  REQUIRE(render_command({"git", "status"}) == "git status");
}
