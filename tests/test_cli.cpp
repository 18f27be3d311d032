#include "cli.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <string>
#include <vector>

using namespace gitext;

namespace {
CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "gitext");
  std::vector<char *> argv;
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  return parse_cli(static_cast<int>(argv.size()), argv.data());
}

int parse_exit_code(std::vector<std::string> args) {
  try {
    parse(std::move(args));
  } catch (const CliParseExit &e) {
    return e.exit_code();
  }
  return -1;
}
} // namespace

TEST_CASE("global flags before or after the subcommand", "[cli]") {
  auto before = parse({"--dry-run", "-v", "status"});
  REQUIRE(before.command == Command::Status);
  REQUIRE(before.dry_run);
  REQUIRE(before.verbose);

  auto after = parse({"status", "-n", "--config", "cfg.yaml"});
  REQUIRE(after.dry_run);
  REQUIRE_FALSE(after.verbose);
  REQUIRE(after.config_file == "cfg.yaml");
}

TEST_CASE("sync takes a protected target", "[cli]") {
  auto opts = parse({"sync", "production"});
  REQUIRE(opts.command == Command::Sync);
  REQUIRE(opts.target == "production");
  REQUIRE(parse_exit_code({"sync", "main"}) != 0);
  REQUIRE(parse_exit_code({"sync"}) != 0);
}

TEST_CASE("start feature requires ticket, slug and source", "[cli]") {
  auto opts = parse({"start", "feature", "--ticket", "ABC-123", "--slug",
                     "login", "--from", "production"});
  REQUIRE(opts.command == Command::Start);
  REQUIRE(opts.ticket == "ABC-123");
  REQUIRE(opts.slug == "login");
  REQUIRE(opts.from == "production");
  REQUIRE(parse_exit_code({"start", "feature", "--ticket", "ABC-1", "--from",
                           "stage"}) != 0);
  REQUIRE(parse_exit_code({"start", "bugfix", "--ticket", "A-1", "--slug",
                           "x", "--from", "stage"}) != 0);
}

TEST_CASE("update defaults to rebase", "[cli]") {
  auto opts = parse({"update", "feature", "--with", "stage"});
  REQUIRE(opts.command == Command::Update);
  REQUIRE(opts.with == "stage");
  REQUIRE(opts.mode == "rebase");
  auto merge = parse({"update", "feature", "--with", "production", "--mode",
                      "merge"});
  REQUIRE(merge.mode == "merge");
  REQUIRE(parse_exit_code({"update", "feature", "--with", "stage", "--mode",
                           "squash"}) != 0);
}

TEST_CASE("retarget flags", "[cli]") {
  auto opts = parse({"retarget", "feature"});
  REQUIRE(opts.command == Command::Retarget);
  REQUIRE(opts.onto == "production");
  REQUIRE(opts.from == "stage");
  REQUIRE_FALSE(opts.override_pattern);
  REQUIRE_FALSE(opts.acknowledge_shared);
  auto forced = parse({"retarget", "feature", "--override",
                       "--i-know-what-im-doing"});
  REQUIRE(forced.override_pattern);
  REQUIRE(forced.acknowledge_shared);
}

TEST_CASE("remaining subcommands", "[cli]") {
  REQUIRE(parse({"cleanup"}).command == Command::Cleanup);
  REQUIRE_FALSE(parse({"cleanup"}).hard);
  REQUIRE(parse({"cleanup", "--hard"}).hard);

  auto pr = parse({"prepare", "pr", "--to", "stage"});
  REQUIRE(pr.command == Command::PreparePr);
  REQUIRE(pr.to == "stage");

  auto commit = parse({"commit"});
  REQUIRE(commit.command == Command::Commit);
  REQUIRE_FALSE(commit.message.has_value());
  REQUIRE(parse({"commit", "-m", "Fix login"}).message == "Fix login");

  auto init = parse({"init", "--install-hooks"});
  REQUIRE(init.command == Command::Init);
  REQUIRE(init.install_hooks);
}

TEST_CASE("timeout accepts durations", "[cli]") {
  auto opts = parse({"--timeout", "2m", "status"});
  REQUIRE(opts.timeout == std::chrono::minutes(2));
  REQUIRE(parse({"-t", "1500ms", "status"}).timeout ==
          std::chrono::milliseconds(1500));
  REQUIRE_FALSE(parse({"status"}).timeout.has_value());
  REQUIRE(parse_exit_code({"--timeout", "soon", "status"}) != 0);
  REQUIRE(parse_exit_code({"--timeout", "0s", "status"}) != 0);
}

TEST_CASE("logging options", "[cli]") {
  auto opts = parse({"-G", "debug", "-F", "gitext.log", "--log-rotate", "5",
                     "--log-category", "executor=trace", "--log-category",
                     "workflow", "status"});
  REQUIRE(opts.log_level == "debug");
  REQUIRE(opts.log_file == "gitext.log");
  REQUIRE(opts.log_rotate == 5);
  REQUIRE(opts.log_rotate_explicit);
  REQUIRE(opts.log_categories_explicit);
  REQUIRE(opts.log_categories.at("executor") == "trace");
  REQUIRE(opts.log_categories.at("workflow") == "debug");
  REQUIRE(parse_exit_code({"--log-rotate", "-1", "status"}) != 0);
}

TEST_CASE("missing subcommand and help exit through CliParseExit", "[cli]") {
  REQUIRE(parse_exit_code({}) != 0);
  REQUIRE(parse_exit_code({"--help"}) == 0);
  REQUIRE(parse_exit_code({"--version"}) == 0);
  REQUIRE(parse_exit_code({"frobnicate"}) != 0);
}
