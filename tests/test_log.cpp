#include "log.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <spdlog/spdlog.h>

namespace {
std::string read_file(const char *path) {
  std::ifstream f(path);
  return std::string((std::istreambuf_iterator<char>(f)),
                     std::istreambuf_iterator<char>());
}
} // namespace

TEST_CASE("test log") {
  const char *path = "gitext_test.log";
  std::remove(path);
  gitext::init_logger(spdlog::level::info, "", path);
  spdlog::debug("debug message");
  spdlog::info("info message");
  spdlog::default_logger()->flush();
  auto content = read_file(path);
  REQUIRE(content.find("info message") != std::string::npos);
  REQUIRE(content.find("debug message") == std::string::npos);
  gitext::init_logger(spdlog::level::warn);
  std::remove(path);
}

TEST_CASE("category loggers share sinks and take overrides") {
  const char *path = "gitext_category.log";
  std::remove(path);
  auto early = gitext::category_logger("workflow");
  gitext::init_logger(spdlog::level::warn, "%n %v", path, 0);
  gitext::configure_log_categories({{"workflow", spdlog::level::debug}});
  auto workflow = gitext::category_logger("workflow");
  REQUIRE(workflow.get() == early.get());
  workflow->debug("rebasing feature");
  gitext::category_logger("executor")->debug("hidden detail");
  workflow->flush();
  auto content = read_file(path);
  REQUIRE(content.find("gitext.workflow rebasing feature") !=
          std::string::npos);
  REQUIRE(content.find("hidden detail") == std::string::npos);
  gitext::init_logger(spdlog::level::warn);
  std::remove(path);
}

TEST_CASE("unknown categories are applied with a warning") {
  const auto &known = gitext::known_log_categories();
  REQUIRE(std::find(known.begin(), known.end(), "executor") != known.end());

  const char *path = "gitext_unknown_category.log";
  std::remove(path);
  gitext::init_logger(spdlog::level::warn, "%n %v", path, 0);
  gitext::configure_log_categories({{"exector", spdlog::level::debug}});
  REQUIRE(gitext::category_logger("exector")->level() == spdlog::level::debug);
  gitext::category_logger("logging")->flush();
  auto content = read_file(path);
  REQUIRE(content.find("gitext.logging Unknown log category 'exector'") !=
          std::string::npos);
  gitext::init_logger(spdlog::level::warn);
  std::remove(path);
}
