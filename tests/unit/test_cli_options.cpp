/**
 * @file test_cli_options.cpp
 * @brief Unit tests for planwright command line parsing
 */

#include "cli_options.hpp"
#include <catch2/catch_test_macros.hpp>
#include <string>
#include <vector>

using namespace Planwright;
using namespace Planwright::cli;

namespace {

CliOptions parse(std::vector<std::string> args) {
  args.insert(args.begin(), "planwright");
  std::vector<char*> argv;
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return parseArgs(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST_CASE("parseArgs reads command, plan and flags", "[cli]") {
  auto opts = parse({"ready", "plan.xml", "--include-in-progress", "--sort", "--schema",
                     "custom.xsd", "--set", "include_status=false"});

  CHECK(opts.usageError.empty());
  CHECK(opts.command == "ready");
  CHECK(opts.planPath == "plan.xml");
  CHECK(opts.sortOutput);
  CHECK(opts.schemaPath == "custom.xsd");
  CHECK(opts.flags.at("include_in_progress") == "true");
  CHECK(opts.raw.at("include_status") == "false");
}

TEST_CASE("Options missing their value are usage errors", "[cli]") {
  for (const char* option : {"--set", "--schema", "--log-file", "--log-level"}) {
    auto opts = parse({"outline", "plan.xml", option});
    INFO(option);
    CHECK(opts.usageError == std::string("Missing value for ") + option);
  }
}

TEST_CASE("Malformed --set and unknown options are usage errors", "[cli]") {
  CHECK(parse({"outline", "plan.xml", "--set", "=true"}).usageError ==
        "--set expects key=value, got '=true'");
  CHECK(parse({"outline", "plan.xml", "--colour"}).usageError == "Unknown option '--colour'");
  CHECK(parse({"outline"}).usageError == "Expected <command> <plan.xml>");
  CHECK(parse({"--help"}).usageError.empty());
}

TEST_CASE("Log level follows --log-level, then -v and -q", "[cli]") {
  CHECK(effectiveLogLevel(parse({"dot", "plan.xml"})) == core::LogLevel::Warning);
  CHECK(effectiveLogLevel(parse({"dot", "plan.xml", "-v"})) == core::LogLevel::Debug);
  CHECK(effectiveLogLevel(parse({"dot", "plan.xml", "-q"})) == core::LogLevel::Error);

  auto explicitLevel = parse({"dot", "plan.xml", "-v", "--log-level", "off"});
  REQUIRE(explicitLevel.usageError.empty());
  CHECK(effectiveLogLevel(explicitLevel) == core::LogLevel::Off);

  auto unknown = parse({"dot", "plan.xml", "--log-level", "loud"});
  CHECK(unknown.usageError == "Unknown log level 'loud'");
}
