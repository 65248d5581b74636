/**
 * @file cli_options.cpp
 * @brief Command line parsing for the planwright tool
 */

#include "cli_options.hpp"
#include <vector>

namespace Planwright::cli {

namespace {

void setUsageError(CliOptions& opts, std::string message) {
  if (opts.usageError.empty()) {
    opts.usageError = std::move(message);
  }
}

// Value of an option that takes one argument, or nullptr when argv ends
const char* optionValue(int argc, char* argv[], int& i, CliOptions& opts) {
  if (i + 1 >= argc) {
    setUsageError(opts, std::string("Missing value for ") + argv[i]);
    return nullptr;
  }
  return argv[++i];
}

} // namespace

CliOptions parseArgs(int argc, char* argv[]) {
  CliOptions opts;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "-h" || arg == "--help") {
      opts.help = true;
    } else if (arg == "--version") {
      opts.version = true;
    } else if (arg == "--include-in-progress") {
      opts.flags[plan::option_keys::IncludeInProgress] = "true";
    } else if (arg == "--no-status") {
      opts.flags[plan::option_keys::IncludeStatus] = "false";
    } else if (arg == "--no-descriptions") {
      opts.flags[plan::option_keys::IncludeDescriptions] = "false";
    } else if (arg == "--set") {
      if (const char* value = optionValue(argc, argv, i, opts)) {
        std::string pair = value;
        auto eq = pair.find('=');
        if (eq == std::string::npos || eq == 0) {
          setUsageError(opts, "--set expects key=value, got '" + pair + "'");
        } else {
          opts.raw[pair.substr(0, eq)] = pair.substr(eq + 1);
        }
      }
    } else if (arg == "--sort") {
      opts.sortOutput = true;
    } else if (arg == "--schema") {
      if (const char* value = optionValue(argc, argv, i, opts)) {
        opts.schemaPath = value;
      }
    } else if (arg == "--log-file") {
      if (const char* value = optionValue(argc, argv, i, opts)) {
        opts.logFile = value;
      }
    } else if (arg == "--log-level") {
      if (const char* value = optionValue(argc, argv, i, opts)) {
        core::LogLevel level = core::LogLevel::Warning;
        if (core::parseLogLevel(value, level)) {
          opts.logLevel = level;
        } else {
          setUsageError(opts, std::string("Unknown log level '") + value + "'");
        }
      }
    } else if (arg == "--verbose" || arg == "-v") {
      opts.verbose = true;
    } else if (arg == "--quiet" || arg == "-q") {
      opts.quiet = true;
    } else if (!arg.empty() && arg[0] == '-') {
      setUsageError(opts, "Unknown option '" + arg + "'");
    } else {
      positional.push_back(arg);
    }
  }

  if (positional.size() == 2) {
    opts.command = positional[0];
    opts.planPath = positional[1];
  } else if (!opts.help && !opts.version) {
    setUsageError(opts, "Expected <command> <plan.xml>");
  }
  return opts;
}

core::LogLevel effectiveLogLevel(const CliOptions& opts) {
  if (opts.logLevel) {
    return *opts.logLevel;
  }
  if (opts.verbose) {
    return core::LogLevel::Debug;
  }
  if (opts.quiet) {
    return core::LogLevel::Error;
  }
  return core::LogLevel::Warning;
}

} // namespace Planwright::cli
