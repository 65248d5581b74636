#pragma once

/**
 * @file cli_options.hpp
 * @brief Command line parsing for the planwright tool
 */

#include "Planwright/core/logger.hpp"
#include "Planwright/plan/options.hpp"
#include <optional>
#include <string>

namespace Planwright::cli {

struct CliOptions {
  std::string command;
  std::string planPath;
  std::string schemaPath;
  std::string logFile;
  plan::OptionMap flags; // From the typed flags; each command takes only its own key
  plan::OptionMap raw;   // From --set; forwarded as-is and shape-checked by the engine
  std::optional<core::LogLevel> logLevel; // --log-level, overrides -v/-q
  bool sortOutput = false;
  bool verbose = false;
  bool quiet = false;
  bool help = false;
  bool version = false;
  std::string usageError; // First usage problem found, empty if none
};

[[nodiscard]] CliOptions parseArgs(int argc, char* argv[]);

/**
 * @brief Level the logger should run at for these options
 */
[[nodiscard]] core::LogLevel effectiveLogLevel(const CliOptions& opts);

} // namespace Planwright::cli
