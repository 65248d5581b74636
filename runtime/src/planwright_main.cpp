/**
 * @file planwright_main.cpp
 * @brief Planwright CLI - Main Entry Point
 *
 * Usage:
 *   planwright validate plan.xml
 *   planwright ready plan.xml --include-in-progress
 *   planwright outline plan.xml --no-status
 *   planwright flowchart plan.xml
 *   planwright dot plan.xml --no-descriptions
 *   planwright summary plan.xml
 */

#include "Planwright/core/logger.hpp"
#include "Planwright/plan/plan_graph.hpp"
#include "cli_options.hpp"
#include <algorithm>
#include <iostream>
#include <string>
#include <vector>

#ifndef PLANWRIGHT_VERSION_MAJOR
#define PLANWRIGHT_VERSION_MAJOR 0
#define PLANWRIGHT_VERSION_MINOR 1
#define PLANWRIGHT_VERSION_PATCH 0
#endif

namespace {

using namespace Planwright;
using cli::CliOptions;

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printVersion() {
  std::cout << "planwright version " << PLANWRIGHT_VERSION_MAJOR << "."
            << PLANWRIGHT_VERSION_MINOR << "." << PLANWRIGHT_VERSION_PATCH << "\n";
}

void printHelp(const char* programName) {
  std::cout << "Usage: " << programName << " [options] <command> <plan.xml>\n\n";
  std::cout << "Commands:\n";
  std::cout << "  validate            Check the plan against the schema\n";
  std::cout << "  ready               List tasks that can be started now\n";
  std::cout << "  outline             Print the epic/story/task hierarchy\n";
  std::cout << "  flowchart           Print a Mermaid flowchart\n";
  std::cout << "  dot                 Print a Graphviz digraph\n";
  std::cout << "  summary             Print node/edge counts and dropped elements\n\n";
  std::cout << "Options:\n";
  std::cout << "  --include-in-progress  ready: also list in-progress tasks\n";
  std::cout << "  --no-status            outline: omit the status suffix\n";
  std::cout << "  --no-descriptions      flowchart/dot: omit descriptions\n";
  std::cout << "  --set <key=value>      Pass a raw option to the command\n";
  std::cout << "  --sort                 ready: sort ids\n";
  std::cout << "  --schema <path>        Use a different plan.xsd\n";
  std::cout << "  --log-file <path>      Also write log output to a file\n";
  std::cout << "  --log-level <level>    trace, debug, info, warning, error, fatal or off\n";
  std::cout << "  -v, --verbose          Verbose logging\n";
  std::cout << "  -q, --quiet            Only log errors\n";
  std::cout << "  -h, --help             Show this help message\n";
  std::cout << "  --version              Show version information\n";
}

void initializeLogging(const CliOptions& opts) {
  auto& logger = core::Logger::instance();

  logger.setLevel(cli::effectiveLogLevel(opts));

  if (!opts.logFile.empty() && !logger.setOutputFile(opts.logFile)) {
    PLANWRIGHT_LOG_WARN("[CLI] Could not open log file " + opts.logFile);
  }
}

int reportError(const plan::PlanError& error) {
  std::cerr << "Error: " << error.format() << "\n";
  return kExitFailure;
}

template <typename T> int printResult(const plan::PlanResult<T>& result) {
  if (result.isError()) {
    return reportError(result.error());
  }
  std::cout << result.value() << "\n";
  return kExitOk;
}

int printSummary(const plan::PlanGraph& plans) {
  const auto& graph = plans.graph();
  std::cout << "version: " << (plans.plan() ? plans.plan()->version : std::string("-")) << "\n";
  std::cout << "epics: " << graph.countNodes(plan::NodeKind::Epic) << "\n";
  std::cout << "stories: " << graph.countNodes(plan::NodeKind::Story) << "\n";
  std::cout << "tasks: " << graph.countNodes(plan::NodeKind::Task) << "\n";
  std::cout << "component_of edges: " << graph.countEdges(plan::EdgeType::ComponentOf) << "\n";
  std::cout << "depends_on edges: " << graph.countEdges(plan::EdgeType::DependsOn) << "\n";
  std::cout << "dropped: " << plans.droppedElements().size() << "\n";
  for (const auto& dropped : plans.droppedElements()) {
    std::cout << "  " << plan::nodeKindToString(dropped.kind) << " '" << dropped.id
              << "': " << dropped.reason << "\n";
  }
  return kExitOk;
}

plan::OptionMap optionsFor(const CliOptions& opts, const std::string& key) {
  plan::OptionMap merged = opts.raw;
  auto flag = opts.flags.find(key);
  if (flag != opts.flags.end()) {
    merged.insert(*flag);
  }
  return merged;
}

int runCommand(const CliOptions& opts) {
  plan::PlanGraph plans(opts.schemaPath.empty() ? plan::SchemaValidator::defaultSchemaPath()
                                                : opts.schemaPath);

  if (opts.command == "validate") {
    auto valid = plans.validateXml(opts.planPath);
    if (valid.isError()) {
      return reportError(valid.error());
    }
    std::cout << opts.planPath << ": valid\n";
    return kExitOk;
  }

  static const std::vector<std::string> kGraphCommands = {"ready", "outline", "flowchart", "dot",
                                                          "summary"};
  if (std::find(kGraphCommands.begin(), kGraphCommands.end(), opts.command) ==
      kGraphCommands.end()) {
    std::cerr << "Error: unknown command '" << opts.command << "'\n";
    return kExitUsage;
  }

  auto built = plans.buildFromXml(opts.planPath);
  if (built.isError()) {
    return reportError(built.error());
  }

  if (opts.command == "ready") {
    auto ready = plans.getReadyTasks(optionsFor(opts, plan::option_keys::IncludeInProgress));
    if (ready.isError()) {
      return reportError(ready.error());
    }
    auto ids = ready.value();
    if (opts.sortOutput) {
      std::sort(ids.begin(), ids.end());
    }
    for (const auto& id : ids) {
      std::cout << id << "\n";
    }
    return kExitOk;
  }
  if (opts.command == "outline") {
    return printResult(plans.toOutline(optionsFor(opts, plan::option_keys::IncludeStatus)));
  }
  if (opts.command == "flowchart") {
    return printResult(plans.toFlowchart(optionsFor(opts, plan::option_keys::IncludeDescriptions)));
  }
  if (opts.command == "dot") {
    return printResult(plans.toDot(optionsFor(opts, plan::option_keys::IncludeDescriptions)));
  }
  return printSummary(plans);
}

int runPlanwright(int argc, char* argv[]) {
  CliOptions opts = cli::parseArgs(argc, argv);

  if (opts.help) {
    printHelp(argv[0]);
    return kExitOk;
  }
  if (opts.version) {
    printVersion();
    return kExitOk;
  }
  if (!opts.usageError.empty()) {
    std::cerr << "Error: " << opts.usageError << "\n\n";
    printHelp(argv[0]);
    return kExitUsage;
  }

  initializeLogging(opts);
  return runCommand(opts);
}

} // namespace

int main(int argc, char* argv[]) {
  return runPlanwright(argc, argv);
}
