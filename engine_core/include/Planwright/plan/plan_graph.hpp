#pragma once

/**
 * @file plan_graph.hpp
 * @brief Plan dependency engine: build, query and render
 *
 * Build pipeline: load document -> schema validation -> parse -> graph.
 * Any load or validation failure aborts the build and leaves the previously
 * built Plan and graph untouched. A successful build replaces both
 * wholesale.
 *
 * Example usage:
 * @code
 * PlanGraph plans;
 * auto built = plans.buildFromXml("plan.xml");
 * if (built.isError()) {
 *     std::cerr << built.error().format() << std::endl;
 *     return 1;
 * }
 * for (const auto& id : plans.getReadyTasks(ReadyTasksOptions{})) {
 *     std::cout << id << "\n";
 * }
 * std::cout << plans.toOutline(OutlineOptions{}) << std::endl;
 * @endcode
 *
 * Not thread-safe; serialize builds and only read after a build completes.
 */

#include "Planwright/plan/dependency_graph.hpp"
#include "Planwright/plan/options.hpp"
#include "Planwright/plan/plan_error.hpp"
#include "Planwright/plan/plan_parser.hpp"
#include "Planwright/plan/schema_validator.hpp"
#include <optional>
#include <string>
#include <vector>

namespace Planwright::plan {

class PlanGraph {
public:
  PlanGraph();
  explicit PlanGraph(std::string schemaPath);
  ~PlanGraph();

  PlanGraph(const PlanGraph&) = delete;
  PlanGraph& operator=(const PlanGraph&) = delete;

  /**
   * @brief Validate a plan file against the schema without building
   */
  [[nodiscard]] PlanResult<void> validateXml(const std::string& path);

  /**
   * @brief Rebuild the plan and graph from a plan file
   */
  [[nodiscard]] PlanResult<void> buildFromXml(const std::string& path);

  /**
   * @brief Rebuild the plan and graph from XML text
   * @param sourceName Name used in diagnostics
   */
  [[nodiscard]] PlanResult<void> buildFromString(const std::string& xml,
                                                 const std::string& sourceName = "<memory>");

  [[nodiscard]] const DependencyGraph& graph() const { return m_graph; }

  /**
   * @brief Hierarchy from the last successful build, if any
   */
  [[nodiscard]] const std::optional<Plan>& plan() const { return m_plan; }

  /**
   * @brief Elements the parser dropped during the last successful build
   */
  [[nodiscard]] const std::vector<DroppedElement>& droppedElements() const { return m_dropped; }

  [[nodiscard]] std::vector<std::string> getReadyTasks(const ReadyTasksOptions& options) const;
  [[nodiscard]] std::string toOutline(const OutlineOptions& options) const;
  [[nodiscard]] std::string toFlowchart(const FlowchartOptions& options) const;
  [[nodiscard]] std::string toDot(const DotOptions& options) const;

  // Raw-option overloads: the map is shape-checked before the graph is read
  [[nodiscard]] PlanResult<std::vector<std::string>> getReadyTasks(const OptionMap& raw) const;
  [[nodiscard]] PlanResult<std::string> toOutline(const OptionMap& raw) const;
  [[nodiscard]] PlanResult<std::string> toFlowchart(const OptionMap& raw) const;
  [[nodiscard]] PlanResult<std::string> toDot(const OptionMap& raw) const;

private:
  PlanResult<void> buildFromDocument(PlanResult<XmlDocumentPtr> loaded,
                                     const std::string& sourceName);

  SchemaValidator m_validator;
  PlanParser m_parser;
  std::optional<Plan> m_plan;
  DependencyGraph m_graph;
  std::vector<DroppedElement> m_dropped;
};

} // namespace Planwright::plan
