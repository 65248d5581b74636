/**
 * @file plan_graph.cpp
 * @brief PlanGraph implementation
 */

#include "Planwright/plan/plan_graph.hpp"
#include "Planwright/core/logger.hpp"
#include "Planwright/plan/ready_tasks.hpp"
#include "Planwright/plan/renderers.hpp"

namespace Planwright::plan {

PlanGraph::PlanGraph() : m_validator(SchemaValidator::defaultSchemaPath()) {}

PlanGraph::PlanGraph(std::string schemaPath) : m_validator(std::move(schemaPath)) {}

PlanGraph::~PlanGraph() = default;

PlanResult<void> PlanGraph::validateXml(const std::string& path) {
  return m_validator.validate(path);
}

PlanResult<void> PlanGraph::buildFromXml(const std::string& path) {
  return buildFromDocument(loadXmlDocument(path), path);
}

PlanResult<void> PlanGraph::buildFromString(const std::string& xml,
                                            const std::string& sourceName) {
  return buildFromDocument(loadXmlDocumentFromString(xml, sourceName), sourceName);
}

PlanResult<void> PlanGraph::buildFromDocument(PlanResult<XmlDocumentPtr> loaded,
                                              const std::string& sourceName) {
  if (loaded.isError()) {
    PLANWRIGHT_LOG_ERROR("[PlanGraph] Build failed: " + loaded.error().format());
    return PlanResult<void>::error(loaded.error());
  }

  xmlDoc& doc = *loaded.value();
  auto valid = m_validator.validateDocument(doc);
  if (valid.isError()) {
    PLANWRIGHT_LOG_ERROR("[PlanGraph] Build failed: " + valid.error().format());
    return valid;
  }

  ParseOutcome outcome = m_parser.parse(doc);
  DependencyGraph graph = buildGraph(outcome.plan);

  // Only replace state once the new build is complete
  m_graph = std::move(graph);
  m_plan = std::move(outcome.plan);
  m_dropped = std::move(outcome.dropped);

  PLANWRIGHT_LOG_INFO("[PlanGraph] Built " + sourceName + ": " +
                      std::to_string(m_graph.nodeCount()) + " nodes, " +
                      std::to_string(m_graph.edgeCount()) + " edges, " +
                      std::to_string(m_dropped.size()) + " dropped elements");
  return PlanResult<void>::ok();
}

std::vector<std::string> PlanGraph::getReadyTasks(const ReadyTasksOptions& options) const {
  return findReadyTasks(m_graph, options);
}

std::string PlanGraph::toOutline(const OutlineOptions& options) const {
  return renderOutline(m_graph, options);
}

std::string PlanGraph::toFlowchart(const FlowchartOptions& options) const {
  return renderFlowchart(m_graph, options);
}

std::string PlanGraph::toDot(const DotOptions& options) const {
  return renderDot(m_graph, options);
}

PlanResult<std::vector<std::string>> PlanGraph::getReadyTasks(const OptionMap& raw) const {
  auto options = readyTasksOptionsFrom(raw);
  if (options.isError()) {
    return PlanResult<std::vector<std::string>>::error(options.error());
  }
  return PlanResult<std::vector<std::string>>::ok(getReadyTasks(options.value()));
}

PlanResult<std::string> PlanGraph::toOutline(const OptionMap& raw) const {
  auto options = outlineOptionsFrom(raw);
  if (options.isError()) {
    return PlanResult<std::string>::error(options.error());
  }
  return PlanResult<std::string>::ok(toOutline(options.value()));
}

PlanResult<std::string> PlanGraph::toFlowchart(const OptionMap& raw) const {
  auto options = flowchartOptionsFrom(raw);
  if (options.isError()) {
    return PlanResult<std::string>::error(options.error());
  }
  return PlanResult<std::string>::ok(toFlowchart(options.value()));
}

PlanResult<std::string> PlanGraph::toDot(const OptionMap& raw) const {
  auto options = dotOptionsFrom(raw);
  if (options.isError()) {
    return PlanResult<std::string>::error(options.error());
  }
  return PlanResult<std::string>::ok(toDot(options.value()));
}

} // namespace Planwright::plan
