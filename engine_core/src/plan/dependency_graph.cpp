/**
 * @file dependency_graph.cpp
 * @brief Graph storage and plan flattening
 */

#include "Planwright/plan/dependency_graph.hpp"
#include "Planwright/core/logger.hpp"
#include <algorithm>

namespace Planwright::plan {

const char* edgeTypeToString(EdgeType type) {
  switch (type) {
  case EdgeType::ComponentOf:
    return "component_of";
  case EdgeType::DependsOn:
    return "depends_on";
  }
  return "unknown";
}

bool DependencyGraph::addNode(PlanNode node) {
  std::string id = infoOf(node).id;
  auto it = m_nodes.find(id);
  if (it != m_nodes.end()) {
    it->second = std::move(node);
    return false;
  }
  m_nodes.emplace(id, std::move(node));
  m_nodeOrder.push_back(std::move(id));
  return true;
}

bool DependencyGraph::addEdge(const std::string& source, const std::string& target,
                              EdgeType type) {
  if (hasEdge(source, target, type)) {
    return false;
  }
  const usize index = m_edges.size();
  m_edges.push_back(Edge{source, target, type});
  m_outgoing[source].push_back(index);
  m_incoming[target].push_back(index);
  return true;
}

void DependencyGraph::clear() {
  m_nodes.clear();
  m_nodeOrder.clear();
  m_edges.clear();
  m_outgoing.clear();
  m_incoming.clear();
}

bool DependencyGraph::contains(const std::string& id) const {
  return m_nodes.find(id) != m_nodes.end();
}

const PlanNode* DependencyGraph::findNode(const std::string& id) const {
  auto it = m_nodes.find(id);
  return it == m_nodes.end() ? nullptr : &it->second;
}

std::vector<std::string> DependencyGraph::successors(const std::string& id, EdgeType type) const {
  std::vector<std::string> result;
  auto it = m_outgoing.find(id);
  if (it == m_outgoing.end()) {
    return result;
  }
  for (usize index : it->second) {
    if (m_edges[index].type == type) {
      result.push_back(m_edges[index].target);
    }
  }
  return result;
}

std::vector<std::string> DependencyGraph::predecessors(const std::string& id,
                                                       EdgeType type) const {
  std::vector<std::string> result;
  auto it = m_incoming.find(id);
  if (it == m_incoming.end()) {
    return result;
  }
  for (usize index : it->second) {
    if (m_edges[index].type == type) {
      result.push_back(m_edges[index].source);
    }
  }
  return result;
}

bool DependencyGraph::hasEdge(const std::string& source, const std::string& target) const {
  auto it = m_outgoing.find(source);
  if (it == m_outgoing.end()) {
    return false;
  }
  return std::any_of(it->second.begin(), it->second.end(),
                     [&](usize index) { return m_edges[index].target == target; });
}

bool DependencyGraph::hasEdge(const std::string& source, const std::string& target,
                              EdgeType type) const {
  auto it = m_outgoing.find(source);
  if (it == m_outgoing.end()) {
    return false;
  }
  return std::any_of(it->second.begin(), it->second.end(), [&](usize index) {
    return m_edges[index].target == target && m_edges[index].type == type;
  });
}

usize DependencyGraph::countNodes(NodeKind kind) const {
  return static_cast<usize>(std::count_if(m_nodeOrder.begin(), m_nodeOrder.end(),
                                          [&](const std::string& id) {
                                            return kindOf(m_nodes.at(id)) == kind;
                                          }));
}

usize DependencyGraph::countEdges(EdgeType type) const {
  return static_cast<usize>(std::count_if(m_edges.begin(), m_edges.end(),
                                          [&](const Edge& edge) { return edge.type == type; }));
}

namespace {

void addPlanNode(DependencyGraph& graph, PlanNode node) {
  const std::string id = infoOf(node).id;
  if (!graph.addNode(std::move(node))) {
    PLANWRIGHT_LOG_WARN("[PlanGraph] Duplicate id '" + id + "', keeping the last definition");
  }
}

} // namespace

DependencyGraph buildGraph(const Plan& plan) {
  DependencyGraph graph;
  for (const auto& epic : plan.epics) {
    addPlanNode(graph, epic);
    for (const auto& story : epic.stories) {
      addPlanNode(graph, story);
      graph.addEdge(story.info.id, epic.info.id, EdgeType::ComponentOf);
      for (const auto& task : story.tasks) {
        addPlanNode(graph, task);
        graph.addEdge(task.info.id, story.info.id, EdgeType::ComponentOf);
        for (const auto& dependency : task.dependsOn) {
          graph.addEdge(task.info.id, dependency, EdgeType::DependsOn);
        }
      }
    }
  }
  return graph;
}

} // namespace Planwright::plan
