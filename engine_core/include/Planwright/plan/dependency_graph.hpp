#pragma once

/**
 * @file dependency_graph.hpp
 * @brief Directed graph over plan nodes with two edge kinds
 *
 * Nodes live in an arena keyed by id; edges are kept in insertion order and
 * indexed by source and target for O(degree) lookups. Edge targets are not
 * required to be nodes: a DependsOn edge may point at an id the plan never
 * defined.
 *
 * Iteration over nodes and edges follows insertion order, so rendering the
 * same graph always yields the same text.
 */

#include "Planwright/plan/node.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace Planwright::plan {

enum class EdgeType : u8 {
  ComponentOf, // child -> parent (Task -> Story, Story -> Epic)
  DependsOn    // Task -> dependency id
};

[[nodiscard]] const char* edgeTypeToString(EdgeType type);

struct Edge {
  std::string source;
  std::string target;
  EdgeType type = EdgeType::ComponentOf;

  bool operator==(const Edge&) const = default;
};

class DependencyGraph {
public:
  /**
   * @brief Insert a node under its id
   *
   * A node whose id is already present replaces the stored node; the id
   * keeps its original position in nodeIds().
   * @return false if the id was already present
   */
  bool addNode(PlanNode node);

  /**
   * @brief Insert an edge
   * @return false if an identical edge (source, target, type) already exists
   */
  bool addEdge(const std::string& source, const std::string& target, EdgeType type);

  void clear();

  [[nodiscard]] bool contains(const std::string& id) const;

  /**
   * @brief Existence-checked lookup
   * @return nullptr when no node has this id
   */
  [[nodiscard]] const PlanNode* findNode(const std::string& id) const;

  [[nodiscard]] const std::vector<std::string>& nodeIds() const { return m_nodeOrder; }
  [[nodiscard]] const std::vector<Edge>& edges() const { return m_edges; }

  [[nodiscard]] usize nodeCount() const { return m_nodeOrder.size(); }
  [[nodiscard]] usize edgeCount() const { return m_edges.size(); }
  [[nodiscard]] bool empty() const { return m_nodeOrder.empty(); }

  /**
   * @brief Targets of @p id's outgoing edges of the given type
   */
  [[nodiscard]] std::vector<std::string> successors(const std::string& id, EdgeType type) const;

  /**
   * @brief Sources of edges of the given type pointing at @p id
   */
  [[nodiscard]] std::vector<std::string> predecessors(const std::string& id,
                                                      EdgeType type) const;

  [[nodiscard]] bool hasEdge(const std::string& source, const std::string& target) const;
  [[nodiscard]] bool hasEdge(const std::string& source, const std::string& target,
                             EdgeType type) const;

  [[nodiscard]] usize countNodes(NodeKind kind) const;
  [[nodiscard]] usize countEdges(EdgeType type) const;

private:
  std::unordered_map<std::string, PlanNode> m_nodes;
  std::vector<std::string> m_nodeOrder;

  std::vector<Edge> m_edges;
  std::unordered_map<std::string, std::vector<usize>> m_outgoing;
  std::unordered_map<std::string, std::vector<usize>> m_incoming;
};

/**
 * @brief Flatten a plan into a fresh graph
 *
 * Adds every epic, story and task as a node, ComponentOf edges from each
 * child to its parent and a DependsOn edge for every dependency entry.
 * Dependency targets are not checked. A repeated id keeps its first position
 * but takes the data of its last definition.
 */
[[nodiscard]] DependencyGraph buildGraph(const Plan& plan);

} // namespace Planwright::plan
