/**
 * @file renderers.cpp
 * @brief Outline, flowchart and DOT renderers
 */

#include "Planwright/plan/renderers.hpp"
#include <sstream>
#include <unordered_set>
#include <utility>
#include <vector>

namespace Planwright::plan {

namespace {

void appendLine(std::string& out, const std::string& line) {
  if (!out.empty()) {
    out += '\n';
  }
  out += line;
}

bool isHierarchyRoot(const DependencyGraph& graph, const std::string& id) {
  return graph.successors(id, EdgeType::ComponentOf).empty();
}

std::string flowchartEndpoint(const DependencyGraph& graph, const std::string& id,
                              bool withDescription) {
  if (!withDescription) {
    return id;
  }
  const PlanNode* node = graph.findNode(id);
  if (node == nullptr) {
    return id;
  }
  return id + "[" + infoOf(*node).description + "]";
}

std::string escapeDot(const std::string& text) {
  std::string escaped;
  escaped.reserve(text.size());
  for (char c : text) {
    if (c == '"' || c == '\\') {
      escaped += '\\';
      escaped += c;
    } else if (c == '\n') {
      escaped += "\\n";
    } else {
      escaped += c;
    }
  }
  return escaped;
}

} // namespace

std::string renderOutline(const DependencyGraph& graph, const OutlineOptions& options) {
  std::string out;
  std::unordered_set<std::string> visited;

  // (id, depth); children are pushed in reverse so they pop in edge order
  std::vector<std::pair<std::string, usize>> stack;

  for (const auto& rootId : graph.nodeIds()) {
    if (!isHierarchyRoot(graph, rootId)) {
      continue;
    }
    stack.emplace_back(rootId, 0);

    while (!stack.empty()) {
      auto [id, depth] = std::move(stack.back());
      stack.pop_back();

      if (!visited.insert(id).second) {
        continue;
      }

      const PlanNode* node = graph.findNode(id);
      if (node == nullptr) {
        continue;
      }
      const NodeInfo& info = infoOf(*node);

      std::string line(depth * 2, ' ');
      line += "- " + info.id + ": " + info.description;
      if (options.includeStatus) {
        line += std::string(" (") + statusToString(info.status) + ")";
      }
      appendLine(out, line);

      const auto childIds = graph.predecessors(id, EdgeType::ComponentOf);
      for (auto it = childIds.rbegin(); it != childIds.rend(); ++it) {
        if (visited.find(*it) == visited.end()) {
          stack.emplace_back(*it, depth + 1);
        }
      }
    }
  }

  return out;
}

std::string renderFlowchart(const DependencyGraph& graph, const FlowchartOptions& options) {
  std::ostringstream out;
  out << "graph TD";
  for (const auto& edge : graph.edges()) {
    const char* arrow = edge.type == EdgeType::DependsOn ? "-.->" : "-->";
    out << "\n    " << flowchartEndpoint(graph, edge.source, options.includeDescriptions) << ' '
        << arrow << ' ' << flowchartEndpoint(graph, edge.target, options.includeDescriptions);
  }
  return out.str();
}

std::string renderDot(const DependencyGraph& graph, const DotOptions& options) {
  std::ostringstream out;
  out << "digraph {";

  if (options.includeDescriptions) {
    for (const auto& id : graph.nodeIds()) {
      const PlanNode* node = graph.findNode(id);
      if (node == nullptr) {
        continue;
      }
      out << "\n    \"" << escapeDot(id) << "\" [label=\""
          << escapeDot(infoOf(*node).description) << "\"];";
    }
  }

  for (const auto& edge : graph.edges()) {
    out << "\n    \"" << escapeDot(edge.source) << "\" -> \"" << escapeDot(edge.target) << '"';
    if (edge.type == EdgeType::DependsOn) {
      out << " [style=dashed]";
    }
    out << ';';
  }

  out << "\n}";
  return out.str();
}

} // namespace Planwright::plan
