#pragma once

/**
 * @file renderers.hpp
 * @brief Text renderings of a built plan graph
 *
 * All renderers are pure: they only read the graph, and the same graph
 * always renders to the same bytes.
 */

#include "Planwright/plan/dependency_graph.hpp"
#include "Planwright/plan/options.hpp"
#include <string>

namespace Planwright::plan {

/**
 * @brief Nested bullet list of the containment hierarchy
 *
 * Roots are nodes without an outgoing ComponentOf edge. Each node is written
 * once as "<2*depth spaces>- id: description", followed by " (status)" when
 * options.includeStatus is set. A node reachable twice (or through a cycle)
 * is only emitted at its first visit.
 */
[[nodiscard]] std::string renderOutline(const DependencyGraph& graph,
                                        const OutlineOptions& options);

/**
 * @brief Mermaid flowchart ("graph TD"), one line per edge
 *
 * ComponentOf edges use "-->", DependsOn edges the dotted "-.->".
 */
[[nodiscard]] std::string renderFlowchart(const DependencyGraph& graph,
                                          const FlowchartOptions& options);

/**
 * @brief Graphviz DOT digraph, one line per edge
 *
 * DependsOn edges carry style=dashed. With descriptions enabled, node
 * statements with label attributes precede the edges.
 */
[[nodiscard]] std::string renderDot(const DependencyGraph& graph, const DotOptions& options);

} // namespace Planwright::plan
