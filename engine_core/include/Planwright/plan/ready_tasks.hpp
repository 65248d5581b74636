#pragma once

/**
 * @file ready_tasks.hpp
 * @brief "What can be started now" query
 */

#include "Planwright/plan/dependency_graph.hpp"
#include "Planwright/plan/options.hpp"
#include <string>
#include <vector>

namespace Planwright::plan {

/**
 * @brief Check a single task against the readiness rules
 *
 * A task is ready when it is a Task node, is not Complete (InProgress only
 * with options.includeInProgress) and each direct DependsOn target is an
 * existing node whose status is Complete. A target id without a node counts
 * as unmet. Dependencies of dependencies are not examined.
 */
[[nodiscard]] bool isTaskReady(const DependencyGraph& graph, const std::string& id,
                               const ReadyTasksOptions& options);

/**
 * @brief Ids of all ready tasks, in graph node order
 */
[[nodiscard]] std::vector<std::string> findReadyTasks(const DependencyGraph& graph,
                                                      const ReadyTasksOptions& options);

} // namespace Planwright::plan
