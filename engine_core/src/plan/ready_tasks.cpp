/**
 * @file ready_tasks.cpp
 * @brief Ready-task evaluation
 */

#include "Planwright/plan/ready_tasks.hpp"
#include <algorithm>

namespace Planwright::plan {

bool isTaskReady(const DependencyGraph& graph, const std::string& id,
                 const ReadyTasksOptions& options) {
  const PlanNode* node = graph.findNode(id);
  if (node == nullptr || kindOf(*node) != NodeKind::Task) {
    return false;
  }

  const Status status = infoOf(*node).status;
  if (status == Status::Complete) {
    return false;
  }
  if (status == Status::InProgress && !options.includeInProgress) {
    return false;
  }

  const auto dependencies = graph.successors(id, EdgeType::DependsOn);
  return std::all_of(dependencies.begin(), dependencies.end(), [&](const std::string& depId) {
    const PlanNode* dependency = graph.findNode(depId);
    return dependency != nullptr && infoOf(*dependency).status == Status::Complete;
  });
}

std::vector<std::string> findReadyTasks(const DependencyGraph& graph,
                                        const ReadyTasksOptions& options) {
  std::vector<std::string> ready;
  for (const auto& id : graph.nodeIds()) {
    if (isTaskReady(graph, id, options)) {
      ready.push_back(id);
    }
  }
  return ready;
}

} // namespace Planwright::plan
