/**
 * @file node.cpp
 * @brief Status and node-kind helpers
 */

#include "Planwright/plan/node.hpp"

namespace Planwright::plan {

const char* statusToString(Status status) {
  switch (status) {
  case Status::Pending:
    return "pending";
  case Status::InProgress:
    return "in_progress";
  case Status::Complete:
    return "complete";
  }
  return "unknown";
}

std::optional<Status> statusFromString(std::string_view raw) {
  if (raw == "pending")
    return Status::Pending;
  if (raw == "in_progress")
    return Status::InProgress;
  if (raw == "complete")
    return Status::Complete;
  return std::nullopt;
}

const char* nodeKindToString(NodeKind kind) {
  switch (kind) {
  case NodeKind::Task:
    return "task";
  case NodeKind::Story:
    return "story";
  case NodeKind::Epic:
    return "epic";
  }
  return "unknown";
}

NodeKind kindOf(const PlanNode& node) {
  switch (node.index()) {
  case 0:
    return NodeKind::Task;
  case 1:
    return NodeKind::Story;
  default:
    return NodeKind::Epic;
  }
}

const NodeInfo& infoOf(const PlanNode& node) {
  return std::visit([](const auto& n) -> const NodeInfo& { return n.info; }, node);
}

} // namespace Planwright::plan
