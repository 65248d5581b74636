#pragma once

/**
 * @file node.hpp
 * @brief Plan hierarchy types: Epic -> Story -> Task
 *
 * Every level composes the same NodeInfo record instead of inheriting from
 * a common base, and the graph stores nodes as a closed tagged union
 * (PlanNode). Nodes are snapshots of parse-time values and are never
 * updated in place.
 */

#include "Planwright/core/types.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Planwright::plan {

/**
 * @brief Work status of a plan element
 */
enum class Status : u8 { Pending, InProgress, Complete };

/**
 * @brief Raw value used in plan documents ("pending", "in_progress",
 * "complete")
 */
[[nodiscard]] const char* statusToString(Status status);

/**
 * @brief Map a raw document value to a Status
 * @return std::nullopt for anything but the three exact raw values
 */
[[nodiscard]] std::optional<Status> statusFromString(std::string_view raw);

/**
 * @brief Fields shared by every level of the hierarchy
 */
struct NodeInfo {
  std::string id;
  std::string description;
  Status status = Status::Pending;
  i64 priority = 1;

  bool operator==(const NodeInfo&) const = default;
};

struct TaskNode {
  NodeInfo info;
  std::vector<std::string> dependsOn;

  bool operator==(const TaskNode&) const = default;
};

struct StoryNode {
  NodeInfo info;
  i64 points = 0;
  std::vector<TaskNode> tasks;

  bool operator==(const StoryNode&) const = default;
};

struct EpicNode {
  NodeInfo info;
  std::vector<StoryNode> stories;

  bool operator==(const EpicNode&) const = default;
};

/**
 * @brief Root aggregate, rebuilt wholesale on every build
 */
struct Plan {
  std::string version = "1.0";
  std::vector<EpicNode> epics;

  bool operator==(const Plan&) const = default;
};

enum class NodeKind : u8 { Task, Story, Epic };

using PlanNode = std::variant<TaskNode, StoryNode, EpicNode>;

[[nodiscard]] const char* nodeKindToString(NodeKind kind);

[[nodiscard]] NodeKind kindOf(const PlanNode& node);

[[nodiscard]] const NodeInfo& infoOf(const PlanNode& node);

} // namespace Planwright::plan
