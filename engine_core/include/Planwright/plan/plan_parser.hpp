#pragma once

/**
 * @file plan_parser.hpp
 * @brief Converts a schema-validated plan document into the Epic/Story/Task
 * hierarchy
 *
 * Failure policy is local: an element whose id is empty, whose status is not
 * one of the known raw values, or whose priority/points is not an integer
 * is dropped together with everything nested under it. Siblings and
 * ancestors are built as usual. Drops never fail the parse; they are
 * recorded as DroppedElement entries and logged as warnings.
 */

#include "Planwright/plan/node.hpp"
#include <libxml/tree.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Planwright::plan {

/**
 * @brief Diagnostic for an element removed by the failure policy
 */
struct DroppedElement {
  NodeKind kind = NodeKind::Task;
  std::string id;
  std::string reason;
};

struct ParseOutcome {
  Plan plan;
  std::vector<DroppedElement> dropped;
};

/**
 * @brief Parse integer text the way plan documents write it
 *
 * Surrounding whitespace is ignored and a leading sign is accepted.
 * Decimal values beyond the 64-bit range saturate at its limits.
 * @return std::nullopt when the remaining text is not a decimal integer
 */
[[nodiscard]] std::optional<i64> parsePlanInteger(std::string_view text);

class PlanParser {
public:
  /**
   * @brief Parse a document that already passed schema validation
   */
  [[nodiscard]] ParseOutcome parse(xmlDoc& doc);

private:
  std::optional<EpicNode> parseEpic(xmlNode* element);
  std::optional<StoryNode> parseStory(xmlNode* element);
  std::optional<TaskNode> parseTask(xmlNode* element);

  /**
   * @brief Read id, status, description and priority
   * @return false if the element has to be dropped
   */
  bool readNodeInfo(xmlNode* element, NodeKind kind, NodeInfo& info);

  void drop(NodeKind kind, const std::string& id, std::string reason);

  std::vector<DroppedElement> m_dropped;
};

} // namespace Planwright::plan
