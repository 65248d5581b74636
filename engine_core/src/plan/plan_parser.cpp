/**
 * @file plan_parser.cpp
 * @brief Plan document -> hierarchy conversion
 */

#include "Planwright/plan/plan_parser.hpp"
#include "Planwright/core/logger.hpp"
#include <charconv>
#include <limits>

namespace Planwright::plan {

namespace {

constexpr const char* kDefaultPriority = "1";
constexpr const char* kDefaultPoints = "0";

bool isElement(const xmlNode* node, const char* name) {
  return node != nullptr && node->type == XML_ELEMENT_NODE &&
         xmlStrEqual(node->name, reinterpret_cast<const xmlChar*>(name)) != 0;
}

std::string takeXmlString(xmlChar* raw) {
  if (raw == nullptr) {
    return {};
  }
  std::string value(reinterpret_cast<const char*>(raw));
  xmlFree(raw);
  return value;
}

std::string attribute(xmlNode* element, const char* name) {
  return takeXmlString(xmlGetProp(element, reinterpret_cast<const xmlChar*>(name)));
}

xmlNode* firstChild(xmlNode* element, const char* name) {
  for (xmlNode* child = element->children; child != nullptr; child = child->next) {
    if (isElement(child, name)) {
      return child;
    }
  }
  return nullptr;
}

std::vector<xmlNode*> children(xmlNode* element, const char* name) {
  std::vector<xmlNode*> result;
  for (xmlNode* child = element->children; child != nullptr; child = child->next) {
    if (isElement(child, name)) {
      result.push_back(child);
    }
  }
  return result;
}

// Text of the first child named @p name, or @p fallback if there is none
std::string childText(xmlNode* element, const char* name, const char* fallback) {
  xmlNode* child = firstChild(element, name);
  if (child == nullptr) {
    return fallback;
  }
  return takeXmlString(xmlNodeGetContent(child));
}

std::string_view trimmed(std::string_view text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string_view::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}

// Document-order walk below @p element collecting non-empty depends_on texts
std::vector<std::string> collectDependencies(xmlNode* element) {
  std::vector<std::string> deps;
  std::vector<xmlNode*> stack;
  for (xmlNode* child = element->last; child != nullptr; child = child->prev) {
    stack.push_back(child);
  }

  while (!stack.empty()) {
    xmlNode* current = stack.back();
    stack.pop_back();
    if (current->type != XML_ELEMENT_NODE) {
      continue;
    }
    if (isElement(current, "depends_on")) {
      // Stored verbatim; a padded id stays a distinct (usually dangling) id
      std::string id = takeXmlString(xmlNodeGetContent(current));
      if (!id.empty()) {
        deps.push_back(std::move(id));
      }
    }
    for (xmlNode* child = current->last; child != nullptr; child = child->prev) {
      stack.push_back(child);
    }
  }
  return deps;
}

} // namespace

std::optional<i64> parsePlanInteger(std::string_view text) {
  std::string_view digits = trimmed(text);
  if (!digits.empty() && digits.front() == '+') {
    digits.remove_prefix(1);
    if (!digits.empty() && digits.front() == '-') {
      return std::nullopt;
    }
  }
  if (digits.empty()) {
    return std::nullopt;
  }

  i64 value = 0;
  const char* begin = digits.data();
  const char* end = digits.data() + digits.size();
  auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ptr != end) {
    return std::nullopt;
  }
  if (ec == std::errc::result_out_of_range) {
    return digits.front() == '-' ? std::numeric_limits<i64>::min()
                                 : std::numeric_limits<i64>::max();
  }
  if (ec != std::errc()) {
    return std::nullopt;
  }
  return value;
}

ParseOutcome PlanParser::parse(xmlDoc& doc) {
  m_dropped.clear();

  ParseOutcome outcome;
  xmlNode* root = xmlDocGetRootElement(&doc);
  if (root == nullptr) {
    PLANWRIGHT_LOG_WARN("[PlanParser] Document has no root element");
    return outcome;
  }

  std::string version = attribute(root, "version");
  if (!version.empty()) {
    outcome.plan.version = std::move(version);
  }

  for (xmlNode* epicElement : children(root, "epic")) {
    if (auto epic = parseEpic(epicElement)) {
      outcome.plan.epics.push_back(std::move(*epic));
    }
  }

  outcome.dropped = std::move(m_dropped);
  m_dropped.clear();
  return outcome;
}

std::optional<EpicNode> PlanParser::parseEpic(xmlNode* element) {
  EpicNode epic;
  if (!readNodeInfo(element, NodeKind::Epic, epic.info)) {
    return std::nullopt;
  }

  for (xmlNode* storyElement : children(element, "story")) {
    if (auto story = parseStory(storyElement)) {
      epic.stories.push_back(std::move(*story));
    }
  }
  return epic;
}

std::optional<StoryNode> PlanParser::parseStory(xmlNode* element) {
  StoryNode story;
  if (!readNodeInfo(element, NodeKind::Story, story.info)) {
    return std::nullopt;
  }

  const std::string pointsText = childText(element, "points", kDefaultPoints);
  auto points = parsePlanInteger(pointsText);
  if (!points) {
    drop(NodeKind::Story, story.info.id, "points is not an integer: '" + pointsText + "'");
    return std::nullopt;
  }
  story.points = *points;

  for (xmlNode* taskElement : children(element, "task")) {
    if (auto task = parseTask(taskElement)) {
      story.tasks.push_back(std::move(*task));
    }
  }
  return story;
}

std::optional<TaskNode> PlanParser::parseTask(xmlNode* element) {
  TaskNode task;
  if (!readNodeInfo(element, NodeKind::Task, task.info)) {
    return std::nullopt;
  }
  task.dependsOn = collectDependencies(element);
  return task;
}

bool PlanParser::readNodeInfo(xmlNode* element, NodeKind kind, NodeInfo& info) {
  info.id = attribute(element, "id");
  if (info.id.empty()) {
    drop(kind, info.id, "empty id");
    return false;
  }

  const std::string statusText = attribute(element, "status");
  auto status = statusFromString(statusText);
  if (!status) {
    drop(kind, info.id, "unknown status '" + statusText + "'");
    return false;
  }
  info.status = *status;

  info.description = childText(element, "description", "");

  const std::string priorityText = childText(element, "priority", kDefaultPriority);
  auto priority = parsePlanInteger(priorityText);
  if (!priority) {
    drop(kind, info.id, "priority is not an integer: '" + priorityText + "'");
    return false;
  }
  info.priority = *priority;
  return true;
}

void PlanParser::drop(NodeKind kind, const std::string& id, std::string reason) {
  PLANWRIGHT_LOG_WARN(std::string("[PlanParser] Dropping ") + nodeKindToString(kind) + " '" +
                      id + "': " + reason);
  m_dropped.push_back(DroppedElement{kind, id, std::move(reason)});
}

} // namespace Planwright::plan
