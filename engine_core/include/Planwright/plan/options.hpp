#pragma once

/**
 * @file options.hpp
 * @brief Configuration records for query and render operations
 *
 * Each public operation takes a small typed record. Records can also be
 * built from a raw key/value map (CLI "--set key=value", tool requests);
 * that path validates the map's shape and rejects it before the graph is
 * touched.
 */

#include "Planwright/plan/plan_error.hpp"
#include <map>
#include <string>

namespace Planwright::plan {

using OptionMap = std::map<std::string, std::string>;

namespace option_keys {
constexpr const char* IncludeInProgress = "include_in_progress";
constexpr const char* IncludeStatus = "include_status";
constexpr const char* IncludeDescriptions = "include_descriptions";
} // namespace option_keys

struct ReadyTasksOptions {
  bool includeInProgress = false;
};

struct OutlineOptions {
  bool includeStatus = true;
};

struct FlowchartOptions {
  bool includeDescriptions = true;
};

struct DotOptions {
  bool includeDescriptions = true;
};

/**
 * @brief Parse a boolean option value
 *
 * Accepts "true"/"false", "1"/"0" and "yes"/"no" (case-insensitive).
 */
[[nodiscard]] PlanResult<bool> parseBoolOption(const std::string& key, const std::string& value);

/**
 * @brief Build a record from a raw map
 *
 * Missing keys keep their defaults. Unknown keys and non-boolean values
 * fail with PlanErrorKind::InvalidOptions.
 */
[[nodiscard]] PlanResult<ReadyTasksOptions> readyTasksOptionsFrom(const OptionMap& raw);
[[nodiscard]] PlanResult<OutlineOptions> outlineOptionsFrom(const OptionMap& raw);
[[nodiscard]] PlanResult<FlowchartOptions> flowchartOptionsFrom(const OptionMap& raw);
[[nodiscard]] PlanResult<DotOptions> dotOptionsFrom(const OptionMap& raw);

} // namespace Planwright::plan
