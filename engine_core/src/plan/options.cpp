/**
 * @file options.cpp
 * @brief Option record parsing and shape validation
 */

#include "Planwright/plan/options.hpp"
#include <algorithm>
#include <cctype>

namespace Planwright::plan {

namespace {

std::string toLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

/**
 * @brief Parse the single boolean key a record carries
 * @param raw Incoming map
 * @param key The only key the record accepts
 * @param defaultValue Used when the key is absent
 */
PlanResult<bool> singleBoolOption(const OptionMap& raw, const char* key, bool defaultValue) {
  bool value = defaultValue;
  for (const auto& [name, text] : raw) {
    if (name != key) {
      return PlanResult<bool>::error(PlanError(PlanErrorKind::InvalidOptions,
                                               "Unknown option '" + name + "'",
                                               std::string("Expected only '") + key + "'"));
    }
    auto parsed = parseBoolOption(name, text);
    if (parsed.isError()) {
      return parsed;
    }
    value = parsed.value();
  }
  return PlanResult<bool>::ok(value);
}

} // namespace

PlanResult<bool> parseBoolOption(const std::string& key, const std::string& value) {
  const std::string lowered = toLower(value);
  if (lowered == "true" || lowered == "1" || lowered == "yes") {
    return PlanResult<bool>::ok(true);
  }
  if (lowered == "false" || lowered == "0" || lowered == "no") {
    return PlanResult<bool>::ok(false);
  }
  return PlanResult<bool>::error(PlanError(PlanErrorKind::InvalidOptions,
                                           "Option '" + key + "' must be a boolean",
                                           "Got '" + value + "'"));
}

PlanResult<ReadyTasksOptions> readyTasksOptionsFrom(const OptionMap& raw) {
  auto flag = singleBoolOption(raw, option_keys::IncludeInProgress, false);
  if (flag.isError()) {
    return PlanResult<ReadyTasksOptions>::error(flag.error());
  }
  return PlanResult<ReadyTasksOptions>::ok(ReadyTasksOptions{flag.value()});
}

PlanResult<OutlineOptions> outlineOptionsFrom(const OptionMap& raw) {
  auto flag = singleBoolOption(raw, option_keys::IncludeStatus, true);
  if (flag.isError()) {
    return PlanResult<OutlineOptions>::error(flag.error());
  }
  return PlanResult<OutlineOptions>::ok(OutlineOptions{flag.value()});
}

PlanResult<FlowchartOptions> flowchartOptionsFrom(const OptionMap& raw) {
  auto flag = singleBoolOption(raw, option_keys::IncludeDescriptions, true);
  if (flag.isError()) {
    return PlanResult<FlowchartOptions>::error(flag.error());
  }
  return PlanResult<FlowchartOptions>::ok(FlowchartOptions{flag.value()});
}

PlanResult<DotOptions> dotOptionsFrom(const OptionMap& raw) {
  auto flag = singleBoolOption(raw, option_keys::IncludeDescriptions, true);
  if (flag.isError()) {
    return PlanResult<DotOptions>::error(flag.error());
  }
  return PlanResult<DotOptions>::ok(DotOptions{flag.value()});
}

} // namespace Planwright::plan
