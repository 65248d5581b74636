/**
 * @file plan_error.cpp
 * @brief PlanError formatting
 */

#include "Planwright/plan/plan_error.hpp"

namespace Planwright::plan {

const char* planErrorKindToString(PlanErrorKind kind) {
  switch (kind) {
  case PlanErrorKind::SchemaViolation:
    return "SchemaViolation";
  case PlanErrorKind::MalformedDocument:
    return "MalformedDocument";
  case PlanErrorKind::IOFailure:
    return "IOFailure";
  case PlanErrorKind::InvalidOptions:
    return "InvalidOptions";
  }
  return "Unknown";
}

std::string PlanError::format() const {
  std::string result = std::string("[") + planErrorKindToString(kind) + "] " + message;
  if (!details.empty()) {
    result += "\nDetails: " + details;
  }
  return result;
}

} // namespace Planwright::plan
