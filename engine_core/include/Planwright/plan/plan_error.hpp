#pragma once

/**
 * @file plan_error.hpp
 * @brief Build and configuration failures reported by the plan engine
 */

#include "Planwright/core/result.hpp"
#include "Planwright/core/types.hpp"
#include <string>
#include <utility>

namespace Planwright::plan {

/**
 * @brief Failure categories
 *
 * SchemaViolation, MalformedDocument and IOFailure abort a build with no
 * graph produced. InvalidOptions is returned when a configuration record is
 * rejected before any graph access.
 */
enum class PlanErrorKind : u8 { SchemaViolation, MalformedDocument, IOFailure, InvalidOptions };

[[nodiscard]] const char* planErrorKindToString(PlanErrorKind kind);

/**
 * @brief Single failure type wrapping the originating cause
 */
struct PlanError {
  PlanErrorKind kind = PlanErrorKind::IOFailure;
  std::string message;
  std::string details; // Originating cause (libxml2 diagnostics, OS reason)

  PlanError() = default;
  PlanError(PlanErrorKind k, std::string msg, std::string cause = {})
      : kind(k), message(std::move(msg)), details(std::move(cause)) {}

  [[nodiscard]] std::string format() const;
};

template <typename T> using PlanResult = Result<T, PlanError>;

} // namespace Planwright::plan
