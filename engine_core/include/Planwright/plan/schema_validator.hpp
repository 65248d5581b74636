#pragma once

/**
 * @file schema_validator.hpp
 * @brief XSD validation of plan documents (libxml2)
 *
 * The compiled schema is loaded on first use and cached for the lifetime of
 * the validator. Failures are reported as:
 * - IOFailure: document or schema file missing/unreadable
 * - MalformedDocument: input is not well-formed XML
 * - SchemaViolation: well-formed input rejected by the schema
 *
 * Not safe for concurrent use; callers serialize builds.
 */

#include "Planwright/plan/plan_error.hpp"
#include <libxml/tree.h>
#include <libxml/xmlschemas.h>
#include <memory>
#include <string>

namespace Planwright::plan {

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const;
};

using XmlDocumentPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

/**
 * @brief Read and parse an XML file (no schema check)
 */
[[nodiscard]] PlanResult<XmlDocumentPtr> loadXmlDocument(const std::string& path);

/**
 * @brief Parse XML held in memory (no schema check)
 * @param xml Document text
 * @param sourceName Name used in diagnostics
 */
[[nodiscard]] PlanResult<XmlDocumentPtr> loadXmlDocumentFromString(const std::string& xml,
                                                                   const std::string& sourceName);

class SchemaValidator {
public:
  explicit SchemaValidator(std::string schemaPath = defaultSchemaPath());
  ~SchemaValidator();

  SchemaValidator(const SchemaValidator&) = delete;
  SchemaValidator& operator=(const SchemaValidator&) = delete;

  /**
   * @brief Location of the bundled plan.xsd
   */
  [[nodiscard]] static std::string defaultSchemaPath();

  [[nodiscard]] const std::string& schemaPath() const { return m_schemaPath; }

  [[nodiscard]] bool isSchemaLoaded() const { return m_schema != nullptr; }

  /**
   * @brief Load the document at @p path and validate it
   */
  [[nodiscard]] PlanResult<void> validate(const std::string& path);

  /**
   * @brief Validate an already parsed document
   */
  [[nodiscard]] PlanResult<void> validateDocument(xmlDoc& doc);

private:
  struct SchemaDeleter {
    void operator()(xmlSchema* schema) const;
  };

  PlanResult<void> ensureSchemaLoaded();

  std::string m_schemaPath;
  std::unique_ptr<xmlSchema, SchemaDeleter> m_schema;
};

} // namespace Planwright::plan
