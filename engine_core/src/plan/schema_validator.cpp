/**
 * @file schema_validator.cpp
 * @brief XSD validation implementation
 */

#include "Planwright/plan/schema_validator.hpp"
#include "Planwright/core/logger.hpp"
#include <cerrno>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

#include <libxml/parser.h>
#include <libxml/xmlerror.h>

#ifndef PLANWRIGHT_SCHEMA_PATH
#define PLANWRIGHT_SCHEMA_PATH "resources/schema/plan.xsd"
#endif

namespace fs = std::filesystem;

namespace Planwright::plan {

namespace {

// libxml2 2.12 made the structured error argument const
#if LIBXML_VERSION >= 21200
using XmlErrorArg = const xmlError*;
#else
using XmlErrorArg = xmlError*;
#endif

std::string trimTrailing(std::string text) {
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
    text.pop_back();
  }
  return text;
}

std::string describeXmlError(const xmlError* error) {
  if (error == nullptr || error->message == nullptr) {
    return "unknown libxml2 error";
  }
  std::string text;
  if (error->line > 0) {
    text = "line " + std::to_string(error->line) + ": ";
  }
  return text + trimTrailing(error->message);
}

void collectXmlError(void* userData, XmlErrorArg error) {
  auto* messages = static_cast<std::vector<std::string>*>(userData);
  if (messages != nullptr) {
    messages->push_back(describeXmlError(error));
  }
}

std::string joinMessages(const std::vector<std::string>& messages) {
  std::string joined;
  for (const auto& message : messages) {
    if (!joined.empty()) {
      joined += "; ";
    }
    joined += message;
  }
  return joined;
}

struct ParserCtxtDeleter {
  void operator()(xmlParserCtxt* ctxt) const { xmlFreeParserCtxt(ctxt); }
};

struct SchemaParserCtxtDeleter {
  void operator()(xmlSchemaParserCtxt* ctxt) const { xmlSchemaFreeParserCtxt(ctxt); }
};

struct SchemaValidCtxtDeleter {
  void operator()(xmlSchemaValidCtxt* ctxt) const { xmlSchemaFreeValidCtxt(ctxt); }
};

} // namespace

void XmlDocDeleter::operator()(xmlDoc* doc) const {
  xmlFreeDoc(doc);
}

void SchemaValidator::SchemaDeleter::operator()(xmlSchema* schema) const {
  xmlSchemaFree(schema);
}

PlanResult<XmlDocumentPtr> loadXmlDocument(const std::string& path) {
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return PlanResult<XmlDocumentPtr>::error(
        PlanError(PlanErrorKind::IOFailure, "Plan file not found: " + path,
                  ec ? ec.message() : std::string("No such file")));
  }
  if (fs::is_directory(path, ec)) {
    return PlanResult<XmlDocumentPtr>::error(
        PlanError(PlanErrorKind::IOFailure, "Plan path is a directory: " + path));
  }

  std::ifstream file(path, std::ios::in | std::ios::binary);
  if (!file.is_open()) {
    return PlanResult<XmlDocumentPtr>::error(
        PlanError(PlanErrorKind::IOFailure, "Failed to open plan file: " + path,
                  std::error_code(errno, std::generic_category()).message()));
  }

  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return PlanResult<XmlDocumentPtr>::error(
        PlanError(PlanErrorKind::IOFailure, "Failed to read plan file: " + path));
  }

  return loadXmlDocumentFromString(buffer.str(), path);
}

PlanResult<XmlDocumentPtr> loadXmlDocumentFromString(const std::string& xml,
                                                     const std::string& sourceName) {
  xmlInitParser();

  std::unique_ptr<xmlParserCtxt, ParserCtxtDeleter> ctxt(xmlNewParserCtxt());
  if (!ctxt) {
    return PlanResult<XmlDocumentPtr>::error(
        PlanError(PlanErrorKind::IOFailure, "Failed to allocate XML parser context"));
  }

  const int parseOptions = XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING;
  xmlDoc* doc = xmlCtxtReadMemory(ctxt.get(), xml.data(), static_cast<int>(xml.size()),
                                  sourceName.c_str(), nullptr, parseOptions);
  if (doc == nullptr) {
    return PlanResult<XmlDocumentPtr>::error(
        PlanError(PlanErrorKind::MalformedDocument, "Failed to parse XML: " + sourceName,
                  describeXmlError(xmlCtxtGetLastError(ctxt.get()))));
  }

  // Without XML_PARSE_RECOVER a non-null document is well-formed
  return PlanResult<XmlDocumentPtr>::ok(XmlDocumentPtr(doc));
}

SchemaValidator::SchemaValidator(std::string schemaPath) : m_schemaPath(std::move(schemaPath)) {
  xmlInitParser();
}

SchemaValidator::~SchemaValidator() = default;

std::string SchemaValidator::defaultSchemaPath() {
  return PLANWRIGHT_SCHEMA_PATH;
}

PlanResult<void> SchemaValidator::validate(const std::string& path) {
  auto doc = loadXmlDocument(path);
  if (doc.isError()) {
    return PlanResult<void>::error(doc.error());
  }
  return validateDocument(*doc.value());
}

PlanResult<void> SchemaValidator::validateDocument(xmlDoc& doc) {
  auto loaded = ensureSchemaLoaded();
  if (loaded.isError()) {
    return loaded;
  }

  std::unique_ptr<xmlSchemaValidCtxt, SchemaValidCtxtDeleter> ctxt(
      xmlSchemaNewValidCtxt(m_schema.get()));
  if (!ctxt) {
    return PlanResult<void>::error(
        PlanError(PlanErrorKind::SchemaViolation, "Failed to create schema validation context"));
  }

  std::vector<std::string> messages;
  xmlSchemaSetValidStructuredErrors(ctxt.get(), collectXmlError, &messages);

  const int rc = xmlSchemaValidateDoc(ctxt.get(), &doc);
  if (rc == 0) {
    return PlanResult<void>::ok();
  }

  const std::string details =
      messages.empty() ? "validator returned code " + std::to_string(rc) : joinMessages(messages);
  PLANWRIGHT_LOG_DEBUG("[SchemaValidator] Rejected document: " + details);
  return PlanResult<void>::error(
      PlanError(PlanErrorKind::SchemaViolation, "XML validation failed", details));
}

PlanResult<void> SchemaValidator::ensureSchemaLoaded() {
  if (m_schema) {
    return PlanResult<void>::ok();
  }

  std::error_code ec;
  if (!fs::exists(m_schemaPath, ec)) {
    return PlanResult<void>::error(
        PlanError(PlanErrorKind::IOFailure, "Schema file not found: " + m_schemaPath));
  }

  std::unique_ptr<xmlSchemaParserCtxt, SchemaParserCtxtDeleter> parserCtxt(
      xmlSchemaNewParserCtxt(m_schemaPath.c_str()));
  if (!parserCtxt) {
    return PlanResult<void>::error(
        PlanError(PlanErrorKind::IOFailure, "Failed to open schema: " + m_schemaPath));
  }

  std::vector<std::string> messages;
  xmlSchemaSetParserStructuredErrors(parserCtxt.get(), collectXmlError, &messages);

  xmlSchema* schema = xmlSchemaParse(parserCtxt.get());
  if (schema == nullptr) {
    return PlanResult<void>::error(PlanError(PlanErrorKind::IOFailure,
                                             "Failed to load schema: " + m_schemaPath,
                                             joinMessages(messages)));
  }

  m_schema.reset(schema);
  PLANWRIGHT_LOG_DEBUG("[SchemaValidator] Loaded schema " + m_schemaPath);
  return PlanResult<void>::ok();
}

} // namespace Planwright::plan
