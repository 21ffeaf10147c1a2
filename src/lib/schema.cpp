/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/schema.hpp>

#include <cstdlib>
#include <mutex>
#include <sstream>
#include <stdexcept>

#include <boost/filesystem.hpp>
#include <libxml/xmlschemas.h>

#include <fmuhandler/log.hpp>
#include <fmuhandler/util.hpp>
#include <fmuhandler/xml.hpp>

#ifndef FMUHANDLER_SCHEMA_DIR
#   define FMUHANDLER_SCHEMA_DIR "schema"
#endif


namespace fmuhandler
{

namespace
{
    const char* const SCHEMA_FILE_NAME = "fmi2ModelDescription.xsd";

    void CollectDiagnostic(void* userData, xml::ErrorArg xmlError)
    {
        if (xmlError == nullptr) return;
        auto diagnostics = static_cast<std::vector<error::Diagnostic>*>(userData);
        try {
            diagnostics->push_back(
                error::Diagnostic{xmlError->line, xml::ErrorMessage(xmlError)});
        } catch (const std::bad_alloc&) {
            // Exceptions must not propagate into libxml2.  The result is
            // still marked invalid.
        }
    }
}


SchemaValidator::SchemaValidator(const boost::filesystem::path& schemaPath)
    : m_schemaPath(schemaPath), m_schema(nullptr)
{
    xml::Initialize();
    if (!boost::filesystem::is_regular_file(schemaPath)) {
        throw std::runtime_error("Schema file not found: " + schemaPath.string());
    }

    const auto parserCtxt = xmlSchemaNewParserCtxt(schemaPath.string().c_str());
    if (parserCtxt == nullptr) {
        throw std::runtime_error("Failed to create schema parser for " + schemaPath.string());
    }
    const auto freeParserCtxt = util::OnScopeExit([parserCtxt] () {
        xmlSchemaFreeParserCtxt(parserCtxt);
    });

    std::vector<error::Diagnostic> diagnostics;
    xmlSchemaSetParserStructuredErrors(parserCtxt, &CollectDiagnostic, &diagnostics);
    m_schema = xmlSchemaParse(parserCtxt);
    if (m_schema == nullptr) {
        std::ostringstream msg;
        msg << "Invalid schema: " << schemaPath.string();
        for (const auto& d : diagnostics) {
            msg << "\n  line " << d.line << ": " << d.message;
        }
        throw std::runtime_error(msg.str());
    }
    FMUHANDLER_LOG_DEBUG(boost::format("Loaded XML schema %s") % schemaPath.string());
}


SchemaValidator::~SchemaValidator() FMUHANDLER_NOEXCEPT
{
    xmlSchemaFree(m_schema);
}


ValidationResult SchemaValidator::Validate(const std::string& xmlBytes) const
{
    const auto doc = xml::Parse(xmlBytes);

    const auto validCtxt = xmlSchemaNewValidCtxt(m_schema);
    if (validCtxt == nullptr) {
        throw std::runtime_error("Failed to create schema validation context");
    }
    const auto freeValidCtxt = util::OnScopeExit([validCtxt] () {
        xmlSchemaFreeValidCtxt(validCtxt);
    });

    ValidationResult result;
    xmlSchemaSetValidStructuredErrors(validCtxt, &CollectDiagnostic, &result.diagnostics);
    const auto rc = xmlSchemaValidateDoc(validCtxt, doc.get());
    if (rc < 0) {
        throw std::runtime_error("Internal error in XML schema validator");
    }
    result.valid = (rc == 0);
    if (!result.valid && result.diagnostics.empty()) {
        result.diagnostics.push_back(
            error::Diagnostic{0, "Document does not conform to the schema"});
    }
    return result;
}


const boost::filesystem::path& SchemaValidator::SchemaPath() const FMUHANDLER_NOEXCEPT
{
    return m_schemaPath;
}


std::shared_ptr<const SchemaValidator> SchemaValidator::Canonical()
{
    // A failed load is not cached, so a later call may try again.
    static std::mutex mutex;
    static std::shared_ptr<const SchemaValidator> canonical;
    std::lock_guard<std::mutex> lock(mutex);
    if (!canonical) {
        canonical = std::make_shared<SchemaValidator>(CanonicalSchemaPath());
    }
    return canonical;
}


boost::filesystem::path CanonicalSchemaPath()
{
    const auto dir = std::getenv("FMUHANDLER_SCHEMA_DIR");
    return boost::filesystem::path(dir && *dir ? dir : FMUHANDLER_SCHEMA_DIR)
        / SCHEMA_FILE_NAME;
}


} // namespace
