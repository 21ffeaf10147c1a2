/**
\file
\brief  XML schema validation of model descriptions.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_SCHEMA_HPP
#define FMUHANDLER_SCHEMA_HPP

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include <fmuhandler/config.h>
#include <fmuhandler/error.hpp>


// Forward declaration to avoid dependency on libxml/xmlschemas.h
struct _xmlSchema;


namespace fmuhandler
{


/// The outcome of validating a document against a schema.
struct ValidationResult
{
    /// Whether the document conforms to the schema.
    bool valid = false;

    /// The problems found, in the order they were reported.
    std::vector<fmuhandler::error::Diagnostic> diagnostics;
};


/**
\brief  Validates XML documents against an XML Schema Definition.

The schema is loaded and compiled once, when the object is constructed, and
it is never modified afterwards.  Validate() is therefore safe to call from
several threads at once.
*/
class SchemaValidator
{
public:
    /**
    \brief  Loads the schema from a file.

    Files which are included or imported by the schema are looked up
    relative to it.

    \throws std::runtime_error
        If the schema could not be loaded or is not a valid XSD document.
    */
    explicit SchemaValidator(const boost::filesystem::path& schemaPath);

    SchemaValidator(const SchemaValidator&) = delete;
    SchemaValidator& operator=(const SchemaValidator&) = delete;

    ~SchemaValidator() FMUHANDLER_NOEXCEPT;

    /**
    \brief  Validates a document.

    A document which is well-formed but does not conform to the schema is
    not an error; it gives a result with `valid == false` and at least one
    diagnostic.

    \throws fmuhandler::error::MalformedXmlException
        If `xmlBytes` is not well-formed XML.
    \throws std::runtime_error
        If the validator failed internally.
    */
    ValidationResult Validate(const std::string& xmlBytes) const;

    /// The path of the schema file.
    const boost::filesystem::path& SchemaPath() const FMUHANDLER_NOEXCEPT;

    /**
    \brief  Returns the validator for the FMI 2.0 model description schema
            which is bundled with this library.

    The validator is created on the first call and shared afterwards.

    \throws std::runtime_error
        If the schema could not be loaded.
    \see CanonicalSchemaPath()
    */
    static std::shared_ptr<const SchemaValidator> Canonical();

private:
    boost::filesystem::path m_schemaPath;
    _xmlSchema* m_schema;
};


/**
\brief  Returns the path to the bundled FMI 2.0 model description schema.

The schema is looked up in the directory given by the `FMUHANDLER_SCHEMA_DIR`
environment variable if it is set, and otherwise in the directory chosen
when the library was built.
*/
boost::filesystem::path CanonicalSchemaPath();


} // namespace
#endif // header guard
