/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/error.hpp>

#include <cstring>
#include <utility>


namespace fmuhandler
{
namespace error
{

std::string ErrnoMessage(const std::string& msg, int errnoValue) noexcept
{
    if (errnoValue == 0) return msg;
    else if (msg.empty()) return std::strerror(errnoValue);
    else return msg + " (" + std::strerror(errnoValue) + ')';
}


// =============================================================================
// FileNotFoundException
// =============================================================================

FileNotFoundException::FileNotFoundException(const std::string& path)
    : std::runtime_error("File not found: " + path)
    , m_path(path)
{
}


const std::string& FileNotFoundException::Path() const noexcept
{
    return m_path;
}


// =============================================================================
// MalformedXmlException
// =============================================================================

namespace
{
    std::string LineMessage(const std::string& message, int line)
    {
        if (line > 0) {
            return "Malformed XML (line " + std::to_string(line) + "): " + message;
        } else {
            return "Malformed XML: " + message;
        }
    }
}


MalformedXmlException::MalformedXmlException(const std::string& message, int line)
    : std::runtime_error(LineMessage(message, line))
    , m_line(line)
{
}


int MalformedXmlException::Line() const noexcept
{
    return m_line;
}


// =============================================================================
// VariableNotFoundException
// =============================================================================

VariableNotFoundException::VariableNotFoundException(const std::string& variableName)
    : std::runtime_error("No such variable: " + variableName)
    , m_variableName(variableName)
{
}


const std::string& VariableNotFoundException::VariableName() const noexcept
{
    return m_variableName;
}


// =============================================================================
// InvalidValueException
// =============================================================================

InvalidValueException::InvalidValueException(
    const std::string& variableName,
    const std::string& expectedType,
    const std::string& value)
    : std::runtime_error(
        "Invalid value for variable '" + variableName + "': '" + value
        + "' is not a valid " + expectedType + " value")
    , m_variableName(variableName)
    , m_expectedType(expectedType)
    , m_value(value)
{
}


const std::string& InvalidValueException::VariableName() const noexcept
{
    return m_variableName;
}


const std::string& InvalidValueException::ExpectedType() const noexcept
{
    return m_expectedType;
}


const std::string& InvalidValueException::Value() const noexcept
{
    return m_value;
}


// =============================================================================
// SchemaValidationException
// =============================================================================

namespace
{
    std::string DiagnosticsSummary(const std::vector<Diagnostic>& diagnostics)
    {
        std::ostringstream s;
        s << "Model description does not conform to the schema";
        if (!diagnostics.empty()) {
            const auto& first = diagnostics.front();
            s << " (" << diagnostics.size() << " error(s), first on line "
              << first.line << ": " << first.message << ')';
        }
        return s.str();
    }
}


SchemaValidationException::SchemaValidationException(
    std::vector<Diagnostic> diagnostics)
    : std::runtime_error(DiagnosticsSummary(diagnostics))
    , m_diagnostics(std::move(diagnostics))
{
}


const std::vector<Diagnostic>& SchemaValidationException::Diagnostics()
    const noexcept
{
    return m_diagnostics;
}


}} // namespace
