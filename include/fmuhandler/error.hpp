/**
\file
\brief  Main header file for fmuhandler::error.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_ERROR_HPP
#define FMUHANDLER_ERROR_HPP

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <fmuhandler/config.h>


namespace fmuhandler
{

/**
\brief  Exception types and error handling facilities.

All the exceptions which signal a problem with an FMU or its model description
derive from `std::runtime_error`, so a caller which processes many files can
catch them all in one place and move on to the next file.
*/
namespace error
{


/// Exception thrown when a file that should be opened does not exist.
class FileNotFoundException : public std::runtime_error
{
public:
    explicit FileNotFoundException(const std::string& path);

    /// The path that could not be found.
    const std::string& Path() const FMUHANDLER_NOEXCEPT;

private:
    std::string m_path;
};


/**
\brief  Exception thrown when a file is not a valid ZIP archive, or when it
        lacks the members required of an FMU.
*/
class ArchiveFormatException : public std::runtime_error
{
public:
    explicit ArchiveFormatException(const std::string& whatArg)
        : std::runtime_error(whatArg) { }
};


/// Exception thrown when an XML document is not well-formed.
class MalformedXmlException : public std::runtime_error
{
public:
    /**
    \param [in] message The parser's description of the problem.
    \param [in] line    The line on which the problem was detected, or 0 if
                        unknown.
    */
    MalformedXmlException(const std::string& message, int line);

    /// The line on which the problem was detected, or 0 if unknown.
    int Line() const FMUHANDLER_NOEXCEPT;

private:
    int m_line;
};


/**
\brief  Exception thrown when a model description is well-formed XML, but
        does not have the structure expected of one.

Examples are missing required attributes, duplicate variable names and
unknown variable types.
*/
class ModelParseException : public std::runtime_error
{
public:
    explicit ModelParseException(const std::string& whatArg)
        : std::runtime_error(whatArg) { }
};


/// Exception thrown when a requested variable does not exist.
class VariableNotFoundException : public std::runtime_error
{
public:
    explicit VariableNotFoundException(const std::string& variableName);

    /// The name of the variable which was looked for.
    const std::string& VariableName() const FMUHANDLER_NOEXCEPT;

private:
    std::string m_variableName;
};


/// Exception thrown when a value does not match a variable's data type.
class InvalidValueException : public std::runtime_error
{
public:
    /**
    \param [in] variableName    The variable whose value was rejected.
    \param [in] expectedType    The name of the variable's data type.
    \param [in] value           A textual rendering of the rejected value.
    */
    InvalidValueException(
        const std::string& variableName,
        const std::string& expectedType,
        const std::string& value);

    const std::string& VariableName() const FMUHANDLER_NOEXCEPT;
    const std::string& ExpectedType() const FMUHANDLER_NOEXCEPT;
    const std::string& Value() const FMUHANDLER_NOEXCEPT;

private:
    std::string m_variableName;
    std::string m_expectedType;
    std::string m_value;
};


/// A single message from an XML schema validation.
struct Diagnostic
{
    /// The line in the validated document, or 0 if unknown.
    int line;

    /// A description of the problem.
    std::string message;
};


/**
\brief  Exception thrown when an attempt is made to save a model description
        which does not conform to the XML schema.
*/
class SchemaValidationException : public std::runtime_error
{
public:
    explicit SchemaValidationException(std::vector<Diagnostic> diagnostics);

    /// The messages reported by the validator.
    const std::vector<Diagnostic>& Diagnostics() const FMUHANDLER_NOEXCEPT;

private:
    std::vector<Diagnostic> m_diagnostics;
};


/**
\def    FMUHANDLER_INPUT_CHECK(test)
\brief  Checks the value of one or more function input parameters, and
        throws an `std::invalid_argument` if they do not fulfill the
        given requirements.

Example:

    void Foo(int x)
    {
        FMUHANDLER_INPUT_CHECK(x > 0);
        ...
    }

If the above fails, i.e. if `x <= 0`, an exception will be thrown with
the following error message:

    Foo: Input requirement not satisfied: x > 0

Since `std::invalid_argument` is a subclass of `std::logic_error`, this macro
should only be used to catch logic errors, i.e. errors that are avoidable by
design.  (For example, `!name.empty()` is probably OK, but `exists(fileName)`
is not, since the latter can only be verified at runtime.)

\param[in] test An expression which can be implicitly converted to `bool`.
*/
#define FMUHANDLER_INPUT_CHECK(test)                                           \
    do {                                                                       \
        if (!(test)) {                                                         \
            fmuhandler::error::detail::Throw<std::invalid_argument>            \
                (__FUNCTION__, -1, "Input requirement not satisfied", #test);  \
        }                                                                      \
    } while(false)


/**
\brief  An exception which is used to signal that one or more of a function's
        preconditions were not met.

Note that `std::invalid_argument` should be used to signal problems with
function arguments, even though such could also, strictly speaking, be
classified as precondition violations.

\see #FMUHANDLER_PRECONDITION_CHECK
*/
class PreconditionViolation : public std::logic_error
{
public:
    explicit PreconditionViolation(const std::string& whatArg)
        : std::logic_error(whatArg) { }
};


/**
\def    FMUHANDLER_PRECONDITION_CHECK(test)
\brief  Throws a fmuhandler::error::PreconditionViolation if the given boolean
        expression evaluates to `false`.

If the test fails, the error message will be similar to the following:

    Open: Precondition not satisfied: !IsOpen()

\param[in]  test    An expression which can be implicitly converted to `bool`.
*/
#define FMUHANDLER_PRECONDITION_CHECK(test)                                   \
    do {                                                                    \
        if (!(test)) {                                                      \
            fmuhandler::error::detail::Throw                                \
                <fmuhandler::error::PreconditionViolation>                  \
                (__FUNCTION__, -1, "Precondition not satisfied", #test);    \
        }                                                                   \
    } while(false)


namespace detail
{
    // Internal helper function.
    // This function is only designed for use by the macros in this header,
    // and it is subject to change without warning at any time.
    template<class ExceptionT>
    inline void Throw(
        const char* location, int lineNo, const char* msg, const char* detail)
    {
        std::stringstream s;
        s << location;
        if (lineNo >= 0) s << '(' << lineNo << ')';
        s << ": " << msg;
        if (detail) s << ": " << detail;
        throw ExceptionT(s.str());
    }
}


/**
\brief  Constructs an error message by combining a user-defined message and
        a standard system error message.

The system error message is obtained by calling `std::strerror(errnoValue)`.
If `errnoValue` is zero, the function only returns `msg`.  Otherwise, if
`msg` is empty, only the system message is returned.  Otherwise, the format
of the returned message is:

    user message (system message)
*/
std::string ErrnoMessage(const std::string& msg, int errnoValue) FMUHANDLER_NOEXCEPT;


}} // namespace
#endif  // header guard
