/**
\file
\brief  Main module header for fmuhandler::model.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_MODEL_HPP
#define FMUHANDLER_MODEL_HPP

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include <boost/optional.hpp>
#include <boost/variant.hpp>

#include <fmuhandler/config.h>


namespace fmuhandler
{
/// Types and functions that describe the variables of a model.
namespace model
{


/// The type of a variable's value reference.
typedef std::uint32_t ValueReference;


/// Variable data types.  These correspond to the FMI type elements.
enum DataType
{
    REAL_DATATYPE           = 1,
    INTEGER_DATATYPE        = 1 << 1,
    BOOLEAN_DATATYPE        = 1 << 2,
    STRING_DATATYPE         = 1 << 3,
    ENUMERATION_DATATYPE    = 1 << 4,
};


/// Variable causalities.  These correspond to FMI causality definitions.
enum Causality
{
    PARAMETER_CAUSALITY             = 1,
    CALCULATED_PARAMETER_CAUSALITY  = 1 << 1,
    INPUT_CAUSALITY                 = 1 << 2,
    OUTPUT_CAUSALITY                = 1 << 3,
    LOCAL_CAUSALITY                 = 1 << 4,
    INDEPENDENT_CAUSALITY           = 1 << 5,
};


/// Variable variabilities.  These correspond to FMI variability definitions.
enum Variability
{
    CONSTANT_VARIABILITY    = 1,
    FIXED_VARIABILITY       = 1 << 1,
    TUNABLE_VARIABILITY     = 1 << 2,
    DISCRETE_VARIABILITY    = 1 << 3,
    CONTINUOUS_VARIABILITY  = 1 << 4,
};


/// How a variable is initialized.  These correspond to FMI `initial` values.
enum Initial
{
    EXACT_INITIAL       = 1,
    APPROX_INITIAL      = 1 << 1,
    CALCULATED_INITIAL  = 1 << 2,
};


/// The FMI name of a data type, i.e., the name of its type element.
const char* ToString(DataType dataType) FMUHANDLER_NOEXCEPT;

/// The FMI name of a causality.
const char* ToString(Causality causality) FMUHANDLER_NOEXCEPT;

/// The FMI name of a variability.
const char* ToString(Variability variability) FMUHANDLER_NOEXCEPT;

/// The FMI name of an `initial` value.
const char* ToString(Initial initial) FMUHANDLER_NOEXCEPT;

/// Parses the name of a type element, returning nothing if unknown.
boost::optional<DataType> ParseDataType(const std::string& s);

/// Parses an FMI causality name, returning nothing if unknown.
boost::optional<Causality> ParseCausality(const std::string& s);

/// Parses an FMI variability name, returning nothing if unknown.
boost::optional<Variability> ParseVariability(const std::string& s);

/// Parses an FMI `initial` name, returning nothing if unknown.
boost::optional<Initial> ParseInitial(const std::string& s);


/**
\brief  An algebraic type that can hold values of all supported data types.

Note that a `const char*` converts to `bool`, not to `std::string`, when a
ScalarValue is constructed from it.  The functions in this library which
take a ScalarValue therefore have `std::string` and `const char*` overloads.
*/
typedef boost::variant<double, int, bool, std::string> ScalarValue;


/**
\brief  Returns the type of data stored in the given ScalarValue.

An `int` gives INTEGER_DATATYPE; there is no value type which maps to
ENUMERATION_DATATYPE.
*/
DataType DataTypeOf(const ScalarValue& v);


/**
\brief  Converts a value to the representation used for variables of the
        given data type.

The rules are:

  - A `std::string` is parsed as a value of `dataType` (see ParseValue()).
  - An `int` is accepted for Real (as a `double`), Integer and Enumeration.
  - A `double` is only accepted for Real.
  - A `bool` is only accepted for Boolean.

No other conversions are made, so for example `2.5` is not truncated to an
Integer.

\param [in] variableName
    The name of the variable, used in error messages.
\throws fmuhandler::error::InvalidValueException
    If the value cannot be converted.
*/
ScalarValue CoerceValue(
    const std::string& variableName,
    DataType dataType,
    const ScalarValue& value);

/// Calls CoerceValue() with `value` as a `std::string`.
ScalarValue CoerceValue(
    const std::string& variableName,
    DataType dataType,
    const std::string& value);

/**
\brief  Calls CoerceValue() with `value` as a `std::string`.
\throws std::invalid_argument
    If `value` is null.
*/
ScalarValue CoerceValue(
    const std::string& variableName,
    DataType dataType,
    const char* value);


/**
\brief  Parses the textual representation of a value, as found in a `start`
        attribute.

Reals are parsed according to `xs:double` (including `INF`, `-INF` and
`NaN`), integers according to `xs:int` and booleans according to
`xs:boolean`.  Leading or trailing whitespace is not allowed.

\throws fmuhandler::error::InvalidValueException
    If `text` is not a valid value of type `dataType`.
*/
ScalarValue ParseValue(
    DataType dataType,
    const std::string& text,
    const std::string& variableName = std::string());


/**
\brief  Formats a value for use in an XML attribute.

Reals are written with the smallest number of significant digits that
still parse back to the same number.
*/
std::string FormatValue(const ScalarValue& value);


/// An ordered list of XML attributes, as (name, value) pairs.
typedef std::vector<std::pair<std::string, std::string>> AttributeList;


/**
\brief  A description of a single model variable.

This corresponds to a `<ScalarVariable>` element and its type element (e.g.
`<Real>`).  All attributes of both elements are kept, in their original
order, including the ones which this class does not interpret.  The typed
accessors are views of these attribute lists, and the mutators update them.

Two variables are equal if they have the same name.
*/
class ScalarVariable
{
public:
    /**
    \brief  Creates a new variable.

    The `causality` and `variability` attributes are always written, even
    when they have their default values.
    */
    ScalarVariable(
        const std::string& name,
        fmuhandler::model::ValueReference valueReference,
        fmuhandler::model::DataType dataType,
        fmuhandler::model::Causality causality = LOCAL_CAUSALITY,
        fmuhandler::model::Variability variability = CONTINUOUS_VARIABILITY);

    /**
    \brief  Creates a variable from the attributes of a `<ScalarVariable>`
            element and its type element.

    \param [in] attributes
        The attributes of the `<ScalarVariable>` element.
    \param [in] typeElementName
        The name of the type element, or an empty string if there is none.
    \param [in] typeAttributes
        The attributes of the type element.

    \throws fmuhandler::error::ModelParseException
        If `name` or `valueReference` is missing or invalid, if the type
        element is missing or unknown, or if `causality`, `variability` or
        `initial` has an unknown value.
    \throws fmuhandler::error::InvalidValueException
        If the `start` attribute is not a valid value of the variable's type.
    */
    static ScalarVariable Parse(
        const AttributeList& attributes,
        const std::string& typeElementName,
        const AttributeList& typeAttributes);

    /// The variable name.
    const std::string& Name() const FMUHANDLER_NOEXCEPT;

    /// The value reference.
    fmuhandler::model::ValueReference ValueReference() const FMUHANDLER_NOEXCEPT;

    /// The description, if any.
    boost::optional<std::string> Description() const;

    /// The causality, which is `local` if the attribute is absent.
    fmuhandler::model::Causality Causality() const FMUHANDLER_NOEXCEPT;

    /// The variability, which is `continuous` if the attribute is absent.
    fmuhandler::model::Variability Variability() const FMUHANDLER_NOEXCEPT;

    /// The `initial` attribute, if present.
    boost::optional<fmuhandler::model::Initial> Initial() const FMUHANDLER_NOEXCEPT;

    /// The data type.
    fmuhandler::model::DataType DataType() const FMUHANDLER_NOEXCEPT;

    /**
    \brief  The start value, if any.

    The value held by the variant matches the data type: `double` for Real,
    `int` for Integer and Enumeration, `bool` for Boolean and `std::string`
    for String.
    */
    const boost::optional<ScalarValue>& Start() const FMUHANDLER_NOEXCEPT;

    /// The `unit` attribute of the type element, if any.
    boost::optional<std::string> Unit() const;

    /// Any attribute of the type element, by name.
    boost::optional<std::string> TypeAttribute(const std::string& name) const;

    /// All attributes of the `<ScalarVariable>` element, in order.
    const AttributeList& Attributes() const FMUHANDLER_NOEXCEPT;

    /// The name of the type element, e.g. `Real`.
    const std::string& TypeElementName() const FMUHANDLER_NOEXCEPT;

    /// All attributes of the type element, in order.
    const AttributeList& TypeAttributes() const FMUHANDLER_NOEXCEPT;

    /**
    \brief  Sets the start value.

    The value is converted with CoerceValue().

    \throws fmuhandler::error::InvalidValueException
        If the value does not match the variable's data type.
    */
    void SetStart(const ScalarValue& value);

    /// Sets the start value from its textual representation.
    void SetStart(const std::string& value);

    /**
    \brief  Sets the start value from its textual representation.
    \throws std::invalid_argument
        If `value` is null.
    */
    void SetStart(const char* value);

    /// Sets the description.
    void SetDescription(const std::string& value);

    /// Sets the causality.
    void SetCausality(fmuhandler::model::Causality value);

    /// Sets the variability.
    void SetVariability(fmuhandler::model::Variability value);

    /**
    \brief  Sets an attribute of the type element, such as `unit` or
            `declaredType`.

    The start value can only be changed with SetStart().

    \throws std::invalid_argument
        If `name` is empty or `start`.
    */
    void SetTypeAttribute(const std::string& name, const std::string& value);

private:
    ScalarVariable() = default;

    std::string m_name;
    fmuhandler::model::ValueReference m_valueReference = 0;
    fmuhandler::model::DataType m_dataType = REAL_DATATYPE;
    fmuhandler::model::Causality m_causality = LOCAL_CAUSALITY;
    fmuhandler::model::Variability m_variability = CONTINUOUS_VARIABILITY;
    boost::optional<fmuhandler::model::Initial> m_initial;
    boost::optional<ScalarValue> m_start;

    AttributeList m_attributes;
    std::string m_typeElementName;
    AttributeList m_typeAttributes;
};


/// Equality comparison for ScalarVariable objects, by name.
bool operator==(const ScalarVariable& a, const ScalarVariable& b);

/// Inequality comparison for ScalarVariable objects, defined as `!(a==b)`.
bool operator!=(const ScalarVariable& a, const ScalarVariable& b);


}}      // namespace
#endif  // header guard
