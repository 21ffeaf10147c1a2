/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/model.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <locale>
#include <sstream>
#include <utility>

#include <boost/lexical_cast.hpp>

#include <fmuhandler/error.hpp>


namespace fmuhandler
{
namespace model
{

// =============================================================================
// Enum conversions
// =============================================================================

const char* ToString(DataType dataType) FMUHANDLER_NOEXCEPT
{
    switch (dataType) {
        case REAL_DATATYPE:         return "Real";
        case INTEGER_DATATYPE:      return "Integer";
        case BOOLEAN_DATATYPE:      return "Boolean";
        case STRING_DATATYPE:       return "String";
        case ENUMERATION_DATATYPE:  return "Enumeration";
        default:                    return "unknown";
    }
}


const char* ToString(Causality causality) FMUHANDLER_NOEXCEPT
{
    switch (causality) {
        case PARAMETER_CAUSALITY:            return "parameter";
        case CALCULATED_PARAMETER_CAUSALITY: return "calculatedParameter";
        case INPUT_CAUSALITY:                return "input";
        case OUTPUT_CAUSALITY:               return "output";
        case LOCAL_CAUSALITY:                return "local";
        case INDEPENDENT_CAUSALITY:          return "independent";
        default:                             return "unknown";
    }
}


const char* ToString(Variability variability) FMUHANDLER_NOEXCEPT
{
    switch (variability) {
        case CONSTANT_VARIABILITY:   return "constant";
        case FIXED_VARIABILITY:      return "fixed";
        case TUNABLE_VARIABILITY:    return "tunable";
        case DISCRETE_VARIABILITY:   return "discrete";
        case CONTINUOUS_VARIABILITY: return "continuous";
        default:                     return "unknown";
    }
}


const char* ToString(Initial initial) FMUHANDLER_NOEXCEPT
{
    switch (initial) {
        case EXACT_INITIAL:      return "exact";
        case APPROX_INITIAL:     return "approx";
        case CALCULATED_INITIAL: return "calculated";
        default:                 return "unknown";
    }
}


namespace
{
    // Looks up `s` among the names ToString() gives for the `values`.
    template<typename Enum, std::size_t N>
    boost::optional<Enum> ParseEnum(const std::string& s, const Enum (&values)[N])
    {
        for (const auto v : values) {
            if (s == ToString(v)) return v;
        }
        return boost::none;
    }
}


boost::optional<DataType> ParseDataType(const std::string& s)
{
    const DataType values[] = {
        REAL_DATATYPE, INTEGER_DATATYPE, BOOLEAN_DATATYPE,
        STRING_DATATYPE, ENUMERATION_DATATYPE
    };
    return ParseEnum(s, values);
}


boost::optional<Causality> ParseCausality(const std::string& s)
{
    const Causality values[] = {
        PARAMETER_CAUSALITY, CALCULATED_PARAMETER_CAUSALITY, INPUT_CAUSALITY,
        OUTPUT_CAUSALITY, LOCAL_CAUSALITY, INDEPENDENT_CAUSALITY
    };
    return ParseEnum(s, values);
}


boost::optional<Variability> ParseVariability(const std::string& s)
{
    const Variability values[] = {
        CONSTANT_VARIABILITY, FIXED_VARIABILITY, TUNABLE_VARIABILITY,
        DISCRETE_VARIABILITY, CONTINUOUS_VARIABILITY
    };
    return ParseEnum(s, values);
}


boost::optional<Initial> ParseInitial(const std::string& s)
{
    const Initial values[] = { EXACT_INITIAL, APPROX_INITIAL, CALCULATED_INITIAL };
    return ParseEnum(s, values);
}


// =============================================================================
// Values
// =============================================================================

namespace
{
    class DataTypeOfVisitor : public boost::static_visitor<DataType>
    {
    public:
        DataType operator()(double)      const FMUHANDLER_NOEXCEPT { return REAL_DATATYPE; }
        DataType operator()(int)         const FMUHANDLER_NOEXCEPT { return INTEGER_DATATYPE; }
        DataType operator()(bool)        const FMUHANDLER_NOEXCEPT { return BOOLEAN_DATATYPE; }
        DataType operator()(std::string) const FMUHANDLER_NOEXCEPT { return STRING_DATATYPE; }
    };
}

DataType DataTypeOf(const ScalarValue& v)
{
    return boost::apply_visitor(DataTypeOfVisitor{}, v);
}


namespace
{
    bool IsIntegerText(const std::string& s)
    {
        auto it = s.begin();
        if (it != s.end() && (*it == '+' || *it == '-')) ++it;
        return it != s.end() && std::all_of(it, s.end(), [] (char c) {
            return c >= '0' && c <= '9';
        });
    }

    // Checks the character set of an xs:double lexical value.  The
    // arrangement of the characters is checked by lexical_cast.
    bool IsRealText(const std::string& s)
    {
        return !s.empty() && s.find_first_not_of("0123456789+-.eE") == std::string::npos
            && s.find_first_of("0123456789") != std::string::npos;
    }

    double ParseReal(const std::string& s)
    {
        if (s == "INF") return std::numeric_limits<double>::infinity();
        if (s == "-INF") return -std::numeric_limits<double>::infinity();
        if (s == "NaN") return std::numeric_limits<double>::quiet_NaN();
        if (!IsRealText(s)) throw boost::bad_lexical_cast();
        return boost::lexical_cast<double>(s);
    }

    std::string FormatReal(double x)
    {
        if (std::isnan(x)) return "NaN";
        if (std::isinf(x)) return x > 0 ? "INF" : "-INF";
        std::string s;
        for (int precision = 1; precision <= std::numeric_limits<double>::max_digits10; ++precision) {
            std::ostringstream ss;
            ss.imbue(std::locale::classic());
            ss.precision(precision);
            ss << x;
            s = ss.str();
            if (boost::lexical_cast<double>(s) == x) break;
        }
        return s;
    }

    class FormatValueVisitor : public boost::static_visitor<std::string>
    {
    public:
        std::string operator()(double x) const { return FormatReal(x); }
        std::string operator()(int x) const { return std::to_string(x); }
        std::string operator()(bool x) const { return x ? "true" : "false"; }
        std::string operator()(const std::string& x) const { return x; }
    };

    class CoerceValueVisitor : public boost::static_visitor<ScalarValue>
    {
    public:
        CoerceValueVisitor(const std::string& variableName, DataType dataType)
            : m_variableName(variableName), m_dataType(dataType)
        { }

        ScalarValue operator()(double x) const
        {
            if (m_dataType == REAL_DATATYPE) return x;
            Reject(x);
        }

        ScalarValue operator()(int x) const
        {
            switch (m_dataType) {
                case REAL_DATATYPE:
                    return static_cast<double>(x);
                case INTEGER_DATATYPE:
                case ENUMERATION_DATATYPE:
                    return x;
                default:
                    Reject(x);
            }
        }

        ScalarValue operator()(bool x) const
        {
            if (m_dataType == BOOLEAN_DATATYPE) return x;
            Reject(x);
        }

        ScalarValue operator()(const std::string& x) const
        {
            return ParseValue(m_dataType, x, m_variableName);
        }

    private:
        [[noreturn]] void Reject(const ScalarValue& value) const
        {
            throw error::InvalidValueException(
                m_variableName, ToString(m_dataType), FormatValue(value));
        }

        const std::string& m_variableName;
        DataType m_dataType;
    };
}


ScalarValue CoerceValue(
    const std::string& variableName,
    DataType dataType,
    const ScalarValue& value)
{
    return boost::apply_visitor(CoerceValueVisitor{variableName, dataType}, value);
}


ScalarValue CoerceValue(
    const std::string& variableName,
    DataType dataType,
    const std::string& value)
{
    return CoerceValue(variableName, dataType, ScalarValue(value));
}


ScalarValue CoerceValue(
    const std::string& variableName,
    DataType dataType,
    const char* value)
{
    FMUHANDLER_INPUT_CHECK(value != nullptr);
    return CoerceValue(variableName, dataType, ScalarValue(std::string(value)));
}


ScalarValue ParseValue(
    DataType dataType,
    const std::string& text,
    const std::string& variableName)
{
    try {
        switch (dataType) {
            case REAL_DATATYPE:
                return ParseReal(text);
            case INTEGER_DATATYPE:
            case ENUMERATION_DATATYPE:
                if (!IsIntegerText(text)) throw boost::bad_lexical_cast();
                return boost::lexical_cast<int>(text);
            case BOOLEAN_DATATYPE:
                if (text == "true" || text == "1") return true;
                if (text == "false" || text == "0") return false;
                break;
            case STRING_DATATYPE:
                return text;
        }
    } catch (const boost::bad_lexical_cast&) {
        // Reported below
    }
    throw error::InvalidValueException(variableName, ToString(dataType), text);
}


std::string FormatValue(const ScalarValue& value)
{
    return boost::apply_visitor(FormatValueVisitor{}, value);
}


// =============================================================================
// ScalarVariable
// =============================================================================

namespace
{
    const std::string* FindAttribute(const AttributeList& list, const std::string& name)
    {
        for (const auto& a : list) {
            if (a.first == name) return &a.second;
        }
        return nullptr;
    }

    boost::optional<std::string> OptionalAttribute(
        const AttributeList& list, const std::string& name)
    {
        if (const auto value = FindAttribute(list, name)) return *value;
        return boost::none;
    }

    // Replaces the value of an existing attribute, or appends a new one.
    void SetAttribute(AttributeList& list, const std::string& name, const std::string& value)
    {
        for (auto& a : list) {
            if (a.first == name) {
                a.second = value;
                return;
            }
        }
        list.emplace_back(name, value);
    }

    template<typename Enum>
    Enum ParseEnumAttribute(
        const AttributeList& attributes,
        const std::string& attributeName,
        boost::optional<Enum> (*parse)(const std::string&),
        Enum defaultValue,
        const std::string& variableName)
    {
        const auto text = FindAttribute(attributes, attributeName);
        if (!text) return defaultValue;
        const auto value = parse(*text);
        if (!value) {
            throw error::ModelParseException(
                "Variable '" + variableName + "' has an invalid "
                + attributeName + ": " + *text);
        }
        return *value;
    }
}


ScalarVariable::ScalarVariable(
    const std::string& name,
    fmuhandler::model::ValueReference valueReference,
    fmuhandler::model::DataType dataType,
    fmuhandler::model::Causality causality,
    fmuhandler::model::Variability variability)
    : m_name(name),
      m_valueReference(valueReference),
      m_dataType(dataType),
      m_causality(causality),
      m_variability(variability),
      m_typeElementName(ToString(dataType))
{
    FMUHANDLER_INPUT_CHECK(!name.empty());
    m_attributes.emplace_back("name", name);
    m_attributes.emplace_back("valueReference", std::to_string(valueReference));
    m_attributes.emplace_back("causality", ToString(causality));
    m_attributes.emplace_back("variability", ToString(variability));
}


ScalarVariable ScalarVariable::Parse(
    const AttributeList& attributes,
    const std::string& typeElementName,
    const AttributeList& typeAttributes)
{
    ScalarVariable v;
    v.m_attributes = attributes;
    v.m_typeElementName = typeElementName;
    v.m_typeAttributes = typeAttributes;

    const auto name = FindAttribute(attributes, "name");
    if (!name || name->empty()) {
        throw error::ModelParseException(
            "ScalarVariable element without a 'name' attribute");
    }
    v.m_name = *name;

    const auto vr = FindAttribute(attributes, "valueReference");
    if (!vr) {
        throw error::ModelParseException(
            "Variable '" + v.m_name + "' has no valueReference");
    }
    try {
        if (vr->empty() || vr->find_first_not_of("0123456789") != std::string::npos) {
            throw boost::bad_lexical_cast();
        }
        v.m_valueReference = boost::lexical_cast<fmuhandler::model::ValueReference>(*vr);
    } catch (const boost::bad_lexical_cast&) {
        throw error::ModelParseException(
            "Variable '" + v.m_name + "' has an invalid valueReference: " + *vr);
    }

    v.m_causality = ParseEnumAttribute(
        attributes, "causality", &ParseCausality, LOCAL_CAUSALITY, v.m_name);
    v.m_variability = ParseEnumAttribute(
        attributes, "variability", &ParseVariability, CONTINUOUS_VARIABILITY, v.m_name);
    if (const auto initial = FindAttribute(attributes, "initial")) {
        v.m_initial = ParseInitial(*initial);
        if (!v.m_initial) {
            throw error::ModelParseException(
                "Variable '" + v.m_name + "' has an invalid initial: " + *initial);
        }
    }

    const auto dataType = ParseDataType(typeElementName);
    if (!dataType) {
        throw error::ModelParseException(typeElementName.empty()
            ? "Variable '" + v.m_name + "' has no type element"
            : "Variable '" + v.m_name + "' has an unknown type: " + typeElementName);
    }
    v.m_dataType = *dataType;

    if (const auto start = FindAttribute(typeAttributes, "start")) {
        v.m_start = ParseValue(v.m_dataType, *start, v.m_name);
    }
    return v;
}


const std::string& ScalarVariable::Name() const FMUHANDLER_NOEXCEPT
{
    return m_name;
}


fmuhandler::model::ValueReference ScalarVariable::ValueReference() const FMUHANDLER_NOEXCEPT
{
    return m_valueReference;
}


boost::optional<std::string> ScalarVariable::Description() const
{
    return OptionalAttribute(m_attributes, "description");
}


fmuhandler::model::Causality ScalarVariable::Causality() const FMUHANDLER_NOEXCEPT
{
    return m_causality;
}


fmuhandler::model::Variability ScalarVariable::Variability() const FMUHANDLER_NOEXCEPT
{
    return m_variability;
}


boost::optional<fmuhandler::model::Initial> ScalarVariable::Initial() const FMUHANDLER_NOEXCEPT
{
    return m_initial;
}


fmuhandler::model::DataType ScalarVariable::DataType() const FMUHANDLER_NOEXCEPT
{
    return m_dataType;
}


const boost::optional<ScalarValue>& ScalarVariable::Start() const FMUHANDLER_NOEXCEPT
{
    return m_start;
}


boost::optional<std::string> ScalarVariable::Unit() const
{
    return OptionalAttribute(m_typeAttributes, "unit");
}


boost::optional<std::string> ScalarVariable::TypeAttribute(const std::string& name) const
{
    return OptionalAttribute(m_typeAttributes, name);
}


const AttributeList& ScalarVariable::Attributes() const FMUHANDLER_NOEXCEPT
{
    return m_attributes;
}


const std::string& ScalarVariable::TypeElementName() const FMUHANDLER_NOEXCEPT
{
    return m_typeElementName;
}


const AttributeList& ScalarVariable::TypeAttributes() const FMUHANDLER_NOEXCEPT
{
    return m_typeAttributes;
}


void ScalarVariable::SetStart(const ScalarValue& value)
{
    auto coerced = CoerceValue(m_name, m_dataType, value);
    SetAttribute(m_typeAttributes, "start", FormatValue(coerced));
    m_start = std::move(coerced);
}


void ScalarVariable::SetStart(const std::string& value)
{
    SetStart(ScalarValue(value));
}


void ScalarVariable::SetStart(const char* value)
{
    FMUHANDLER_INPUT_CHECK(value != nullptr);
    SetStart(ScalarValue(std::string(value)));
}


void ScalarVariable::SetDescription(const std::string& value)
{
    SetAttribute(m_attributes, "description", value);
}


void ScalarVariable::SetCausality(fmuhandler::model::Causality value)
{
    SetAttribute(m_attributes, "causality", ToString(value));
    m_causality = value;
}


void ScalarVariable::SetVariability(fmuhandler::model::Variability value)
{
    SetAttribute(m_attributes, "variability", ToString(value));
    m_variability = value;
}


void ScalarVariable::SetTypeAttribute(const std::string& name, const std::string& value)
{
    FMUHANDLER_INPUT_CHECK(!name.empty() && name != "start");
    SetAttribute(m_typeAttributes, name, value);
}


bool operator==(const ScalarVariable& a, const ScalarVariable& b)
{
    return a.Name() == b.Name();
}


bool operator!=(const ScalarVariable& a, const ScalarVariable& b)
{
    return !(a == b);
}


}} // namespace
