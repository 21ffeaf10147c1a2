/**
\file
\brief  The model description document of an FMU.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_MODEL_DESCRIPTION_HPP
#define FMUHANDLER_MODEL_DESCRIPTION_HPP

#include <memory>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include <fmuhandler/config.h>
#include <fmuhandler/model.hpp>
#include <fmuhandler/schema.hpp>


namespace fmuhandler
{


/**
\brief  Criteria for selecting variables with ModelDescription::QueryVariables().

A variable matches if it matches every criterion which is set.  Criteria
which are not set are ignored, so an empty query matches all variables.
*/
struct VariableQuery
{
    boost::optional<std::string> name;
    boost::optional<fmuhandler::model::ValueReference> valueReference;
    boost::optional<fmuhandler::model::Causality> causality;
    boost::optional<fmuhandler::model::Variability> variability;
    boost::optional<fmuhandler::model::Initial> initial;
    boost::optional<fmuhandler::model::DataType> dataType;
    boost::optional<std::string> unit;
    boost::optional<std::string> description;

    /**
    \brief  The start value.

    This is converted to the data type of each variable before comparison,
    so that e.g. an `int` matches a Real variable with the same value.
    Use SetStart() to set it from a string literal, since assigning one
    directly stores a `bool`.
    */
    boost::optional<fmuhandler::model::ScalarValue> start;

    /// Sets `start`.
    void SetStart(const fmuhandler::model::ScalarValue& value);

    /// Sets `start` to a textual value, which is parsed per variable.
    void SetStart(const std::string& value);

    /**
    \brief  Sets `start` to a textual value, which is parsed per variable.
    \throws std::invalid_argument
        If `value` is null.
    */
    void SetStart(const char* value);

    /// Whether `variable` matches all criteria.
    bool Matches(const fmuhandler::model::ScalarVariable& variable) const;
};


/**
\brief  A parsed `modelDescription.xml` document.

The object holds the complete XML tree, so that everything which is not a
ScalarVariable (other sections, comments, whitespace, annotations) is written
back unchanged by ToXmlBytes().  The variables are additionally available as
fmuhandler::model::ScalarVariable objects, in declaration order.

Variables can only be modified through the member functions of this class,
which keep the objects and the XML tree in step.  The document is not
validated against the schema after each change; call Validate() for that.
*/
class ModelDescription
{
public:
    /**
    \brief  Parses a model description.

    \throws fmuhandler::error::MalformedXmlException
        If `xmlBytes` is not well-formed XML.
    \throws fmuhandler::error::ModelParseException
        If the root element is not `fmiModelDescription`, if the FMI version
        is not 2.0, if there is no `ModelVariables` element or no
        `ScalarVariable` element, if two variables have the same name, or
        if a variable is malformed.
    \throws fmuhandler::error::InvalidValueException
        If a start value does not match the variable's data type.
    */
    static ModelDescription Parse(const std::string& xmlBytes);

    ModelDescription(const ModelDescription&) = delete;
    ModelDescription& operator=(const ModelDescription&) = delete;

    ModelDescription(ModelDescription&&) FMUHANDLER_NOEXCEPT;
    ModelDescription& operator=(ModelDescription&&) FMUHANDLER_NOEXCEPT;

    ~ModelDescription() FMUHANDLER_NOEXCEPT;

    /// The `fmiVersion` attribute.
    std::string FmiVersion() const;

    /// The `modelName` attribute.
    std::string ModelName() const;

    /// The `guid` attribute.
    std::string Guid() const;

    /**
    \brief  All variables, in declaration order.

    References into the returned vector are invalidated by DeleteVariable()
    and AddVariable().
    */
    const std::vector<fmuhandler::model::ScalarVariable>& Variables() const FMUHANDLER_NOEXCEPT;

    /// Returns whether there is a variable with the given name.
    bool HasVariable(const std::string& name) const;

    /**
    \brief  Returns the variable with the given name.

    The reference is invalidated by DeleteVariable() and AddVariable(): it
    may then refer to another variable, or dangle.  Copy the variable if it
    is needed across such calls.  The setters update the variable in place.

    \throws fmuhandler::error::VariableNotFoundException
        If there is no such variable.
    */
    const fmuhandler::model::ScalarVariable& Variable(const std::string& name) const;

    /// Returns copies of the variables that match `query`, in declaration order.
    std::vector<fmuhandler::model::ScalarVariable> QueryVariables(
        const VariableQuery& query) const;

    /**
    \brief  Sets the start value of a variable.

    The value is converted according to fmuhandler::model::CoerceValue().

    \throws fmuhandler::error::VariableNotFoundException
        If there is no such variable.
    \throws fmuhandler::error::InvalidValueException
        If the value does not match the variable's data type.  The variable
        is not changed.
    */
    void SetStartValue(const std::string& name, const fmuhandler::model::ScalarValue& value);

    /// Sets the start value of a variable from its textual representation.
    void SetStartValue(const std::string& name, const std::string& value);

    /**
    \brief  Sets the start value of a variable from its textual representation.
    \throws std::invalid_argument
        If `value` is null.
    */
    void SetStartValue(const std::string& name, const char* value);

    /**
    \brief  Sets the description of a variable.
    \throws fmuhandler::error::VariableNotFoundException
        If there is no such variable.
    */
    void SetDescription(const std::string& name, const std::string& description);

    /**
    \brief  Sets the causality of a variable.
    \throws fmuhandler::error::VariableNotFoundException
        If there is no such variable.
    */
    void SetCausality(const std::string& name, fmuhandler::model::Causality causality);

    /**
    \brief  Sets the variability of a variable.
    \throws fmuhandler::error::VariableNotFoundException
        If there is no such variable.
    */
    void SetVariability(const std::string& name, fmuhandler::model::Variability variability);

    /**
    \brief  Removes a variable, along with its element.

    Other parts of the document which refer to the variable, such as
    `ModelStructure` entries, are left as they are.  (In FMI 2.0 these refer
    to variables by their position, so they may refer to the wrong variable
    or to none at all afterwards.)

    \throws fmuhandler::error::VariableNotFoundException
        If there is no such variable, which is also the case if it has been
        deleted already.
    */
    void DeleteVariable(const std::string& name);

    /**
    \brief  Adds a variable after the existing ones.

    \throws std::invalid_argument
        If there is already a variable with the same name.
    */
    void AddVariable(const fmuhandler::model::ScalarVariable& variable);

    /**
    \brief  Serializes the document.

    The output is UTF-8 with an XML declaration.  It only depends on the
    current contents of the document, so calling this function twice without
    changes in between gives identical results.
    */
    std::string ToXmlBytes() const;

    /**
    \brief  Validates the document against a schema.

    \throws fmuhandler::error::MalformedXmlException
        If the serialized document is not well-formed.  This does not happen
        for documents which have been produced by this class.
    */
    ValidationResult Validate(const SchemaValidator& validator) const;

    /// Validates the document against the FMI 2.0 schema bundled with the library.
    ValidationResult Validate() const;

private:
    class Impl;
    explicit ModelDescription(std::unique_ptr<Impl> impl) FMUHANDLER_NOEXCEPT;

    std::unique_ptr<Impl> m_impl;
};


} // namespace
#endif // header guard
