/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/model_description.hpp>

#include <cassert>
#include <new>
#include <stdexcept>
#include <unordered_map>
#include <utility>

#include <fmuhandler/error.hpp>
#include <fmuhandler/log.hpp>
#include <fmuhandler/util.hpp>
#include <fmuhandler/xml.hpp>


namespace fmuhandler
{

// =============================================================================
// VariableQuery
// =============================================================================

void VariableQuery::SetStart(const model::ScalarValue& value)
{
    start = value;
}


void VariableQuery::SetStart(const std::string& value)
{
    start = model::ScalarValue(value);
}


void VariableQuery::SetStart(const char* value)
{
    FMUHANDLER_INPUT_CHECK(value != nullptr);
    start = model::ScalarValue(std::string(value));
}


bool VariableQuery::Matches(const model::ScalarVariable& variable) const
{
    if (name && *name != variable.Name()) return false;
    if (valueReference && *valueReference != variable.ValueReference()) return false;
    if (causality && *causality != variable.Causality()) return false;
    if (variability && *variability != variable.Variability()) return false;
    if (initial && initial != variable.Initial()) return false;
    if (dataType && *dataType != variable.DataType()) return false;
    if (unit && unit != variable.Unit()) return false;
    if (description && description != variable.Description()) return false;
    if (start) {
        if (!variable.Start()) return false;
        try {
            const auto wanted = model::CoerceValue(variable.Name(), variable.DataType(), *start);
            if (!(wanted == *variable.Start())) return false;
        } catch (const error::InvalidValueException&) {
            // A value of the wrong type never matches.
            return false;
        }
    }
    return true;
}


// =============================================================================
// ModelDescription::Impl
// =============================================================================

namespace
{
    // The type element is the first child element which is not Annotations.
    xmlNode* TypeElement(xmlNode* variableNode)
    {
        for (auto child = variableNode->children; child != nullptr; child = child->next) {
            if (child->type == XML_ELEMENT_NODE && !xml::IsElement(child, "Annotations")) {
                return child;
            }
        }
        return nullptr;
    }

    bool IsBlankText(const xmlNode* node)
    {
        return node != nullptr && node->type == XML_TEXT_NODE && xmlIsBlankNode(
            const_cast<xmlNode*>(node));
    }

    xmlNode* NewText(xmlDoc* doc, const std::string& content)
    {
        const auto node = xmlNewDocText(doc, BAD_CAST content.c_str());
        if (node == nullptr) throw std::bad_alloc();
        return node;
    }

    xmlNode* NewElement(xmlDoc* doc, const std::string& name)
    {
        const auto node = xmlNewDocNode(doc, nullptr, BAD_CAST name.c_str(), nullptr);
        if (node == nullptr) throw std::bad_alloc();
        return node;
    }

    // Copies the attributes of `variable` into its element and type element.
    void WriteVariable(const model::ScalarVariable& variable, xmlNode* node)
    {
        xml::SetAttributes(node, variable.Attributes());
        const auto typeNode = TypeElement(node);
        assert(typeNode != nullptr);
        xml::SetAttributes(typeNode, variable.TypeAttributes());
    }
}


class ModelDescription::Impl
{
public:
    explicit Impl(xml::DocPtr doc)
        : m_doc(std::move(doc))
    {
        const auto root = xmlDocGetRootElement(m_doc.get());
        if (!xml::IsElement(root, "fmiModelDescription")) {
            throw error::ModelParseException(
                "Root element is not fmiModelDescription but "
                + xml::ToString(root->name));
        }
        const auto version = xml::Attribute(root, "fmiVersion");
        if (!version) {
            throw error::ModelParseException("fmiVersion attribute missing");
        }
        if (*version != FMUHANDLER_FMI_VERSION) {
            throw error::ModelParseException("Unsupported FMI version: " + *version);
        }
        m_modelVariables = xml::FindChildElement(root, "ModelVariables");
        if (m_modelVariables == nullptr) {
            throw error::ModelParseException("ModelVariables element missing");
        }

        for (auto node = m_modelVariables->children; node != nullptr; node = node->next) {
            if (!xml::IsElement(node, "ScalarVariable")) continue;
            const auto typeNode = TypeElement(node);
            auto variable = model::ScalarVariable::Parse(
                xml::Attributes(node),
                typeNode ? xml::ToString(typeNode->name) : std::string(),
                typeNode ? xml::Attributes(typeNode) : model::AttributeList());
            if (m_index.count(variable.Name())) {
                throw error::ModelParseException(
                    "Duplicate variable name: " + variable.Name());
            }
            m_index.emplace(variable.Name(), m_variables.size());
            m_variables.push_back(std::move(variable));
            m_nodes.push_back(node);
        }
        if (m_variables.empty()) {
            throw error::ModelParseException("No ScalarVariable elements found");
        }
    }

    std::string RootAttribute(const char* name) const
    {
        const auto value = xml::Attribute(xmlDocGetRootElement(m_doc.get()), name);
        return value ? *value : std::string();
    }

    const std::vector<model::ScalarVariable>& Variables() const FMUHANDLER_NOEXCEPT
    {
        return m_variables;
    }

    bool Has(const std::string& name) const
    {
        return m_index.count(name) > 0;
    }

    std::size_t IndexOf(const std::string& name) const
    {
        const auto it = m_index.find(name);
        if (it == m_index.end()) throw error::VariableNotFoundException(name);
        return it->second;
    }

    // Applies `modify` to a copy of the variable, and only commits the
    // change if it succeeds.
    template<typename F>
    void Modify(const std::string& name, F modify)
    {
        const auto i = IndexOf(name);
        auto variable = m_variables[i];
        modify(variable);
        WriteVariable(variable, m_nodes[i]);
        m_variables[i] = std::move(variable);
    }

    void Delete(const std::string& name)
    {
        const auto i = IndexOf(name);
        const auto node = m_nodes[i];
        if (IsBlankText(node->prev)) {
            const auto indent = node->prev;
            xmlUnlinkNode(indent);
            xmlFreeNode(indent);
        }
        xmlUnlinkNode(node);
        xmlFreeNode(node);

        m_variables.erase(m_variables.begin() + i);
        m_nodes.erase(m_nodes.begin() + i);
        m_index.erase(name);
        for (auto& entry : m_index) {
            if (entry.second > i) --entry.second;
        }
    }

    void Add(const model::ScalarVariable& variable)
    {
        if (Has(variable.Name())) {
            throw std::invalid_argument(
                "A variable with this name already exists: " + variable.Name());
        }
        const auto doc = m_doc.get();

        // Indent the new element like its predecessor.
        std::string indent;
        xmlNode* closingText = nullptr;
        if (!m_nodes.empty()) {
            if (IsBlankText(m_nodes.back()->prev)) {
                indent = xml::ToString(m_nodes.back()->prev->content);
            }
        } else if (IsBlankText(m_modelVariables->last)) {
            closingText = m_modelVariables->last;
            indent = xml::ToString(closingText->content) + "  ";
        }

        const auto node = NewElement(doc, "ScalarVariable");
        auto freeNode = util::OnScopeExit([node] () { xmlFreeNode(node); });
        if (!indent.empty()) xmlAddChild(node, NewText(doc, indent + "  "));
        xmlAddChild(node, NewElement(doc, variable.TypeElementName()));
        if (!indent.empty()) xmlAddChild(node, NewText(doc, indent));
        WriteVariable(variable, node);

        const auto indentNode = indent.empty() ? nullptr : NewText(doc, indent);
        auto freeIndent = util::OnScopeExit([indentNode] () {
            if (indentNode) xmlFreeNode(indentNode);
        });

        m_variables.reserve(m_variables.size() + 1);
        m_nodes.reserve(m_nodes.size() + 1);

        // The element is inserted first, and the whitespace before it
        // afterwards, so that libxml2 does not merge the new whitespace into
        // the text node which follows the previous element.
        if (!m_nodes.empty()) {
            xmlAddNextSibling(m_nodes.back(), node);
        } else if (closingText != nullptr) {
            xmlAddPrevSibling(closingText, node);
        } else {
            xmlAddChild(m_modelVariables, node);
        }
        if (indentNode) xmlAddPrevSibling(node, indentNode);
        freeNode.Dismiss();
        freeIndent.Dismiss();

        m_index.emplace(variable.Name(), m_variables.size());
        m_variables.push_back(variable);
        m_nodes.push_back(node);
    }

    std::string Serialize() const
    {
        return xml::Serialize(m_doc.get());
    }

private:
    xml::DocPtr m_doc;
    xmlNode* m_modelVariables = nullptr;
    std::vector<model::ScalarVariable> m_variables;
    std::vector<xmlNode*> m_nodes;
    std::unordered_map<std::string, std::size_t> m_index;
};


// =============================================================================
// ModelDescription
// =============================================================================

ModelDescription ModelDescription::Parse(const std::string& xmlBytes)
{
    auto impl = std::make_unique<Impl>(xml::Parse(xmlBytes, "modelDescription.xml"));
    auto md = ModelDescription(std::move(impl));
    FMUHANDLER_LOG_DEBUG(boost::format("Parsed model description of '%s' with %d variables")
        % md.ModelName() % md.Variables().size());
    return md;
}


ModelDescription::ModelDescription(std::unique_ptr<Impl> impl) FMUHANDLER_NOEXCEPT
    : m_impl(std::move(impl))
{
}


ModelDescription::ModelDescription(ModelDescription&&) FMUHANDLER_NOEXCEPT = default;
ModelDescription& ModelDescription::operator=(ModelDescription&&) FMUHANDLER_NOEXCEPT = default;
ModelDescription::~ModelDescription() FMUHANDLER_NOEXCEPT = default;


std::string ModelDescription::FmiVersion() const
{
    return m_impl->RootAttribute("fmiVersion");
}


std::string ModelDescription::ModelName() const
{
    return m_impl->RootAttribute("modelName");
}


std::string ModelDescription::Guid() const
{
    return m_impl->RootAttribute("guid");
}


const std::vector<model::ScalarVariable>& ModelDescription::Variables() const FMUHANDLER_NOEXCEPT
{
    return m_impl->Variables();
}


bool ModelDescription::HasVariable(const std::string& name) const
{
    return m_impl->Has(name);
}


const model::ScalarVariable& ModelDescription::Variable(const std::string& name) const
{
    return m_impl->Variables()[m_impl->IndexOf(name)];
}


std::vector<model::ScalarVariable> ModelDescription::QueryVariables(
    const VariableQuery& query) const
{
    std::vector<model::ScalarVariable> result;
    for (const auto& v : m_impl->Variables()) {
        if (query.Matches(v)) result.push_back(v);
    }
    return result;
}


void ModelDescription::SetStartValue(
    const std::string& name,
    const model::ScalarValue& value)
{
    m_impl->Modify(name, [&value] (model::ScalarVariable& v) { v.SetStart(value); });
}


void ModelDescription::SetStartValue(
    const std::string& name,
    const std::string& value)
{
    SetStartValue(name, model::ScalarValue(value));
}


void ModelDescription::SetStartValue(
    const std::string& name,
    const char* value)
{
    FMUHANDLER_INPUT_CHECK(value != nullptr);
    SetStartValue(name, model::ScalarValue(std::string(value)));
}


void ModelDescription::SetDescription(
    const std::string& name,
    const std::string& description)
{
    m_impl->Modify(name, [&description] (model::ScalarVariable& v) {
        v.SetDescription(description);
    });
}


void ModelDescription::SetCausality(
    const std::string& name,
    model::Causality causality)
{
    m_impl->Modify(name, [causality] (model::ScalarVariable& v) {
        v.SetCausality(causality);
    });
}


void ModelDescription::SetVariability(
    const std::string& name,
    model::Variability variability)
{
    m_impl->Modify(name, [variability] (model::ScalarVariable& v) {
        v.SetVariability(variability);
    });
}


void ModelDescription::DeleteVariable(const std::string& name)
{
    m_impl->Delete(name);
    FMUHANDLER_LOG_TRACE(boost::format("Deleted variable '%s'") % name);
}


void ModelDescription::AddVariable(const model::ScalarVariable& variable)
{
    m_impl->Add(variable);
    FMUHANDLER_LOG_TRACE(boost::format("Added variable '%s'") % variable.Name());
}


std::string ModelDescription::ToXmlBytes() const
{
    return m_impl->Serialize();
}


ValidationResult ModelDescription::Validate(const SchemaValidator& validator) const
{
    return validator.Validate(ToXmlBytes());
}


ValidationResult ModelDescription::Validate() const
{
    return Validate(*SchemaValidator::Canonical());
}


} // namespace
