/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/xml.hpp>

#include <climits>
#include <cstring>
#include <mutex>
#include <new>
#include <stdexcept>

#include <libxml/parser.h>

#include <fmuhandler/error.hpp>
#include <fmuhandler/util.hpp>


namespace fmuhandler
{
namespace xml
{


void Initialize()
{
    static std::once_flag initFlag;
    std::call_once(initFlag, [] () { xmlInitParser(); });
}


DocPtr Parse(const std::string& bytes, const std::string& url)
{
    Initialize();
    FMUHANDLER_INPUT_CHECK(bytes.size() <= static_cast<std::size_t>(INT_MAX));

    const auto ctxt = xmlNewParserCtxt();
    if (ctxt == nullptr) throw std::bad_alloc();
    const auto freeCtxt = util::OnScopeExit([ctxt] () { xmlFreeParserCtxt(ctxt); });

    auto doc = DocPtr(xmlCtxtReadMemory(
        ctxt,
        bytes.data(),
        static_cast<int>(bytes.size()),
        url.empty() ? nullptr : url.c_str(),
        nullptr,
        XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING | XML_PARSE_BIG_LINES));
    if (!doc || !ctxt->wellFormed) {
        const auto lastError = xmlCtxtGetLastError(ctxt);
        if (lastError == nullptr) {
            throw error::MalformedXmlException("Unknown XML parser error", 0);
        }
        throw error::MalformedXmlException(ErrorMessage(lastError), lastError->line);
    }
    if (xmlDocGetRootElement(doc.get()) == nullptr) {
        throw error::MalformedXmlException("Document has no root element", 0);
    }
    return doc;
}


std::string Serialize(xmlDoc* doc)
{
    FMUHANDLER_INPUT_CHECK(doc != nullptr);
    xmlChar* buffer = nullptr;
    int size = 0;
    xmlDocDumpMemoryEnc(doc, &buffer, &size, "UTF-8");
    if (buffer == nullptr) {
        throw std::runtime_error("Failed to serialize XML document");
    }
    const auto freeBuffer = util::OnScopeExit([buffer] () { xmlFree(buffer); });
    return std::string(reinterpret_cast<const char*>(buffer), size);
}


std::string ToString(const xmlChar* s)
{
    return s ? std::string(reinterpret_cast<const char*>(s)) : std::string();
}


bool IsElement(const xmlNode* node, const char* name) FMUHANDLER_NOEXCEPT
{
    return node != nullptr
        && node->type == XML_ELEMENT_NODE
        && xmlStrEqual(node->name, BAD_CAST name);
}


xmlNode* FindChildElement(xmlNode* node, const char* name) FMUHANDLER_NOEXCEPT
{
    for (auto child = node->children; child != nullptr; child = child->next) {
        if (IsElement(child, name)) return child;
    }
    return nullptr;
}


namespace
{
    std::string AttributeName(const xmlAttr* attr)
    {
        auto name = ToString(attr->name);
        if (attr->ns != nullptr && attr->ns->prefix != nullptr) {
            name = ToString(attr->ns->prefix) + ':' + name;
        }
        return name;
    }

    std::string AttributeValue(const xmlAttr* attr)
    {
        const auto value = xmlNodeListGetString(attr->doc, attr->children, 1);
        const auto freeValue = util::OnScopeExit([value] () { xmlFree(value); });
        return ToString(value);
    }
}


boost::optional<std::string> Attribute(const xmlNode* node, const char* name)
{
    for (auto attr = node->properties; attr != nullptr; attr = attr->next) {
        if (AttributeName(attr) == name) return AttributeValue(attr);
    }
    return boost::none;
}


fmuhandler::model::AttributeList Attributes(const xmlNode* node)
{
    fmuhandler::model::AttributeList list;
    for (auto attr = node->properties; attr != nullptr; attr = attr->next) {
        list.emplace_back(AttributeName(attr), AttributeValue(attr));
    }
    return list;
}


void SetAttributes(xmlNode* node, const fmuhandler::model::AttributeList& attributes)
{
    // Prefixed attributes are recreated under their qualified name, which
    // serializes to the same text.
    xmlAttr* attr = node->properties;
    while (attr != nullptr) {
        const auto next = attr->next;
        xmlRemoveProp(attr);
        attr = next;
    }
    for (const auto& a : attributes) {
        if (xmlNewProp(node, BAD_CAST a.first.c_str(), BAD_CAST a.second.c_str()) == nullptr) {
            throw std::bad_alloc();
        }
    }
}


std::string ErrorMessage(ErrorArg error)
{
    if (error == nullptr || error->message == nullptr) return "Unknown error";
    std::string msg = error->message;
    while (!msg.empty() && (msg.back() == '\n' || msg.back() == '\r' || msg.back() == ' ')) {
        msg.pop_back();
    }
    return msg;
}


}} // namespace
