/**
\file
\brief  Helpers for working with libxml2.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_XML_HPP
#define FMUHANDLER_XML_HPP

#include <memory>
#include <string>

#include <libxml/tree.h>
#include <libxml/xmlerror.h>
#include <libxml/xmlversion.h>

#include <fmuhandler/config.h>
#include <fmuhandler/model.hpp>


namespace fmuhandler
{
/// Internal helpers for libxml2.
namespace xml
{


// libxml2 2.12 made the error argument of structured error handlers const.
#if LIBXML_VERSION >= 21200
typedef const xmlError* ErrorArg;
#else
typedef xmlErrorPtr ErrorArg;
#endif


/// Initializes libxml2.  Safe to call any number of times.
void Initialize();


/// Deleter for `std::unique_ptr<xmlDoc>`.
struct DocDeleter
{
    void operator()(xmlDoc* doc) const FMUHANDLER_NOEXCEPT { xmlFreeDoc(doc); }
};

/// An owning pointer to a libxml2 document.
typedef std::unique_ptr<xmlDoc, DocDeleter> DocPtr;


/**
\brief  Parses an XML document.

Whitespace is kept, network access is disabled and no messages are printed.

\param [in] bytes
    The document text.
\param [in] url
    A name for the document, used in diagnostics.

\throws fmuhandler::error::MalformedXmlException
    If the document is not well-formed.
*/
DocPtr Parse(const std::string& bytes, const std::string& url = std::string());


/**
\brief  Serializes a document as UTF-8, with an XML declaration.

Whitespace is written exactly as it is stored in the tree, so serializing a
document which has just been parsed reproduces the input, as long as the
input was in libxml2's own output form.
*/
std::string Serialize(xmlDoc* doc);


/// Converts a (possibly null) libxml2 string to a `std::string`.
std::string ToString(const xmlChar* s);


/// Returns whether `node` is an element with the given name.
bool IsElement(const xmlNode* node, const char* name) FMUHANDLER_NOEXCEPT;


/// Returns the first child element of `node` with the given name, or null.
xmlNode* FindChildElement(xmlNode* node, const char* name) FMUHANDLER_NOEXCEPT;


/// Returns the value of an attribute, or nothing if it is absent.
boost::optional<std::string> Attribute(const xmlNode* node, const char* name);


/// Returns all attributes of an element, in document order.
fmuhandler::model::AttributeList Attributes(const xmlNode* node);


/// Replaces all attributes of an element with the ones in `attributes`.
void SetAttributes(xmlNode* node, const fmuhandler::model::AttributeList& attributes);


/**
\brief  Converts a libxml2 error message to a single line of text.

libxml2 messages end with a newline, which is removed here.
*/
std::string ErrorMessage(ErrorArg error);


}} // namespace
#endif // header guard
