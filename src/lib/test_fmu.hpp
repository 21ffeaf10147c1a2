// Test data shared by the unit tests.
#ifndef FMUHANDLER_TEST_FMU_HPP
#define FMUHANDLER_TEST_FMU_HPP

#include <initializer_list>
#include <string>
#include <boost/filesystem/path.hpp>


namespace fmuhandler
{
namespace test
{


/**
\brief  A model description which uses most of the FMI 2.0 sections.

It contains the variables `Var1` (Real parameter, start 0), `A` (Integer
parameter), `B` (Boolean output with annotations), `label` (String parameter)
and `mode` (Enumeration input), in that order.  It is written the way libxml2
writes documents, so it survives a parse/serialize round trip unchanged.
*/
extern const std::string FULL_MODEL_DESCRIPTION;


/**
\brief  Returns a small model description with the given ScalarVariable
        elements.

Each entry of `variables` should be a complete `<ScalarVariable>` element
without indentation or line breaks.
*/
std::string MinimalModelDescription(
    const std::string& modelName,
    std::initializer_list<std::string> variables,
    const std::string& modelStructure = std::string());


/// The contents of the `binaries/model.so` member written by MakeFmu().
extern const std::string BINARY_CONTENTS;


/**
\brief  Creates an FMU at `path`.

The archive contains `modelDescription.xml` (DEFLATE compression),
`binaries/` (directory), `binaries/model.so` (stored uncompressed) and
`resources/data.txt`, in that order.
*/
void MakeFmu(const boost::filesystem::path& path, const std::string& modelDescription);


}} // namespace
#endif // header guard
