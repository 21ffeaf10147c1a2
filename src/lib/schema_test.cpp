#include <fstream>
#include <stdexcept>
#include <string>
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <fmuhandler/error.hpp>
#include <fmuhandler/schema.hpp>
#include <fmuhandler/util/filesystem.hpp>
#include "test_fmu.hpp"

using namespace fmuhandler;


namespace
{
    const char* const PERSON_SCHEMA =
        R"(<?xml version="1.0" encoding="UTF-8"?>
<xs:schema xmlns:xs="http://www.w3.org/2001/XMLSchema">
  <xs:element name="person">
    <xs:complexType>
      <xs:attribute name="name" type="xs:string" use="required"/>
      <xs:attribute name="age" type="xs:unsignedInt"/>
    </xs:complexType>
  </xs:element>
</xs:schema>
)";

    void WriteFile(const boost::filesystem::path& path, const std::string& contents)
    {
        std::ofstream f(path.string(), std::ios::binary);
        f << contents;
    }
}


TEST(fmuhandler_schema, Canonical)
{
    const auto validator = SchemaValidator::Canonical();
    ASSERT_TRUE(!!validator);
    EXPECT_EQ(validator, SchemaValidator::Canonical());
    EXPECT_EQ("fmi2ModelDescription.xsd", validator->SchemaPath().filename().string());
    EXPECT_EQ(CanonicalSchemaPath(), validator->SchemaPath());

    const auto ok = validator->Validate(test::FULL_MODEL_DESCRIPTION);
    EXPECT_TRUE(ok.valid);
    EXPECT_TRUE(ok.diagnostics.empty());

    auto noGuid = test::MinimalModelDescription("M", {
        R"(<ScalarVariable name="x" valueReference="1"><Real/></ScalarVariable>)"
    });
    const auto guidPos = noGuid.find(" guid=\"");
    noGuid.erase(guidPos, noGuid.find('"', guidPos + 7) + 1 - guidPos);
    ASSERT_EQ(std::string::npos, noGuid.find("guid"));
    const auto bad = validator->Validate(noGuid);
    EXPECT_FALSE(bad.valid);
    ASSERT_FALSE(bad.diagnostics.empty());
    EXPECT_EQ(2, bad.diagnostics.front().line);
    EXPECT_NE(std::string::npos, bad.diagnostics.front().message.find("guid"));

    EXPECT_THROW(validator->Validate("<fmiModelDescription>"), error::MalformedXmlException);
}


TEST(fmuhandler_schema, CustomSchema)
{
    util::TempDir tmp;
    const auto schemaPath = tmp.Path() / "person.xsd";
    WriteFile(schemaPath, PERSON_SCHEMA);

    const SchemaValidator validator(schemaPath);
    EXPECT_EQ(schemaPath, validator.SchemaPath());
    EXPECT_TRUE(validator.Validate(R"(<person name="Ann" age="30"/>)").valid);

    const auto r1 = validator.Validate(R"(<person age="30"/>)");
    EXPECT_FALSE(r1.valid);
    EXPECT_FALSE(r1.diagnostics.empty());

    const auto r2 = validator.Validate("<person\n name=\"Bob\"\n age=\"-1\"/>");
    EXPECT_FALSE(r2.valid);
    ASSERT_FALSE(r2.diagnostics.empty());
    EXPECT_GT(r2.diagnostics.front().line, 0);

    EXPECT_FALSE(validator.Validate("<animal/>").valid);
    // The validator can be reused after a failure.
    EXPECT_TRUE(validator.Validate(R"(<person name="Cecilia"/>)").valid);
}


TEST(fmuhandler_schema, BadSchema)
{
    util::TempDir tmp;
    EXPECT_THROW(SchemaValidator(tmp.Path() / "missing.xsd"), std::runtime_error);

    const auto notSchema = tmp.Path() / "not_schema.xsd";
    WriteFile(notSchema, "<?xml version=\"1.0\"?>\n<person name=\"Ann\"/>\n");
    EXPECT_THROW(SchemaValidator{notSchema}, std::runtime_error);

    const auto notXml = tmp.Path() / "not_xml.xsd";
    WriteFile(notXml, "<xs:schema");
    EXPECT_THROW(SchemaValidator{notXml}, std::runtime_error);
}
