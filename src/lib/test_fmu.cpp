#include "test_fmu.hpp"

#include "fmuhandler/util/zip.hpp"


namespace fmuhandler
{
namespace test
{


const std::string FULL_MODEL_DESCRIPTION =
R"(<?xml version="1.0" encoding="UTF-8"?>
<fmiModelDescription fmiVersion="2.0" modelName="TestModel" guid="{8c4e810f-3df3-4a00-8276-176fa3c9f000}" description="A model for testing" generationTool="handwritten" variableNamingConvention="structured" numberOfEventIndicators="0">
  <CoSimulation modelIdentifier="TestModel" canHandleVariableCommunicationStepSize="true"/>
  <UnitDefinitions>
    <Unit name="m">
      <BaseUnit m="1"/>
    </Unit>
  </UnitDefinitions>
  <TypeDefinitions>
    <SimpleType name="Mode">
      <Enumeration>
        <Item name="off" value="1"/>
        <Item name="on" value="2"/>
      </Enumeration>
    </SimpleType>
  </TypeDefinitions>
  <DefaultExperiment startTime="0" stopTime="10"/>
  <ModelVariables>
    <!-- Index 1 -->
    <ScalarVariable name="Var1" valueReference="0" description="first variable" causality="parameter" variability="fixed" initial="exact">
      <Real start="0" unit="m" min="-100" max="100"/>
    </ScalarVariable>
    <!-- Index 2 -->
    <ScalarVariable name="A" valueReference="1" causality="parameter" variability="tunable">
      <Integer start="3"/>
    </ScalarVariable>
    <!-- Index 3 -->
    <ScalarVariable name="B" valueReference="2" causality="output" variability="discrete">
      <Boolean/>
      <Annotations>
        <Tool name="test">
          <marker/>
        </Tool>
      </Annotations>
    </ScalarVariable>
    <!-- Index 4 -->
    <ScalarVariable name="label" valueReference="3" causality="parameter" variability="fixed">
      <String start="fish &amp; chips"/>
    </ScalarVariable>
    <!-- Index 5 -->
    <ScalarVariable name="mode" valueReference="4" causality="input" variability="discrete" canHandleMultipleSetPerTimeInstant="false">
      <Enumeration declaredType="Mode" start="1"/>
    </ScalarVariable>
  </ModelVariables>
  <ModelStructure>
    <Outputs>
      <Unknown index="3" dependencies="5" dependenciesKind="dependent"/>
    </Outputs>
  </ModelStructure>
</fmiModelDescription>
)";


std::string MinimalModelDescription(
    const std::string& modelName,
    std::initializer_list<std::string> variables,
    const std::string& modelStructure)
{
    std::string xml =
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
        "<fmiModelDescription fmiVersion=\"2.0\" modelName=\"" + modelName
        + "\" guid=\"{00000000-0000-0000-0000-000000000000}\">\n"
        "  <ModelVariables>\n";
    for (const auto& v : variables) {
        xml += "    " + v + "\n";
    }
    xml += "  </ModelVariables>\n";
    if (modelStructure.empty()) {
        xml += "  <ModelStructure/>\n";
    } else {
        xml += "  <ModelStructure>\n    " + modelStructure + "\n  </ModelStructure>\n";
    }
    xml += "</fmiModelDescription>\n";
    return xml;
}


const std::string BINARY_CONTENTS("\x7f" "ELF\x02\x01\x01\0\0\0\xff\xfe", 12);


void MakeFmu(const boost::filesystem::path& path, const std::string& modelDescription)
{
    namespace zip = fmuhandler::util::zip;
    zip::ArchiveWriter writer(path);
    writer.AddFile("modelDescription.xml", modelDescription, zip::DEFLATE_COMPRESSION, 1400000000);
    writer.AddDirectory("binaries/", 1400000000);
    writer.AddFile("binaries/model.so", BINARY_CONTENTS, zip::STORE_COMPRESSION, 1400000002);
    writer.AddFile("resources/data.txt", "some resource data\n", zip::DEFLATE_COMPRESSION, 1400000004);
    writer.Commit();
}


}} // namespace
