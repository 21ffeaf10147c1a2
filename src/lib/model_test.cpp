#include <cmath>
#include <limits>
#include <string>
#include <gtest/gtest.h>
#include <fmuhandler/error.hpp>
#include <fmuhandler/model.hpp>

using namespace fmuhandler::model;
using fmuhandler::error::InvalidValueException;
using fmuhandler::error::ModelParseException;


TEST(fmuhandler_model, EnumNames)
{
    EXPECT_STREQ("Real", ToString(REAL_DATATYPE));
    EXPECT_STREQ("Enumeration", ToString(ENUMERATION_DATATYPE));
    EXPECT_STREQ("calculatedParameter", ToString(CALCULATED_PARAMETER_CAUSALITY));
    EXPECT_STREQ("tunable", ToString(TUNABLE_VARIABILITY));
    EXPECT_STREQ("approx", ToString(APPROX_INITIAL));

    EXPECT_EQ(INTEGER_DATATYPE, *ParseDataType("Integer"));
    EXPECT_EQ(INDEPENDENT_CAUSALITY, *ParseCausality("independent"));
    EXPECT_EQ(DISCRETE_VARIABILITY, *ParseVariability("discrete"));
    EXPECT_EQ(CALCULATED_INITIAL, *ParseInitial("calculated"));
    EXPECT_FALSE(ParseDataType("real"));
    EXPECT_FALSE(ParseCausality("Parameter"));
    EXPECT_FALSE(ParseVariability(""));
    EXPECT_FALSE(ParseInitial("inexact"));
}


TEST(fmuhandler_model, DataTypeOf)
{
    EXPECT_EQ(REAL_DATATYPE, DataTypeOf(ScalarValue(1.0)));
    EXPECT_EQ(INTEGER_DATATYPE, DataTypeOf(ScalarValue(1)));
    EXPECT_EQ(BOOLEAN_DATATYPE, DataTypeOf(ScalarValue(true)));
    EXPECT_EQ(STRING_DATATYPE, DataTypeOf(ScalarValue(std::string("x"))));
}


TEST(fmuhandler_model, ParseValue)
{
    EXPECT_EQ(1.5, boost::get<double>(ParseValue(REAL_DATATYPE, "1.5")));
    EXPECT_EQ(-2e-3, boost::get<double>(ParseValue(REAL_DATATYPE, "-2e-3")));
    EXPECT_EQ(42.0, boost::get<double>(ParseValue(REAL_DATATYPE, "42")));
    EXPECT_TRUE(std::isinf(boost::get<double>(ParseValue(REAL_DATATYPE, "INF"))));
    EXPECT_TRUE(std::isnan(boost::get<double>(ParseValue(REAL_DATATYPE, "NaN"))));
    EXPECT_THROW(ParseValue(REAL_DATATYPE, "abc"), InvalidValueException);
    EXPECT_THROW(ParseValue(REAL_DATATYPE, "1.5x"), InvalidValueException);
    EXPECT_THROW(ParseValue(REAL_DATATYPE, ""), InvalidValueException);
    EXPECT_THROW(ParseValue(REAL_DATATYPE, "inf"), InvalidValueException);

    EXPECT_EQ(-7, boost::get<int>(ParseValue(INTEGER_DATATYPE, "-7")));
    EXPECT_EQ(3, boost::get<int>(ParseValue(ENUMERATION_DATATYPE, "3")));
    EXPECT_THROW(ParseValue(INTEGER_DATATYPE, "2.5"), InvalidValueException);
    EXPECT_THROW(ParseValue(INTEGER_DATATYPE, " 2"), InvalidValueException);
    EXPECT_THROW(ParseValue(INTEGER_DATATYPE, "99999999999"), InvalidValueException);

    EXPECT_TRUE(boost::get<bool>(ParseValue(BOOLEAN_DATATYPE, "true")));
    EXPECT_TRUE(boost::get<bool>(ParseValue(BOOLEAN_DATATYPE, "1")));
    EXPECT_FALSE(boost::get<bool>(ParseValue(BOOLEAN_DATATYPE, "false")));
    EXPECT_FALSE(boost::get<bool>(ParseValue(BOOLEAN_DATATYPE, "0")));
    EXPECT_THROW(ParseValue(BOOLEAN_DATATYPE, "yes"), InvalidValueException);

    EXPECT_EQ(" any text ", boost::get<std::string>(ParseValue(STRING_DATATYPE, " any text ")));

    try {
        ParseValue(INTEGER_DATATYPE, "ten", "Counter");
        ADD_FAILURE();
    } catch (const InvalidValueException& e) {
        EXPECT_EQ("Counter", e.VariableName());
        EXPECT_EQ("Integer", e.ExpectedType());
        EXPECT_EQ("ten", e.Value());
    }
}


TEST(fmuhandler_model, FormatValue)
{
    EXPECT_EQ("0.1", FormatValue(0.1));
    EXPECT_EQ("42", FormatValue(42.0));
    EXPECT_EQ("-1.25", FormatValue(-1.25));
    EXPECT_EQ("1e+20", FormatValue(1e20));
    EXPECT_EQ("0.30000000000000004", FormatValue(0.1 + 0.2));
    EXPECT_EQ("INF", FormatValue(std::numeric_limits<double>::infinity()));
    EXPECT_EQ("-INF", FormatValue(-std::numeric_limits<double>::infinity()));
    EXPECT_EQ("NaN", FormatValue(std::numeric_limits<double>::quiet_NaN()));
    EXPECT_EQ("-3", FormatValue(-3));
    EXPECT_EQ("true", FormatValue(true));
    EXPECT_EQ("false", FormatValue(false));
    EXPECT_EQ("abc", FormatValue(std::string("abc")));
}


TEST(fmuhandler_model, CoerceValue)
{
    EXPECT_EQ(42.0, boost::get<double>(CoerceValue("x", REAL_DATATYPE, 42)));
    EXPECT_EQ(2.5, boost::get<double>(CoerceValue("x", REAL_DATATYPE, 2.5)));
    EXPECT_EQ(2.5, boost::get<double>(CoerceValue("x", REAL_DATATYPE, std::string("2.5"))));
    EXPECT_EQ(7, boost::get<int>(CoerceValue("x", INTEGER_DATATYPE, 7)));
    EXPECT_EQ(7, boost::get<int>(CoerceValue("x", INTEGER_DATATYPE, std::string("7"))));
    EXPECT_EQ(2, boost::get<int>(CoerceValue("x", ENUMERATION_DATATYPE, 2)));
    EXPECT_TRUE(boost::get<bool>(CoerceValue("x", BOOLEAN_DATATYPE, true)));
    EXPECT_EQ("hi", boost::get<std::string>(CoerceValue("x", STRING_DATATYPE, std::string("hi"))));

    EXPECT_THROW(CoerceValue("x", INTEGER_DATATYPE, 2.5), InvalidValueException);
    EXPECT_THROW(CoerceValue("x", BOOLEAN_DATATYPE, 1), InvalidValueException);
    EXPECT_THROW(CoerceValue("x", REAL_DATATYPE, true), InvalidValueException);
    EXPECT_THROW(CoerceValue("x", STRING_DATATYPE, 1), InvalidValueException);
    EXPECT_THROW(CoerceValue("x", REAL_DATATYPE, std::string("fast")), InvalidValueException);

    EXPECT_FALSE(boost::get<bool>(CoerceValue("x", BOOLEAN_DATATYPE, "false")));
    EXPECT_EQ("hi", boost::get<std::string>(CoerceValue("x", STRING_DATATYPE, "hi")));
    EXPECT_EQ(7, boost::get<int>(CoerceValue("x", INTEGER_DATATYPE, "7")));
    EXPECT_THROW(CoerceValue("x", BOOLEAN_DATATYPE, "maybe"), InvalidValueException);
}


TEST(fmuhandler_model, ScalarVariableParse)
{
    const AttributeList attributes = {
        {"name", "h"},
        {"valueReference", "4"},
        {"description", "height"},
        {"causality", "output"},
        {"variability", "continuous"},
        {"initial", "exact"},
        {"vendorExtra", "kept"},
    };
    const AttributeList typeAttributes = {
        {"start", "1"},
        {"unit", "m"},
        {"min", "0"},
    };
    const auto v = ScalarVariable::Parse(attributes, "Real", typeAttributes);
    EXPECT_EQ("h", v.Name());
    EXPECT_EQ(4u, v.ValueReference());
    EXPECT_EQ(std::string("height"), *v.Description());
    EXPECT_EQ(OUTPUT_CAUSALITY, v.Causality());
    EXPECT_EQ(CONTINUOUS_VARIABILITY, v.Variability());
    EXPECT_EQ(EXACT_INITIAL, *v.Initial());
    EXPECT_EQ(REAL_DATATYPE, v.DataType());
    ASSERT_TRUE(!!v.Start());
    EXPECT_EQ(1.0, boost::get<double>(*v.Start()));
    EXPECT_EQ(std::string("m"), *v.Unit());
    EXPECT_EQ(std::string("0"), *v.TypeAttribute("min"));
    EXPECT_FALSE(v.TypeAttribute("max"));
    EXPECT_EQ(attributes, v.Attributes());
    EXPECT_EQ("Real", v.TypeElementName());
    EXPECT_EQ(typeAttributes, v.TypeAttributes());
}


TEST(fmuhandler_model, ScalarVariableParseDefaults)
{
    const auto v = ScalarVariable::Parse(
        {{"name", "x"}, {"valueReference", "0"}}, "Boolean", {});
    EXPECT_EQ(LOCAL_CAUSALITY, v.Causality());
    EXPECT_EQ(CONTINUOUS_VARIABILITY, v.Variability());
    EXPECT_FALSE(v.Initial());
    EXPECT_FALSE(v.Description());
    EXPECT_FALSE(v.Start());
    EXPECT_FALSE(v.Unit());
}


TEST(fmuhandler_model, ScalarVariableParseErrors)
{
    const AttributeList typeAttributes;
    EXPECT_THROW(
        ScalarVariable::Parse({{"valueReference", "1"}}, "Real", typeAttributes),
        ModelParseException);
    EXPECT_THROW(
        ScalarVariable::Parse({{"name", "x"}}, "Real", typeAttributes),
        ModelParseException);
    EXPECT_THROW(
        ScalarVariable::Parse({{"name", "x"}, {"valueReference", "-1"}}, "Real", typeAttributes),
        ModelParseException);
    EXPECT_THROW(
        ScalarVariable::Parse({{"name", "x"}, {"valueReference", "1"}}, "", typeAttributes),
        ModelParseException);
    EXPECT_THROW(
        ScalarVariable::Parse({{"name", "x"}, {"valueReference", "1"}}, "Complex", typeAttributes),
        ModelParseException);
    EXPECT_THROW(
        ScalarVariable::Parse(
            {{"name", "x"}, {"valueReference", "1"}, {"causality", "sideways"}},
            "Real", typeAttributes),
        ModelParseException);
    EXPECT_THROW(
        ScalarVariable::Parse(
            {{"name", "x"}, {"valueReference", "1"}}, "Integer", {{"start", "1.5"}}),
        InvalidValueException);
}


TEST(fmuhandler_model, ScalarVariableConstructAndModify)
{
    auto v = ScalarVariable("k", 7, INTEGER_DATATYPE, PARAMETER_CAUSALITY, FIXED_VARIABILITY);
    EXPECT_EQ("k", v.Name());
    EXPECT_EQ(7u, v.ValueReference());
    EXPECT_EQ("Integer", v.TypeElementName());
    const AttributeList expected = {
        {"name", "k"},
        {"valueReference", "7"},
        {"causality", "parameter"},
        {"variability", "fixed"},
    };
    EXPECT_EQ(expected, v.Attributes());
    EXPECT_TRUE(v.TypeAttributes().empty());

    v.SetStart(3);
    EXPECT_EQ(3, boost::get<int>(*v.Start()));
    EXPECT_EQ(std::string("3"), *v.TypeAttribute("start"));
    EXPECT_THROW(v.SetStart(2.5), InvalidValueException);
    EXPECT_THROW(v.SetStart("2.5"), InvalidValueException);
    EXPECT_EQ(3, boost::get<int>(*v.Start()));
    v.SetStart("12");
    EXPECT_EQ(12, boost::get<int>(*v.Start()));
    v.SetStart(std::string("3"));
    EXPECT_EQ(3, boost::get<int>(*v.Start()));

    v.SetDescription("gain");
    v.SetCausality(INPUT_CAUSALITY);
    v.SetVariability(DISCRETE_VARIABILITY);
    EXPECT_EQ(std::string("gain"), *v.Description());
    EXPECT_EQ(INPUT_CAUSALITY, v.Causality());
    EXPECT_EQ(DISCRETE_VARIABILITY, v.Variability());
    EXPECT_EQ("input", v.Attributes()[2].second);
    EXPECT_EQ("discrete", v.Attributes()[3].second);
    EXPECT_EQ("description", v.Attributes()[4].first);

    v.SetTypeAttribute("quantity", "Count");
    EXPECT_EQ(std::string("Count"), *v.TypeAttribute("quantity"));
    EXPECT_THROW(v.SetTypeAttribute("start", "4"), std::invalid_argument);

    EXPECT_EQ(v, ScalarVariable("k", 99, REAL_DATATYPE));
    EXPECT_NE(v, ScalarVariable("j", 7, INTEGER_DATATYPE));
    EXPECT_THROW(ScalarVariable("", 1, REAL_DATATYPE), std::invalid_argument);
}
