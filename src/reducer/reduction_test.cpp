#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <fmuhandler/fmu.hpp>
#include <fmuhandler/util/filesystem.hpp>
#include "../lib/test_fmu.hpp"
#include "reduction.hpp"

namespace fs = boost::filesystem;


namespace
{
    void WriteFile(const fs::path& path, const std::string& contents)
    {
        std::ofstream f(path.string(), std::ios::binary);
        f << contents;
    }

    std::vector<std::string> VariableNames(const fs::path& fmuPath)
    {
        std::vector<std::string> names;
        for (const auto& v : fmuhandler::FMU(fmuPath).Variables()) names.push_back(v.Name());
        return names;
    }
}


TEST(fmureduce, ReadReductionConfig)
{
    fmuhandler::util::TempDir tmp;
    const auto path = tmp.Path() / "config.json";

    WriteFile(path, R"({ "keep_elements": ["Var*", "x"], "delete_elements": ["*"] })");
    const auto config = ReadReductionConfig(path);
    EXPECT_EQ((std::vector<std::string>{"Var*", "x"}), config.keep);
    EXPECT_EQ(std::vector<std::string>{"*"}, config.remove);

    WriteFile(path, R"({ "delete_elements": [] })");
    const auto empty = ReadReductionConfig(path);
    EXPECT_TRUE(empty.keep.empty());
    EXPECT_TRUE(empty.remove.empty());

    WriteFile(path, R"({ "delete_elements": ["a", )");
    EXPECT_THROW(ReadReductionConfig(path), std::runtime_error);

    WriteFile(path, R"({ "delete_elements": "a" })");
    EXPECT_THROW(ReadReductionConfig(path), std::runtime_error);

    WriteFile(path, R"({ "keep_elements": [{"name": "a"}] })");
    EXPECT_THROW(ReadReductionConfig(path), std::runtime_error);

    EXPECT_THROW(ReadReductionConfig(tmp.Path() / "missing.json"), std::runtime_error);
}


TEST(fmureduce, ReduceParameters)
{
    fmuhandler::util::TempDir tmp;
    const auto path = tmp.Path() / "test.fmu";
    fmuhandler::test::MakeFmu(path, fmuhandler::test::FULL_MODEL_DESCRIPTION);
    fmuhandler::FMU fmu(path);

    ReductionConfig config;
    config.remove = {"*"};
    config.keep = {"Var?"};
    // Only parameters are removed; B and mode are not parameters.
    EXPECT_EQ((std::vector<std::string>{"A", "label"}), ReduceParameters(fmu, config));
    EXPECT_FALSE(fmu.ModelDescription().HasVariable("A"));
    EXPECT_TRUE(fmu.ModelDescription().HasVariable("Var1"));
    EXPECT_TRUE(fmu.ModelDescription().HasVariable("B"));
    EXPECT_TRUE(fmu.ModelDescription().HasVariable("mode"));
    EXPECT_TRUE(fmu.Validate().valid);

    EXPECT_TRUE(ReduceParameters(fmu, config).empty());
    EXPECT_TRUE(ReduceParameters(fmu, ReductionConfig()).empty());
}


TEST(fmureduce, ReduceDirectory)
{
    fmuhandler::util::TempDir tmp;
    const auto dir = tmp.Path() / "fmus";
    fs::create_directories(dir);
    fmuhandler::test::MakeFmu(dir / "b.fmu", fmuhandler::test::FULL_MODEL_DESCRIPTION);
    fmuhandler::test::MakeFmu(dir / "a.fmu", fmuhandler::test::MinimalModelDescription("M", {
        R"(<ScalarVariable name="p1" valueReference="1" causality="parameter" variability="fixed"><Real start="1"/></ScalarVariable>)",
        R"(<ScalarVariable name="p2" valueReference="2" causality="parameter" variability="fixed"><Real start="2"/></ScalarVariable>)",
    }));
    WriteFile(dir / "c.fmu", "not a zip file");
    WriteFile(dir / "notes.txt", "ignored");
    fs::create_directories(dir / "sub.fmu");

    ReductionConfig config;
    config.remove = {"p1", "A"};
    const auto reports = ReduceDirectory(dir, config, tmp.Path() / "out", "reduced");
    ASSERT_EQ(3u, reports.size());

    EXPECT_EQ(dir / "a.fmu", reports[0].source);
    EXPECT_TRUE(reports[0].Succeeded());
    EXPECT_EQ(tmp.Path() / "out" / "a_reduced.fmu", reports[0].target);
    EXPECT_EQ(std::vector<std::string>{"p1"}, reports[0].removed);
    EXPECT_EQ(std::vector<std::string>{"p2"}, VariableNames(reports[0].target));

    EXPECT_EQ(dir / "b.fmu", reports[1].source);
    EXPECT_TRUE(reports[1].Succeeded());
    EXPECT_EQ(tmp.Path() / "out" / "b_reduced.fmu", reports[1].target);
    EXPECT_EQ(std::vector<std::string>{"A"}, reports[1].removed);

    EXPECT_EQ(dir / "c.fmu", reports[2].source);
    EXPECT_FALSE(reports[2].Succeeded());
    EXPECT_TRUE(reports[2].target.empty());
    EXPECT_FALSE(reports[2].error.empty());

    // The originals are untouched.
    EXPECT_EQ((std::vector<std::string>{"p1", "p2"}), VariableNames(dir / "a.fmu"));
    EXPECT_EQ(5u, VariableNames(dir / "b.fmu").size());
}


TEST(fmureduce, ReduceDirectoryInPlace)
{
    fmuhandler::util::TempDir tmp;
    fmuhandler::test::MakeFmu(tmp.Path() / "test.fmu", fmuhandler::test::FULL_MODEL_DESCRIPTION);

    ReductionConfig config;
    config.remove = {"*"};
    const auto reports = ReduceDirectory(tmp.Path(), config);
    ASSERT_EQ(1u, reports.size());
    EXPECT_TRUE(reports[0].Succeeded());
    EXPECT_EQ(tmp.Path() / "test.fmu", reports[0].target);
    EXPECT_EQ((std::vector<std::string>{"B", "mode"}), VariableNames(tmp.Path() / "test.fmu"));

    EXPECT_THROW(ReduceDirectory(tmp.Path() / "test.fmu", config), std::runtime_error);
    EXPECT_THROW(ReduceDirectory(tmp.Path() / "missing", config), std::runtime_error);
}
