#include <sstream>
#include <boost/filesystem.hpp>
#include <gtest/gtest.h>
#include <fmuhandler/util/console.hpp>
#include <fmuhandler/util/filesystem.hpp>


TEST(fmuhandler_util, CommandLine)
{
    const char *const *const argv0 = nullptr;
    const int argc0 = 0;
    EXPECT_TRUE(fmuhandler::util::CommandLine(argc0, argv0).empty());

    const char* argv2[2] = { "fmureduce", "fmus" };
    const int argc2 = 2;
    const auto cmd2 = fmuhandler::util::CommandLine(argc2, argv2);
    EXPECT_EQ(argc2, static_cast<int>(cmd2.size()));
    EXPECT_EQ(argv2[0], cmd2[0]);
    EXPECT_EQ(argv2[1], cmd2[1]);
}


TEST(fmuhandler_util, ParseArguments)
{
    using namespace fmuhandler::util;
    namespace po = boost::program_options;

    std::vector<std::string> args;
    po::options_description options;
    po::options_description positionalOptions;
    po::positional_options_description positions;
    std::stringstream out;

    std::string commandName = "test";
    std::string commandDescription = "This is a test";

    auto vals = ParseArguments(
        args, options, positionalOptions, positions,
        out, commandName, commandDescription);
    EXPECT_TRUE(!!vals);
    EXPECT_TRUE(vals->empty());

    options.add_options()("suffix,s", po::value<std::string>());
    positionalOptions.add_options()("fmu-dir", po::value<std::string>());
    positions.add("fmu-dir", 1);
    vals = ParseArguments(
        args, options, positionalOptions, positions,
        out, commandName, commandDescription);
    EXPECT_FALSE(!!vals);
    EXPECT_NE(std::string::npos, out.str().find("This is a test"));
    EXPECT_NE(std::string::npos, out.str().find("test <fmu-dir>"));

    args.push_back("fmus");
    args.push_back("-s");
    args.push_back("reduced");
    vals = ParseArguments(
        args, options, positionalOptions, positions,
        out, commandName, commandDescription);
    ASSERT_TRUE(!!vals);
    EXPECT_EQ(2u, vals->size());
    EXPECT_EQ("fmus", (*vals)["fmu-dir"].as<std::string>());
    EXPECT_EQ("reduced", (*vals)["suffix"].as<std::string>());

    args.push_back("--help");
    vals = ParseArguments(
        args, options, positionalOptions, positions,
        out, commandName, commandDescription);
    EXPECT_FALSE(!!vals);

    args.back() = "--no-such-switch";
    EXPECT_THROW(
        ParseArguments(
            args, options, positionalOptions, positions,
            out, commandName, commandDescription),
        po::error);
}


TEST(fmuhandler_util, UseLoggingArguments)
{
    using namespace fmuhandler::util;
    namespace po = boost::program_options;

    po::options_description options;
    AddLoggingOptions(options);
    std::stringstream out;

    std::vector<std::string> args = {"--log-level", "loud"};
    auto vals = ParseArguments(
        args, options, po::options_description(),
        po::positional_options_description(), out, "test", "");
    ASSERT_TRUE(!!vals);
    EXPECT_THROW(UseLoggingArguments(*vals), std::invalid_argument);

    fmuhandler::util::TempDir tmp;
    const auto logFile = tmp.Path() / "logs" / "test.log";
    args = {"--log-level", "error", "--log-file", logFile.string()};
    vals = ParseArguments(
        args, options, po::options_description(),
        po::positional_options_description(), out, "test", "");
    ASSERT_TRUE(!!vals);
    EXPECT_NO_THROW(UseLoggingArguments(*vals));
    EXPECT_TRUE(boost::filesystem::exists(logFile));
}
