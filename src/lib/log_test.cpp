#include <memory>
#include <sstream>
#include <stdexcept>
#include <gtest/gtest.h>
#include <fmuhandler/log.hpp>


TEST(fmuhandler_log, ParseLevel)
{
    namespace fl = fmuhandler::log;
    EXPECT_EQ(fl::trace, fl::ParseLevel("trace"));
    EXPECT_EQ(fl::debug, fl::ParseLevel("debug"));
    EXPECT_EQ(fl::info, fl::ParseLevel("info"));
    EXPECT_EQ(fl::warning, fl::ParseLevel("warning"));
    EXPECT_EQ(fl::error, fl::ParseLevel("error"));
    EXPECT_THROW(fl::ParseLevel("verbose"), std::invalid_argument);
}


TEST(fmuhandler_log, AddSink)
{
    namespace fl = fmuhandler::log;
    auto stream = std::make_shared<std::ostringstream>();
    fl::AddSink(stream, fl::warning);

    fl::Log(fl::info, "not shown");
    fl::Log(fl::warning, std::string("shown"));
    fl::Log(fl::error, boost::format("value=%d") % 42);

    const auto out = stream->str();
    EXPECT_EQ(std::string::npos, out.find("not shown"));
    EXPECT_NE(std::string::npos, out.find("[warning] shown"));
    EXPECT_NE(std::string::npos, out.find("value=42"));
}


TEST(fmuhandler_log, SourceLocation)
{
    namespace fl = fmuhandler::log;
    auto stream = std::make_shared<std::ostringstream>();
    fl::AddSink(stream, fl::trace);
    fl::detail::LogLoc(fl::debug, "file.cpp", 12, boost::format("n=%d") % 3);
    EXPECT_NE(std::string::npos, stream->str().find("[ debug ] n=3 (file.cpp:12)"));
}
