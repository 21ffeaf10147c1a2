/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/log.hpp>

#include <iostream>
#include <mutex>
#include <stdexcept>
#include <vector>


namespace fmuhandler
{
namespace log
{


namespace
{
    struct Sink
    {
        Level level;
        std::shared_ptr<std::ostream> stream;
    };
    std::mutex g_mutex;
    std::vector<Sink> g_sinks{{error, CLogPtr()}};
    bool g_sinksAdded = false;

    const char* LevelNamePadded(Level level)
    {
        switch (level) {
            case trace:   return " trace ";
            case debug:   return " debug ";
            case info:    return " info  ";
            case warning: return "warning";
            case error:   return " error ";
            default:      return "unknown";
        }
    }

    // `file` may be null, in which case no location is written.
    template<typename Message>
    void Write(
        Level level,
        const Message& message,
        const char* file = nullptr,
        int line = 0) noexcept
    {
        std::lock_guard<std::mutex> lock(g_mutex);
        for (const auto& sink : g_sinks) {
            if (level < sink.level) continue;
            auto& out = *sink.stream;
            out << '[' << LevelNamePadded(level) << "] " << message;
            if (file) out << " (" << file << ':' << line << ')';
            out << std::endl;
        }
    }
}


void Log(Level level, const char* message) noexcept
{
    Write(level, message);
}


void Log(Level level, const std::string& message) noexcept
{
    Write(level, message);
}


void Log(Level level, const boost::format& message) noexcept
{
    Write(level, message);
}


void detail::LogLoc(Level level, const char* file, int line, const boost::format& message) noexcept
{
    Write(level, message, file, line);
}


void AddSink(std::shared_ptr<std::ostream> stream, Level level)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_sinksAdded) {
        g_sinks.front().level = level;
        g_sinks.front().stream = stream;
        g_sinksAdded = true;
    } else {
        g_sinks.push_back({level, stream});
    }
}


std::shared_ptr<std::ostream> CLogPtr() noexcept
{
    return std::shared_ptr<std::ostream>(&std::clog, [] (void*) { });
}


Level ParseLevel(const std::string& s)
{
    if (s == "trace")   return trace;
    if (s == "debug")   return debug;
    if (s == "info")    return info;
    if (s == "warning") return warning;
    if (s == "error")   return error;
    throw std::invalid_argument("Invalid log level: " + s);
}


}} // namespace
