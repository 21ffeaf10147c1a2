/**
\file
\brief  Logging functions and macros.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_LOG_HPP
#define FMUHANDLER_LOG_HPP

#include <memory>
#include <ostream>
#include <string>
#include <boost/format.hpp>
#include <fmuhandler/config.h>


namespace fmuhandler
{
/// Program logging facilities.
namespace log
{


/// Log levels, in order of increasing severity.
enum Level
{
    trace,
    debug,
    info,
    warning,
    error
};

/// Writes a message to every sink whose level is `level` or lower.
void Log(Level level, const char* message) noexcept;

/// \copydoc Log(Level, const char*)
void Log(Level level, const std::string& message) noexcept;

/// \copydoc Log(Level, const char*)
void Log(Level level, const boost::format& message) noexcept;


namespace detail
{
    // Used by the macros below.
    void LogLoc(Level level, const char* file, int line, const boost::format& message) noexcept;
}


/**
\def    FMUHANDLER_LOG_TRACE(message)
\brief  Logs a `boost::format` message at level `trace`, with the source
        location, if FMUHANDLER_LOG_TRACE_ENABLED is defined.
*/
#ifdef FMUHANDLER_LOG_TRACE_ENABLED
#   define FMUHANDLER_LOG_TRACE(message) fmuhandler::log::detail::LogLoc(fmuhandler::log::trace, __FILE__, __LINE__, message)
#else
#   define FMUHANDLER_LOG_TRACE(message) ((void)0)
#endif

/**
\def    FMUHANDLER_LOG_DEBUG(message)
\brief  Logs a `boost::format` message at level `debug`, with the source
        location, if FMUHANDLER_LOG_DEBUG_ENABLED or
        FMUHANDLER_LOG_TRACE_ENABLED is defined.
*/
#if defined(FMUHANDLER_LOG_DEBUG_ENABLED) || defined(FMUHANDLER_LOG_TRACE_ENABLED)
#   define FMUHANDLER_LOG_DEBUG(message) fmuhandler::log::detail::LogLoc(fmuhandler::log::debug, __FILE__, __LINE__, message)
#else
#   define FMUHANDLER_LOG_DEBUG(message) ((void)0)
#endif


/**
\brief Adds a log sink which receives messages at `level` and above.

Initially there is one sink, which writes errors to `std::clog`.  The first
call replaces it; later calls add to the list.
*/
void AddSink(std::shared_ptr<std::ostream> stream, Level level = error);


/// A non-owning `std::shared_ptr` to `std::clog`, for use with AddSink().
std::shared_ptr<std::ostream> CLogPtr() noexcept;


/**
\brief  Converts "trace", "debug", "info", "warning" or "error" to a Level.
\throws std::invalid_argument
    For any other string.
*/
Level ParseLevel(const std::string& s);


}} // namespace
#endif // header guard
