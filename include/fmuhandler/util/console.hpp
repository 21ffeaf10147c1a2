/**
\file
\brief  Utilities for writing console applications.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_UTIL_CONSOLE_HPP
#define FMUHANDLER_UTIL_CONSOLE_HPP

#include <ostream>
#include <string>
#include <vector>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>


namespace fmuhandler
{
namespace util
{

/**
\brief  Returns a string vector with the same contents as the standard C
        program argument array.
*/
std::vector<std::string> CommandLine(int argc, char const *const * argv);


/**
\brief  Parses program arguments and, if necessary, prints a help message.

This is a convenience function which takes two sets of program options,
`options` and `positionalOptions`, where the former contains the ones that
should be specified by the user with switches (e.g. `--foo`) and the latter
contains the ones that are specified using "normal" (positional) arguments,
and performs the following actions:

 1. Adds the `--help` option to `options`.
 2. Parses the arguments given in `args`, mapping them to options specified
    in `options` and `positionalOptions`.
 3. If the `--help` option was specified, or positional arguments were
    expected and `args` is empty, prints a help message and returns an
    empty/false object.
 4. Otherwise, returns the mapped option values.

If an empty/false object is returned, it is recommended that the program
exits more or less immediately.

\param [in] args
    The command-line arguments as they were passed to the program
    (not including the program name).
\param [in] options
    The options that should be specified with command-line switches
    (i.e., --switch or -s).
\param [in] positionalOptions
    The options that should be interpreted as positional arguments.
\param [in] positions
    An object that describes how to map positional arguments to options.
\param [in,out] helpOutput
    The output stream to which a help message should be written.
\param [in] commandName
    The command name, as it should be displayed in the help message.
\param [in] commandDescription
    A description of what the command does, for the help message.
\param [in] extraHelp
    Text to output below the standard help message.

\returns
    A map which contains the parsed program options, or, if --help was
    specified or no arguments were given, an empty/false value.
\throws boost::program_options::error
    If the arguments could not be parsed.
*/
boost::optional<boost::program_options::variables_map> ParseArguments(
    const std::vector<std::string>& args,
    boost::program_options::options_description options,
    const boost::program_options::options_description& positionalOptions,
    const boost::program_options::positional_options_description& positions,
    std::ostream& helpOutput,
    const std::string& commandName,
    const std::string& commandDescription,
    const std::string& extraHelp = std::string());


/**
\brief  Adds the `--log-level` and `--log-file` options to `options`.

Use UseLoggingArguments() after parsing to apply them.
*/
void AddLoggingOptions(boost::program_options::options_description& options);


/**
\brief  Sets up logging according to the options added by AddLoggingOptions().

Messages at or above the chosen level are written to `std::clog`, and, if
`--log-file` was given, appended to that file too.

\throws std::invalid_argument
    If the log level is not recognised.
\throws std::runtime_error
    If the log file could not be opened.
*/
void UseLoggingArguments(const boost::program_options::variables_map& arguments);


}} // namespace
#endif // header guard
