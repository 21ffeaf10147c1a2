/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include <fmuhandler/config.h>
#include <fmuhandler/util/console.hpp>

#include "reduction.hpp"


namespace {
    const std::string self = "fmureduce";

    void PrintConfigHelp()
    {
        std::cout <<
            "The configuration file is a JSON file with two optional members,\n"
            "\"keep_elements\" and \"delete_elements\", which are both lists of\n"
            "wildcard patterns.  A parameter is removed if its name matches one of\n"
            "the \"delete_elements\" patterns and none of the \"keep_elements\"\n"
            "patterns.  Variables which are not parameters are never removed.\n"
            "Example:\n"
            "\n"
            "{\n"
            "    \"delete_elements\": [\"*\"],\n"
            "    \"keep_elements\": [\"mass\", \"spring.*\"]\n"
            "}\n"
            "\n"
            "Patterns may contain '*' (any string), '?' (any character) and\n"
            "'[...]' (any of the enclosed characters).\n";
    }
}


int Run(const std::vector<std::string>& args)
{
    try {
        namespace po = boost::program_options;
        po::options_description options("Options");
        options.add_options()
            ("config,c", po::value<std::string>(),
                "The reduction configuration file.  The default is "
                "parameter_reduction_config.json in the FMU directory.")
            ("output-dir,o", po::value<std::string>(),
                "The directory in which to save the reduced FMUs.  The default "
                "is the FMU directory.")
            ("suffix,s", po::value<std::string>()->default_value(""),
                "A suffix for the names of the reduced FMUs.  If this and "
                "--output-dir are both left out, the original FMUs are replaced.")
            ("help-config",
                "Display a help message about the format of the configuration file "
                "and exit.");
        fmuhandler::util::AddLoggingOptions(options);
        po::options_description positionalOptions("Arguments");
        positionalOptions.add_options()
            ("fmu-dir", po::value<std::string>(),
                "The directory which contains the FMUs.");
        po::positional_options_description positions;
        positions.add("fmu-dir", 1);

        const auto argValues = fmuhandler::util::ParseArguments(
            args, options, positionalOptions, positions,
            std::cerr,
            self,
            "Removes parameters from the model descriptions of all FMUs in a directory.\n"
            "(" FMUHANDLER_PROGRAM_NAME_VERSION ")",
            "The model description of every FMU is checked against the FMI 2.0 schema\n"
            "before it is saved, and FMUs which would become invalid are left alone.\n");
        if (!argValues) return 0;
        fmuhandler::util::UseLoggingArguments(*argValues);

        if (argValues->count("help-config")) {
            PrintConfigHelp();
            return 0;
        }

        if (!argValues->count("fmu-dir")) throw std::runtime_error("No FMU directory specified");
        const auto fmuDir = boost::filesystem::path((*argValues)["fmu-dir"].as<std::string>());
        const auto configFile = argValues->count("config")
            ? boost::filesystem::path((*argValues)["config"].as<std::string>())
            : fmuDir / DEFAULT_CONFIG_FILE_NAME;
        const auto outputDir = argValues->count("output-dir")
            ? boost::filesystem::path((*argValues)["output-dir"].as<std::string>())
            : boost::filesystem::path();
        const auto suffix = (*argValues)["suffix"].as<std::string>();

        const auto config = ReadReductionConfig(configFile);
        const auto reports = ReduceDirectory(fmuDir, config, outputDir, suffix);

        int failures = 0;
        for (const auto& r : reports) {
            if (r.Succeeded()) {
                std::cout << r.source.filename().string() << ": removed "
                          << r.removed.size() << " parameter(s), saved to "
                          << r.target.string() << '\n';
            } else {
                std::cout << r.source.filename().string() << ": FAILED: "
                          << r.error << '\n';
                ++failures;
            }
        }
        std::cout << reports.size() << " FMU(s) processed, "
                  << failures << " failed." << std::endl;
        return failures == 0 ? 0 : 1;
    } catch (const boost::program_options::error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::runtime_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}


int main(int argc, const char** argv)
{
    try {
        return Run(fmuhandler::util::CommandLine(argc-1, argv+1));
    } catch (const std::exception& e) {
        std::cerr << "Error: Unexpected internal error: " << e.what() << std::endl;
        return 255;
    }
}
