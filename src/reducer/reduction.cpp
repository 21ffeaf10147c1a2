/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "reduction.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <fnmatch.h>

#include <boost/filesystem.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <boost/property_tree/ptree.hpp>

#include <fmuhandler/log.hpp>
#include <fmuhandler/model.hpp>


namespace fs = boost::filesystem;


namespace
{
    // Reads an array of strings.  A missing key gives an empty list.
    std::vector<std::string> ReadPatternList(
        const boost::property_tree::ptree& ptree,
        const std::string& key,
        const boost::filesystem::path& path)
    {
        std::vector<std::string> patterns;
        const auto node = ptree.get_child_optional(key);
        if (!node) return patterns;

        const auto notAList = std::runtime_error(
            path.string() + ": '" + key + "' must be an array of strings");
        if (node->empty() && !node->data().empty()) throw notAList;
        for (const auto& item : *node) {
            if (!item.first.empty() || !item.second.empty()) throw notAList;
            patterns.push_back(item.second.data());
        }
        return patterns;
    }

    bool MatchesAny(const std::string& name, const std::vector<std::string>& patterns)
    {
        return std::any_of(patterns.begin(), patterns.end(), [&name] (const std::string& p) {
            return fnmatch(p.c_str(), name.c_str(), 0) == 0;
        });
    }
}


ReductionConfig ReadReductionConfig(const boost::filesystem::path& path)
{
    if (!fs::is_regular_file(path)) {
        throw std::runtime_error("Configuration file not found: " + path.string());
    }
    boost::property_tree::ptree ptree;
    try {
        boost::property_tree::read_json(path.string(), ptree);
    } catch (const boost::property_tree::json_parser_error& e) {
        throw std::runtime_error("Error reading configuration file: " + std::string(e.what()));
    }

    ReductionConfig config;
    config.keep = ReadPatternList(ptree, "keep_elements", path);
    config.remove = ReadPatternList(ptree, "delete_elements", path);
    FMUHANDLER_LOG_DEBUG(boost::format("%s: %d keep patterns, %d delete patterns")
        % path.string() % config.keep.size() % config.remove.size());
    return config;
}


std::vector<std::string> ReduceParameters(
    fmuhandler::FMU& fmu,
    const ReductionConfig& config)
{
    fmuhandler::VariableQuery parameters;
    parameters.causality = fmuhandler::model::PARAMETER_CAUSALITY;

    std::vector<std::string> removed;
    for (const auto& variable : fmu.QueryVariables(parameters)) {
        const auto& name = variable.Name();
        if (MatchesAny(name, config.remove) && !MatchesAny(name, config.keep)) {
            fmu.DeleteVariable(name);
            removed.push_back(name);
        }
    }
    return removed;
}


std::vector<FileReport> ReduceDirectory(
    const boost::filesystem::path& dir,
    const ReductionConfig& config,
    const boost::filesystem::path& outputDir,
    const std::string& suffix)
{
    if (!fs::is_directory(dir)) {
        throw std::runtime_error("Not a directory: " + dir.string());
    }

    std::vector<fs::path> fmuFiles;
    for (auto it = fs::directory_iterator(dir); it != fs::directory_iterator(); ++it) {
        if (fs::is_regular_file(it->status()) && it->path().extension() == ".fmu") {
            fmuFiles.push_back(it->path());
        }
    }
    std::sort(fmuFiles.begin(), fmuFiles.end());

    const auto targetDir = outputDir.empty() ? dir : outputDir;
    auto fileSuffix = suffix;
    if (!fileSuffix.empty() && fileSuffix.front() != '_') fileSuffix.insert(0, "_");

    fmuhandler::log::Log(fmuhandler::log::info,
        boost::format("Reducing %d FMUs in %s") % fmuFiles.size() % dir.string());

    std::vector<FileReport> reports;
    for (const auto& path : fmuFiles) {
        FileReport report;
        report.source = path;
        try {
            fmuhandler::FMU fmu(path);
            auto removed = ReduceParameters(fmu, config);
            report.target = fmu.SaveCopy(targetDir, path.stem().string() + fileSuffix);
            report.removed = std::move(removed);
            fmuhandler::log::Log(fmuhandler::log::info,
                boost::format("%s: removed %d parameters")
                    % path.filename().string() % report.removed.size());
        } catch (const std::runtime_error& e) {
            report.error = e.what();
            fmuhandler::log::Log(fmuhandler::log::error,
                boost::format("%s: %s") % path.filename().string() % e.what());
        }
        reports.push_back(std::move(report));
    }
    return reports;
}
