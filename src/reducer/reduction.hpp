/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUREDUCE_REDUCTION_HPP
#define FMUREDUCE_REDUCTION_HPP

#include <string>
#include <vector>
#include <boost/filesystem/path.hpp>
#include <fmuhandler/fmu.hpp>


/// The name of the configuration file which is used if none is given.
const char* const DEFAULT_CONFIG_FILE_NAME = "parameter_reduction_config.json";


/**
\brief  Which parameters to remove from an FMU.

Both lists contain shell-style wildcard patterns (`*`, `?`, `[...]`), which
are matched against complete variable names.
*/
struct ReductionConfig
{
    /// Parameters that match one of these are kept, even if they also match `remove`.
    std::vector<std::string> keep;

    /// Parameters that match one of these are removed.
    std::vector<std::string> remove;
};


/**
\brief  Reads a reduction configuration from a JSON file.

The file should contain an object with the optional members
`keep_elements` and `delete_elements`, each an array of strings.

\throws std::runtime_error
    If the file could not be read, is not valid JSON, or does not have the
    structure described above.
*/
ReductionConfig ReadReductionConfig(const boost::filesystem::path& path);


/**
\brief  Removes the parameters selected by `config` from `fmu`.

Only variables with causality `parameter` are considered.  The FMU is not
saved.

\returns the names of the removed variables, in declaration order.
*/
std::vector<std::string> ReduceParameters(
    fmuhandler::FMU& fmu,
    const ReductionConfig& config);


/// The outcome of reducing a single FMU.
struct FileReport
{
    /// The FMU that was read.
    boost::filesystem::path source;

    /// The file that was written, or empty if processing failed.
    boost::filesystem::path target;

    /// The variables which were removed.
    std::vector<std::string> removed;

    /// An error message, or empty if processing succeeded.
    std::string error;

    bool Succeeded() const { return error.empty(); }
};


/**
\brief  Reduces all FMUs in a directory.

Every file with the `.fmu` extension directly in `dir` is opened, reduced
with ReduceParameters(), and saved to `<outputDir>/<stem><suffix>.fmu`.
Files are processed in order of name.  An error in one file is logged and
recorded in its report, and processing continues with the next one.

\param [in] dir
    The directory that contains the FMUs.
\param [in] config
    The reduction configuration.
\param [in] outputDir
    Where to write the reduced FMUs.  It is created if it does not exist.
    If empty, `dir` is used.
\param [in] suffix
    A suffix for the output file names.  If it is not empty and does not
    start with an underscore, one is prepended.  If it is empty and
    `outputDir` is `dir`, the original files are replaced.

\returns one report per FMU.
\throws std::runtime_error
    If `dir` is not a directory.
*/
std::vector<FileReport> ReduceDirectory(
    const boost::filesystem::path& dir,
    const ReductionConfig& config,
    const boost::filesystem::path& outputDir = boost::filesystem::path(),
    const std::string& suffix = std::string());


#endif // header guard
