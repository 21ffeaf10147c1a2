/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/util/filesystem.hpp>

#include <cerrno>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <boost/filesystem.hpp>

#include <fmuhandler/error.hpp>
#include <fmuhandler/util.hpp>


namespace fmuhandler
{
namespace util
{


fmuhandler::util::TempDir::TempDir(const boost::filesystem::path& parent)
{
    if (parent.empty()) {
        m_path = boost::filesystem::temp_directory_path()
            / boost::filesystem::unique_path();
    } else if (parent.is_absolute()) {
        m_path = parent / boost::filesystem::unique_path();
    } else {
        m_path = boost::filesystem::temp_directory_path()
            / parent / boost::filesystem::unique_path();
    }
    boost::filesystem::create_directories(m_path);
}

fmuhandler::util::TempDir::TempDir(TempDir&& other) noexcept
    : m_path{std::move(other.m_path)}
{
    // This doesn't seem to be guaranteed by path's move constructor:
    other.m_path.clear();
}

fmuhandler::util::TempDir& fmuhandler::util::TempDir::operator=(TempDir&& other) noexcept
{
    DeleteNoexcept();
    m_path = std::move(other.m_path);
    // This doesn't seem to be guaranteed by path's move constructor:
    other.m_path.clear();
    return *this;
}

fmuhandler::util::TempDir::~TempDir()
{
    DeleteNoexcept();
}

const boost::filesystem::path& fmuhandler::util::TempDir::Path() const
{
    return m_path;
}

void fmuhandler::util::TempDir::DeleteNoexcept() noexcept
{
    if (!m_path.empty()) {
        boost::system::error_code ignoreErrors;
        boost::filesystem::remove_all(m_path, ignoreErrors);
        m_path.clear();
    }
}


boost::filesystem::path UniqueSiblingPath(
    const boost::filesystem::path& target,
    const std::string& suffix)
{
    FMUHANDLER_INPUT_CHECK(target.has_filename());
    const auto charSet = "abcdefghijklmnopqrstuvwxyz0123456789";
    for (;;) {
        auto candidate = target;
        candidate += "." + RandomString(8, charSet) + suffix;
        if (!boost::filesystem::exists(candidate)) return candidate;
    }
}


std::string ReadFile(const boost::filesystem::path& path)
{
    std::ifstream file(path.string(), std::ios_base::binary);
    if (!file.is_open()) {
        const int e = errno;
        throw std::runtime_error(fmuhandler::error::ErrnoMessage(
            "Error opening file \"" + path.string() + "\" for reading", e));
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    if (file.bad()) {
        throw std::runtime_error(
            "An I/O error occurred while reading \"" + path.string() + '"');
    }
    return contents.str();
}


}} // namespace
