/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include "fmuhandler/util/zip.hpp"

#include <cassert>
#include <cerrno>
#include <cstring>
#include <utility>
#include <vector>

#include "zip.h"

#include "fmuhandler/error.hpp"


namespace fmuhandler
{
namespace util
{
namespace zip
{


namespace
{
    // A simple RAII class that manages a zip_file*.
    class ZipFile
    {
    public:
        ZipFile(::zip* archive, zip_uint64_t index, zip_flags_t flags = 0)
            : m_file{zip_fopen_index(archive, index, flags)}
        {
            if (m_file == nullptr) {
                throw Exception(archive);
            }
        }

        // Disabled because we don't need them (for now):
        ZipFile(const ZipFile&) = delete;
        ZipFile& operator=(const ZipFile&) = delete;
        ZipFile(ZipFile&&) = delete;
        ZipFile& operator=(ZipFile&&) = delete;

        ~ZipFile() FMUHANDLER_NOEXCEPT
        {
            if (m_file) zip_fclose(m_file);
        }

        std::size_t Read(void* buffer, std::size_t maxBytes)
        {
            assert(m_file != nullptr);
            assert(buffer != nullptr);
            assert(maxBytes > 0);
            const auto bytesRead = zip_fread(m_file, buffer, maxBytes);
            if (bytesRead < 0) {
                throw Exception(m_file);
            }
            return static_cast<std::size_t>(bytesRead);
        }

    private:
        zip_file* m_file;
    };


    std::string ErrorCodeMessage(int errorCode)
    {
        const auto errnoVal = errorCode == ZIP_ER_READ || errorCode == ZIP_ER_OPEN
            ? errno
            : 0;
        auto msgBuf = std::vector<char>(
            zip_error_to_str(nullptr, 0, errorCode, errnoVal) + 1);
        zip_error_to_str(msgBuf.data(), msgBuf.size(), errorCode, errnoVal);
        return std::string(msgBuf.data());
    }
}


Archive::Archive() FMUHANDLER_NOEXCEPT
    : m_archive{nullptr}
{
}


Archive::Archive(const boost::filesystem::path& path)
    : m_archive{nullptr}
{
    Open(path);
}


Archive::Archive(Archive&& other) FMUHANDLER_NOEXCEPT
    : m_archive{other.m_archive}
{
    other.m_archive = nullptr;
}


Archive& Archive::operator=(Archive&& other) FMUHANDLER_NOEXCEPT
{
    Discard();
    m_archive = other.m_archive;
    other.m_archive = nullptr;
    return *this;
}


Archive::~Archive() FMUHANDLER_NOEXCEPT
{
    Discard();
}


void Archive::Open(const boost::filesystem::path& path)
{
    FMUHANDLER_PRECONDITION_CHECK(!IsOpen());
    int errorCode;
    auto archive = zip_open(path.string().c_str(), ZIP_RDONLY, &errorCode);
    if (!archive) {
        throw Exception(path.string() + ": " + ErrorCodeMessage(errorCode));
    }
    m_archive = archive;
}


/*
The reason this function is not called "Close" is that libzip has a separate
zip_close() function which saves changes to the archive, whereas zip_discard()
does not save changes.  Archive is read-only, so discarding is all we ever
want here; ArchiveWriter::Commit() is the one that calls zip_close().
*/
void Archive::Discard() FMUHANDLER_NOEXCEPT
{
    if (m_archive) {
        zip_discard(m_archive);
        m_archive = nullptr;
    }
}


bool Archive::IsOpen() const FMUHANDLER_NOEXCEPT
{
    return m_archive != nullptr;
}


std::uint64_t Archive::EntryCount() const
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    return zip_get_num_entries(m_archive, 0);
}


EntryIndex Archive::FindEntry(const std::string& name) const
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    const auto n = zip_name_locate(m_archive, name.c_str(), ZIP_FL_ENC_GUESS);
    if (n < 0) {
        int code = 0;
        zip_error_get(m_archive, &code, nullptr);
        if (code == ZIP_ER_NOENT) return INVALID_ENTRY_INDEX;
        else throw Exception(m_archive);
    }
    return static_cast<EntryIndex>(n);
}


std::string Archive::EntryName(EntryIndex index) const
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    const auto name = zip_get_name(m_archive, index, ZIP_FL_ENC_GUESS);
    if (name == nullptr) {
        throw Exception(m_archive);
    }
    return std::string(name);
}


bool Archive::IsDirEntry(EntryIndex index) const
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    struct zip_stat zs;
    if (zip_stat_index(m_archive, index, 0, &zs)) {
        throw Exception(m_archive);
    }
    if ((zs.valid & ZIP_STAT_NAME) && (zs.valid & ZIP_STAT_SIZE) && (zs.valid & ZIP_STAT_CRC)) {
        const auto nameLen = std::strlen(zs.name);
        return nameLen > 0 && zs.name[nameLen-1] == '/' && zs.size == 0 && zs.crc == 0;
    } else {
        throw Exception("Cannot determine entry type");
    }
}


EntryInfo Archive::Entry(EntryIndex index) const
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    struct zip_stat zs;
    if (zip_stat_index(m_archive, index, 0, &zs)) {
        throw Exception(m_archive);
    }
    if (!(zs.valid & ZIP_STAT_NAME) || !(zs.valid & ZIP_STAT_SIZE)) {
        throw Exception("Cannot determine entry name and size");
    }
    EntryInfo info;
    info.name = zs.name;
    info.size = zs.size;
    if (zs.valid & ZIP_STAT_COMP_METHOD) {
        info.compression = static_cast<CompressionMethod>(zs.comp_method);
    }
    if (zs.valid & ZIP_STAT_MTIME) {
        info.modificationTime = zs.mtime;
    }
    info.isDirectory = !info.name.empty() && info.name.back() == '/'
        && zs.size == 0;
    return info;
}


std::string Archive::ReadEntry(EntryIndex index) const
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    const auto info = Entry(index);
    std::string contents;
    contents.reserve(static_cast<std::size_t>(info.size));

    ZipFile file(m_archive, index, 0);
    auto buffer = std::vector<char>(4096*16);
    for (;;) {
        const auto n = file.Read(buffer.data(), buffer.size());
        if (n == 0) break;
        contents.append(buffer.data(), n);
    }
    if (contents.size() != info.size) {
        throw Exception(
            "Size mismatch while reading archive entry: " + info.name);
    }
    return contents;
}


// =============================================================================
// ArchiveWriter
// =============================================================================

ArchiveWriter::ArchiveWriter(const boost::filesystem::path& path)
    : m_archive{nullptr}
{
    int errorCode;
    m_archive = zip_open(path.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &errorCode);
    if (!m_archive) {
        throw Exception(path.string() + ": " + ErrorCodeMessage(errorCode));
    }
}


ArchiveWriter::~ArchiveWriter() FMUHANDLER_NOEXCEPT
{
    Discard();
}


namespace
{
    void SetEntryProperties(
        ::zip* archive,
        zip_int64_t index,
        CompressionMethod compression,
        std::time_t modificationTime,
        bool isDirectory)
    {
        if (!isDirectory &&
            zip_set_file_compression(archive, index, compression, 0) != 0)
        {
            throw Exception(archive);
        }
        if (modificationTime != 0 &&
            zip_file_set_mtime(archive, index, modificationTime, 0) != 0)
        {
            throw Exception(archive);
        }
    }
}


void ArchiveWriter::AddFile(
    const std::string& name,
    std::string contents,
    CompressionMethod compression,
    std::time_t modificationTime)
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    FMUHANDLER_INPUT_CHECK(!name.empty() && name.back() != '/');

    m_buffers.push_back(std::move(contents));
    const auto& buffer = m_buffers.back();
    auto source = zip_source_buffer(m_archive, buffer.data(), buffer.size(), 0);
    if (source == nullptr) {
        m_buffers.pop_back();
        throw Exception(m_archive);
    }
    const auto index = zip_file_add(m_archive, name.c_str(), source, ZIP_FL_ENC_UTF_8);
    if (index < 0) {
        zip_source_free(source);
        m_buffers.pop_back();
        throw Exception(m_archive);
    }
    SetEntryProperties(m_archive, index, compression, modificationTime, false);
}


void ArchiveWriter::AddDirectory(
    const std::string& name,
    std::time_t modificationTime)
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    FMUHANDLER_INPUT_CHECK(!name.empty());
    const auto index = zip_dir_add(m_archive, name.c_str(), ZIP_FL_ENC_UTF_8);
    if (index < 0) {
        throw Exception(m_archive);
    }
    SetEntryProperties(m_archive, index, STORE_COMPRESSION, modificationTime, true);
}


void ArchiveWriter::Commit()
{
    FMUHANDLER_PRECONDITION_CHECK(IsOpen());
    if (zip_close(m_archive) != 0) {
        const auto e = Exception(m_archive);
        Discard();
        throw e;
    }
    m_archive = nullptr;
    m_buffers.clear();
}


void ArchiveWriter::Discard() FMUHANDLER_NOEXCEPT
{
    if (m_archive) {
        zip_discard(m_archive);
        m_archive = nullptr;
    }
    m_buffers.clear();
}


bool ArchiveWriter::IsOpen() const FMUHANDLER_NOEXCEPT
{
    return m_archive != nullptr;
}


// =============================================================================
// Exception
// =============================================================================

Exception::Exception(const std::string& msg) FMUHANDLER_NOEXCEPT
    : std::runtime_error{msg}
{
}

Exception::Exception(::zip* archive) FMUHANDLER_NOEXCEPT
    : std::runtime_error{zip_strerror(archive)}
{
}

Exception::Exception(zip_file* file) FMUHANDLER_NOEXCEPT
    : std::runtime_error{zip_file_strerror(file)}
{
}


}}} // namespace
