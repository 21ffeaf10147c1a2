/**
\file
\brief  Module header for fmuhandler::util::zip
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_UTIL_ZIP_HPP
#define FMUHANDLER_UTIL_ZIP_HPP

#include <cstdint>
#include <ctime>
#include <list>
#include <stdexcept>
#include <string>

#include <boost/filesystem/path.hpp>

#include <fmuhandler/config.h>


// Forward declarations to avoid dependency on zip.h
struct zip;
struct zip_file;


namespace fmuhandler
{
namespace util
{

/// Utilities for dealing with ZIP archives.
namespace zip
{

/**
\brief  A type for numeric zip entry indices.
\see Archive
\see INVALID_ENTRY_INDEX
*/
typedef std::uint64_t EntryIndex;


/**
\brief  An index value that represents an invalid/unknown zip entry.
\see Archive
*/
const EntryIndex INVALID_ENTRY_INDEX = 0xFFFFFFFFFFFFFFFFull;


/**
\brief  A ZIP compression method identifier.

The values are the ones defined by the ZIP file format specification
(APPNOTE.TXT), which libzip also uses.
*/
typedef std::int32_t CompressionMethod;

/// Entry data is stored without compression.
const CompressionMethod STORE_COMPRESSION = 0;

/// Entry data is compressed with the DEFLATE algorithm.
const CompressionMethod DEFLATE_COMPRESSION = 8;


/// Information about a single archive entry.
struct EntryInfo
{
    /// The full name of the entry; directory names end with a slash.
    std::string name;

    /// Uncompressed size, in bytes.
    std::uint64_t size = 0;

    /// The method with which the entry data is compressed.
    CompressionMethod compression = STORE_COMPRESSION;

    /// Last modification time.
    std::time_t modificationTime = 0;

    /// Whether the entry is a directory.
    bool isDirectory = false;
};


/**
\brief  A class for reading ZIP archives.

Only reading operations are supported.  To create a new archive, use
ArchiveWriter.

A ZIP archive is organised as a number of *entries*, where each entry is a
file or a directory.  Each entry has a unique integer index, and the indices
run consecutively from 0 through `EntryCount()-1`.  For example, a file with
2 file entries and 1 directory entry, i.e. `EntryCount() == 3`, could look
like this:

    Index  Name
    -----  ----------------------
        0  modelDescription.xml
        1  binaries/
        2  binaries/model.so

*/
class Archive
{
public:
    /// Default constructor; does not associate the object with an archive file.
    Archive() FMUHANDLER_NOEXCEPT;

    /**
    \brief  Constructor which opens a ZIP archive.

    This is equivalent to default construction followed by a call to Open().

    \param [in] path
        The path to a ZIP archive file.

    \throws fmuhandler::util::zip::Exception
        If there was an error opening the archive.
    */
    Archive(const boost::filesystem::path& path);

    // Disable copying.
    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;

    /// Move constructor.
    Archive(Archive&&) FMUHANDLER_NOEXCEPT;
    /// Move assignment operator.
    Archive& operator=(Archive&&) FMUHANDLER_NOEXCEPT;

    /// Destructor; calls Discard().
    ~Archive() FMUHANDLER_NOEXCEPT;

    /**
    \brief  Opens a ZIP archive.

    A file which is not a ZIP archive is rejected here.  Minor
    inconsistencies between the local and central headers are tolerated.

    \param [in] path
        The path to a ZIP archive file.
    \throws fmuhandler::util::zip::Exception
        If there was an error opening the archive.
    \pre
        `IsOpen() == false`
    */
    void Open(const boost::filesystem::path& path);

    /**
    \brief  Closes the archive.

    If no archive is open, this function has no effect.
    */
    void Discard() FMUHANDLER_NOEXCEPT;

    /// Returns whether this object refers to an open ZIP archive.
    bool IsOpen() const FMUHANDLER_NOEXCEPT;

    /**
    \brief  Returns the number of entries in the archive.

    This includes both files and directories.

    \pre `IsOpen() == true`
    */
    std::uint64_t EntryCount() const;

    /**
    \brief  Finds an entry by name.

    \param [in] name
        The full name of a file or directory in the archive.  The search is
        case sensitive, and directory names must end with a forward slash (/).
    \returns
        The index of the entry with the given name, or INVALID_ENTRY_INDEX
        if no such entry was found.
    \throws fmuhandler::util::zip::Exception
        If there was an error accessing the archive.
    \pre
        `IsOpen() == true`
    */
    EntryIndex FindEntry(const std::string& name) const;

    /**
    \brief  Returns the name of an archive entry.

    \param [in] index
        An archive entry index in the range `[0,EntryCount())`.
    \returns
        The full name of the entry with the given index.
    \throws fmuhandler::util::zip::Exception
        If there was an error accessing the archive.
    \pre
        `IsOpen() == true`
    */
    std::string EntryName(EntryIndex index) const;

    /**
    \brief  Returns whether an archive entry is a directory.

    This returns `true` if and only if the entry has zero size, has a CRC of
    zero, and a name which ends with a forward slash (/).

    \param [in] index
        An archive entry index in the range `[0,EntryCount())`.
    \returns
        Whether the entry with the given index is a directory.
    \throws fmuhandler::util::zip::Exception
        If there was an error accessing the archive.
    \pre
        `IsOpen() == true`
    */
    bool IsDirEntry(EntryIndex index) const;

    /**
    \brief  Returns information about an archive entry.

    \param [in] index
        An archive entry index in the range `[0,EntryCount())`.
    \throws fmuhandler::util::zip::Exception
        If there was an error accessing the archive.
    \pre
        `IsOpen() == true`
    */
    EntryInfo Entry(EntryIndex index) const;

    /**
    \brief  Reads the entire (uncompressed) contents of a file entry.

    \param [in] index
        An archive entry index in the range `[0,EntryCount())`.
    \returns
        The contents of the entry.  The string is used as a byte container,
        and may contain null characters.
    \throws fmuhandler::util::zip::Exception
        If there was an error accessing or decompressing the entry.
    \pre
        `IsOpen() == true`
    */
    std::string ReadEntry(EntryIndex index) const;

private:
    ::zip* m_archive;
};


/**
\brief  A class for creating ZIP archives.

The archive is assembled in memory and only written to disk when Commit() is
called.  If the object is destroyed (or Discard() is called) before that,
nothing is written, and a file which already existed at the target path is
left untouched.
*/
class ArchiveWriter
{
public:
    /**
    \brief  Prepares the creation of a new archive at `path`.

    An existing file at `path` will be replaced when Commit() is called.

    \throws fmuhandler::util::zip::Exception
        If the archive could not be created.
    */
    explicit ArchiveWriter(const boost::filesystem::path& path);

    ArchiveWriter(const ArchiveWriter&) = delete;
    ArchiveWriter& operator=(const ArchiveWriter&) = delete;
    ArchiveWriter(ArchiveWriter&&) = delete;
    ArchiveWriter& operator=(ArchiveWriter&&) = delete;

    /// Destructor; calls Discard().
    ~ArchiveWriter() FMUHANDLER_NOEXCEPT;

    /**
    \brief  Adds a file entry.

    \param [in] name
        The full name of the entry, using forward slashes as directory
        separators.
    \param [in] contents
        The uncompressed contents of the file.
    \param [in] compression
        The compression method.  libzip supports STORE_COMPRESSION and
        DEFLATE_COMPRESSION on all platforms.
    \param [in] modificationTime
        The modification time recorded in the archive, or 0 for the
        current time.

    \throws fmuhandler::util::zip::Exception
        If the entry could not be added, e.g. because an entry with the
        same name already exists or the compression method is unsupported.
    \pre
        `IsOpen() == true`
    */
    void AddFile(
        const std::string& name,
        std::string contents,
        CompressionMethod compression = DEFLATE_COMPRESSION,
        std::time_t modificationTime = 0);

    /**
    \brief  Adds a directory entry.

    \throws fmuhandler::util::zip::Exception
        If the entry could not be added.
    \pre
        `IsOpen() == true`
    */
    void AddDirectory(const std::string& name, std::time_t modificationTime = 0);

    /**
    \brief  Writes the archive to disk and closes it.

    \throws fmuhandler::util::zip::Exception
        If writing failed.  The object is closed in any case.
    \pre
        `IsOpen() == true`
    */
    void Commit();

    /// Closes the archive without writing anything.
    void Discard() FMUHANDLER_NOEXCEPT;

    /// Whether the archive is open for adding entries.
    bool IsOpen() const FMUHANDLER_NOEXCEPT;

private:
    ::zip* m_archive;

    // libzip reads entry data lazily when the archive is committed, so the
    // buffers must stay alive (and at the same address) until then.
    std::list<std::string> m_buffers;
};


/// Exception class for errors that occur while dealing with ZIP files.
class Exception : public std::runtime_error
{
public:
    // Creates an exception with the given message
    Exception(const std::string& msg) FMUHANDLER_NOEXCEPT;

    // Creates an exception for the last error for the given archive
    Exception(::zip* archive) FMUHANDLER_NOEXCEPT;

    // Creates an exception for the last error for the given file
    Exception(zip_file* file) FMUHANDLER_NOEXCEPT;
};


}}} // namespace
#endif // header guard
