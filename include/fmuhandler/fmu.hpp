/**
\file
\brief  Reading and rewriting FMU archives.
\copyright
    Copyright 2013-present, SINTEF Ocean.
    This Source Code Form is subject to the terms of the Mozilla Public
    License, v. 2.0. If a copy of the MPL was not distributed with this
    file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#ifndef FMUHANDLER_FMU_HPP
#define FMUHANDLER_FMU_HPP

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include <fmuhandler/config.h>
#include <fmuhandler/model.hpp>
#include <fmuhandler/model_description.hpp>
#include <fmuhandler/schema.hpp>


namespace fmuhandler
{


/// The name of the model description member of an FMU archive.
const char* const MODEL_DESCRIPTION_ENTRY = "modelDescription.xml";


/**
\brief  An FMU archive whose model description can be edited.

The constructor reads the list of archive members and the raw
`modelDescription.xml` member, and then closes the archive again.  The model
description is parsed the first time it is needed.

Changes only exist in memory until Save() or SaveCopy() is called.  These
write a new archive in which `modelDescription.xml` has been replaced and
every other member is copied unchanged.

An FMU object must not be used from several threads at once.
*/
class FMU
{
public:
    /**
    \brief  Opens an FMU.

    \throws fmuhandler::error::FileNotFoundException
        If `path` does not exist or is not a regular file.
    \throws fmuhandler::error::ArchiveFormatException
        If the file is not a ZIP archive, or if it has no
        `modelDescription.xml` member.
    */
    explicit FMU(const boost::filesystem::path& path);

    FMU(const FMU&) = delete;
    FMU& operator=(const FMU&) = delete;

    FMU(FMU&&) FMUHANDLER_NOEXCEPT;
    FMU& operator=(FMU&&) FMUHANDLER_NOEXCEPT;

    ~FMU() FMUHANDLER_NOEXCEPT;

    /// The path of the archive, as given to the constructor.
    const boost::filesystem::path& Path() const FMUHANDLER_NOEXCEPT;

    /// The names of all archive members, in archive order.
    const std::vector<std::string>& EntryNames() const FMUHANDLER_NOEXCEPT;

    /**
    \brief  The model description.

    The first call parses the `modelDescription.xml` member, and subsequent
    calls return the same object.

    \throws fmuhandler::error::MalformedXmlException
    \throws fmuhandler::error::ModelParseException
    \throws fmuhandler::error::InvalidValueException
        See fmuhandler::ModelDescription::Parse().  If parsing fails, the
        next call tries again.
    */
    fmuhandler::ModelDescription& ModelDescription();
    const fmuhandler::ModelDescription& ModelDescription() const;

    /// Calls fmuhandler::ModelDescription::Variables().
    const std::vector<fmuhandler::model::ScalarVariable>& Variables() const;

    /// Calls fmuhandler::ModelDescription::Variable().
    const fmuhandler::model::ScalarVariable& Variable(const std::string& name) const;

    /// Calls fmuhandler::ModelDescription::QueryVariables().
    std::vector<fmuhandler::model::ScalarVariable> QueryVariables(
        const VariableQuery& query) const;

    /// Calls fmuhandler::ModelDescription::SetStartValue().
    void SetStartValue(const std::string& name, const fmuhandler::model::ScalarValue& value);

    /// Calls fmuhandler::ModelDescription::SetStartValue().
    void SetStartValue(const std::string& name, const std::string& value);

    /// Calls fmuhandler::ModelDescription::SetStartValue().
    void SetStartValue(const std::string& name, const char* value);

    /// Calls fmuhandler::ModelDescription::DeleteVariable().
    void DeleteVariable(const std::string& name);

    /// Validates the model description against the bundled FMI 2.0 schema.
    ValidationResult Validate() const;

    /**
    \brief  Writes the archive back to its own path.

    Equivalent to `Save(Path())`.
    */
    void Save();

    /**
    \brief  Writes the archive to `target`.

    The model description is first validated against the bundled schema.
    If it is valid, a new archive is written to a temporary file next to
    `target`, which is then renamed to `target`.  The new archive has the
    same members as the source archive, in the same order and with the same
    contents, compression methods and modification times, except for
    `modelDescription.xml`, which holds the current model description.

    If the function throws, `target` has not been modified.

    \throws fmuhandler::error::SchemaValidationException
        If the model description is not valid.  Nothing is written.
    \throws std::runtime_error
        If reading the source archive or writing the new one failed.
    */
    void Save(const boost::filesystem::path& target);

    /**
    \brief  Writes the archive to a file in another directory.

    `targetDir` is created if necessary, once the model description has
    passed validation.  If `fileName` is empty, the file name of Path() is
    used, and if it does not end with `.fmu`, that extension is appended.

    \returns the path of the new file.
    \throws See Save().
    */
    boost::filesystem::path SaveCopy(
        const boost::filesystem::path& targetDir,
        const std::string& fileName = std::string());

private:
    fmuhandler::ModelDescription& LoadModelDescription() const;
    std::string ValidatedXmlBytes(const boost::filesystem::path& target) const;
    void WriteArchive(
        const boost::filesystem::path& target,
        const std::string& xmlBytes) const;

    boost::filesystem::path m_path;
    std::vector<std::string> m_entryNames;
    std::string m_modelDescriptionXml;
    mutable std::unique_ptr<fmuhandler::ModelDescription> m_modelDescription;
};


} // namespace
#endif // header guard
