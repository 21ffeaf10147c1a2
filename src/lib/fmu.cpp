/*
Copyright 2013-present, SINTEF Ocean.
This Source Code Form is subject to the terms of the Mozilla Public
License, v. 2.0. If a copy of the MPL was not distributed with this
file, You can obtain one at http://mozilla.org/MPL/2.0/.
*/
#include <fmuhandler/fmu.hpp>

#include <utility>

#include <boost/filesystem.hpp>

#include <fmuhandler/error.hpp>
#include <fmuhandler/log.hpp>
#include <fmuhandler/util.hpp>
#include <fmuhandler/util/filesystem.hpp>
#include <fmuhandler/util/zip.hpp>


namespace fs = boost::filesystem;
namespace fzip = fmuhandler::util::zip;


namespace fmuhandler
{


FMU::FMU(const boost::filesystem::path& path)
    : m_path(path)
{
    if (!fs::is_regular_file(path)) {
        throw error::FileNotFoundException(path.string());
    }
    try {
        fzip::Archive archive(path);
        const auto count = archive.EntryCount();
        m_entryNames.reserve(count);
        for (fzip::EntryIndex i = 0; i < count; ++i) {
            m_entryNames.push_back(archive.EntryName(i));
        }
        const auto mdIndex = archive.FindEntry(MODEL_DESCRIPTION_ENTRY);
        if (mdIndex == fzip::INVALID_ENTRY_INDEX) {
            throw error::ArchiveFormatException(
                path.string() + " has no " + MODEL_DESCRIPTION_ENTRY + " member");
        }
        m_modelDescriptionXml = archive.ReadEntry(mdIndex);
    } catch (const fzip::Exception& e) {
        throw error::ArchiveFormatException(
            "Error reading " + path.string() + ": " + e.what());
    }
    FMUHANDLER_LOG_DEBUG(boost::format("Opened %s (%d members)")
        % path.string() % m_entryNames.size());
}


FMU::FMU(FMU&&) FMUHANDLER_NOEXCEPT = default;
FMU& FMU::operator=(FMU&&) FMUHANDLER_NOEXCEPT = default;
FMU::~FMU() FMUHANDLER_NOEXCEPT = default;


const boost::filesystem::path& FMU::Path() const FMUHANDLER_NOEXCEPT
{
    return m_path;
}


const std::vector<std::string>& FMU::EntryNames() const FMUHANDLER_NOEXCEPT
{
    return m_entryNames;
}


fmuhandler::ModelDescription& FMU::LoadModelDescription() const
{
    if (!m_modelDescription) {
        m_modelDescription = std::make_unique<fmuhandler::ModelDescription>(
            fmuhandler::ModelDescription::Parse(m_modelDescriptionXml));
    }
    return *m_modelDescription;
}


fmuhandler::ModelDescription& FMU::ModelDescription()
{
    return LoadModelDescription();
}


const fmuhandler::ModelDescription& FMU::ModelDescription() const
{
    return LoadModelDescription();
}


const std::vector<model::ScalarVariable>& FMU::Variables() const
{
    return LoadModelDescription().Variables();
}


const model::ScalarVariable& FMU::Variable(const std::string& name) const
{
    return LoadModelDescription().Variable(name);
}


std::vector<model::ScalarVariable> FMU::QueryVariables(const VariableQuery& query) const
{
    return LoadModelDescription().QueryVariables(query);
}


void FMU::SetStartValue(const std::string& name, const model::ScalarValue& value)
{
    LoadModelDescription().SetStartValue(name, value);
}


void FMU::SetStartValue(const std::string& name, const std::string& value)
{
    LoadModelDescription().SetStartValue(name, value);
}


void FMU::SetStartValue(const std::string& name, const char* value)
{
    LoadModelDescription().SetStartValue(name, value);
}


void FMU::DeleteVariable(const std::string& name)
{
    LoadModelDescription().DeleteVariable(name);
}


ValidationResult FMU::Validate() const
{
    return LoadModelDescription().Validate();
}


void FMU::Save()
{
    Save(m_path);
}


namespace
{
    // libzip can write these two methods everywhere.  Anything else is
    // recompressed with DEFLATE.
    fzip::CompressionMethod OutputCompression(fzip::CompressionMethod source)
    {
        return source == fzip::STORE_COMPRESSION
            ? fzip::STORE_COMPRESSION
            : fzip::DEFLATE_COMPRESSION;
    }
}


void FMU::Save(const boost::filesystem::path& target)
{
    WriteArchive(target, ValidatedXmlBytes(target));
}


boost::filesystem::path FMU::SaveCopy(
    const boost::filesystem::path& targetDir,
    const std::string& fileName)
{
    auto name = fileName.empty() ? m_path.filename().string() : fileName;
    if (fs::path(name).extension() != ".fmu") name += ".fmu";
    const auto target = targetDir / name;
    const auto xmlBytes = ValidatedXmlBytes(target);
    fs::create_directories(targetDir);
    WriteArchive(target, xmlBytes);
    return target;
}


std::string FMU::ValidatedXmlBytes(const boost::filesystem::path& target) const
{
    auto xmlBytes = LoadModelDescription().ToXmlBytes();
    const auto validation = SchemaValidator::Canonical()->Validate(xmlBytes);
    if (!validation.valid) {
        log::Log(log::warning, boost::format("Not saving %s: model description is invalid")
            % target.string());
        throw error::SchemaValidationException(validation.diagnostics);
    }
    return xmlBytes;
}


void FMU::WriteArchive(
    const boost::filesystem::path& target,
    const std::string& xmlBytes) const
{
    const auto tempPath = util::UniqueSiblingPath(target);
    auto removeTemp = util::OnScopeExit([&tempPath] () {
        boost::system::error_code ec;
        fs::remove(tempPath, ec);
    });

    {
        fzip::Archive source(m_path);
        fzip::ArchiveWriter writer(tempPath);
        const auto count = source.EntryCount();
        for (fzip::EntryIndex i = 0; i < count; ++i) {
            const auto entry = source.Entry(i);
            if (entry.isDirectory) {
                writer.AddDirectory(entry.name, entry.modificationTime);
            } else if (entry.name == MODEL_DESCRIPTION_ENTRY) {
                writer.AddFile(entry.name, xmlBytes, OutputCompression(entry.compression));
            } else {
                writer.AddFile(
                    entry.name,
                    source.ReadEntry(i),
                    OutputCompression(entry.compression),
                    entry.modificationTime);
            }
        }
        writer.Commit();
    }

    fs::rename(tempPath, target);
    removeTemp.Dismiss();
    log::Log(log::info, boost::format("Saved %s") % target.string());
}


} // namespace
