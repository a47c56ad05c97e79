/*
 * Copyright (C) 2024 Emeric Poupon
 *
 * This file is part of mlcp.
 *
 * mlcp is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * mlcp is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with mlcp.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "PurgeEngine.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <vector>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"
#include "purge/DecisionPolicy.hpp"
#include "purge/Exception.hpp"

namespace mlcp::purge
{
    namespace
    {
        bool isResourceFork(const std::filesystem::path& file)
        {
            return core::stringUtils::stringStartsWith(file.filename().string(), "._");
        }

        void checkIsDirectory(const std::filesystem::path& path, std::string_view name)
        {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec))
                throw ConfigurationException{ std::string{ name } + " path does not exist:", path, ec };

            if (!std::filesystem::is_directory(path, ec))
                throw ConfigurationException{ std::string{ name } + " path is not a directory:", path, ec };
        }

        void checkWriteAccess(const std::filesystem::path& path)
        {
            if (::access(path.c_str(), W_OK) != 0)
                throw ConfigurationException{ "Missing write permission on", path, std::error_code{ errno, std::generic_category() } };
        }

        Operation getOperation(const PurgeSettings& settings)
        {
            if (!settings.purge)
                return Operation::Simulate;

            return settings.backupPath ? Operation::Backup : Operation::Purge;
        }
    } // namespace

    std::unique_ptr<IPurgeEngine> createPurgeEngine(const FileTypes& fileTypes)
    {
        return std::make_unique<PurgeEngine>(fileTypes);
    }

    PurgeEngine::PurgeEngine(const FileTypes& fileTypes)
        : _classifier{ fileTypes }
    {
    }

    RunSummary PurgeEngine::run(const PurgeSettings& settings)
    {
        checkSettings(settings);

        RunSummary summary;
        summary.operation = getOperation(settings);

        MLCP_LOG(PURGE, INFO, "Processing library '" << settings.libraryPath.string() << "'" << (settings.backupPath ? ", backup path = '" + settings.backupPath->string() + "'" : "") << (settings.purge ? "" : " (simulation)"));

        const std::filesystem::path libraryRoot{ settings.libraryPath.has_filename() ? settings.libraryPath : settings.libraryPath.parent_path() };
        RunContext context{ settings, libraryRoot, summary };
        core::pathUtils::exploreDirectories(
            libraryRoot, [&](std::error_code ec, const core::pathUtils::DirectoryContent& content) {
                if (ec)
                {
                    // nothing has been changed yet if the root itself cannot be listed
                    if (content.directory == libraryRoot)
                        throw ConfigurationException{ "Cannot list library path", settings.libraryPath, ec };

                    MLCP_LOG(PURGE, WARNING, "Cannot list directory '" << content.directory.string() << "': " << ec.message());
                    addLogLine(context, "[ERROR] " + content.directory.string() + ": cannot list directory");
                    summary.errors.push_back(FileError{ content.directory, "cannot list directory", ec });
                    return true;
                }

                processDirectory(context, content);
                return true;
            },
            &excludeDirFileName);

        MLCP_LOG(PURGE, INFO, "Examined " << summary.examined << " files: " << summary.kept << " kept, " << summary.removed << " " << getOperationName(summary.operation) << ", " << summary.skipped << " skipped, " << summary.ignored << " ignored");

        return summary;
    }

    void PurgeEngine::checkSettings(const PurgeSettings& settings) const
    {
        checkIsDirectory(settings.libraryPath, "Library");

        if (settings.backupPath)
        {
            checkIsDirectory(*settings.backupPath, "Backup");

            std::error_code ec;
            const std::filesystem::path libraryRoot{ std::filesystem::canonical(settings.libraryPath, ec) };
            if (ec)
                throw ConfigurationException{ "Cannot resolve library path", settings.libraryPath, ec };

            const std::filesystem::path backupRoot{ std::filesystem::canonical(*settings.backupPath, ec) };
            if (ec)
                throw ConfigurationException{ "Cannot resolve backup path", *settings.backupPath, ec };

            // mirrored backup files must never land on library files
            if (core::pathUtils::isPathInRootPath(backupRoot, libraryRoot))
                throw ConfigurationException{ "Backup path must not be located inside the library path:", *settings.backupPath };
            if (core::pathUtils::isPathInRootPath(libraryRoot, backupRoot))
                throw ConfigurationException{ "Library path must not be located inside the backup path:", settings.libraryPath };
        }

        if (settings.purge)
        {
            checkWriteAccess(settings.libraryPath);
            if (settings.backupPath)
                checkWriteAccess(*settings.backupPath);
        }
    }

    void PurgeEngine::processDirectory(RunContext& context, const core::pathUtils::DirectoryContent& content) const
    {
        for (const core::pathUtils::DirectoryContent::IgnoredEntry& entry : content.ignoredEntries)
        {
            context.summary.ignored++;
            MLCP_LOG(PURGE, WARNING, "Skipping '" << entry.path.string() << "': " << core::pathUtils::getIgnoreReasonName(entry.reason) << (entry.ec ? ": " + entry.ec.message() : ""));
        }

        if (content.listingError)
        {
            MLCP_LOG(PURGE, WARNING, "Cannot read whole directory '" << content.directory.string() << "': " << content.listingError.message());
            addLogLine(context, "[ERROR] " + content.directory.string() + ": cannot read whole directory: " + content.listingError.message());
            context.summary.errors.push_back(FileError{ content.directory, "cannot read whole directory", content.listingError });
        }

        std::optional<BackupDirectory> backupDirectory;
        if (context.settings.backupPath)
        {
            const std::filesystem::path relativeDirectory{ content.directory.lexically_relative(context.libraryRoot) };
            backupDirectory = BackupDirectory{ (*context.settings.backupPath / relativeDirectory).lexically_normal(), std::nullopt };
        }

        std::vector<std::filesystem::path> files;
        files.reserve(content.files.size());
        for (const std::filesystem::path& file : content.files)
        {
            if (context.settings.skipResourceForks && isResourceFork(file))
            {
                context.summary.ignored++;
                MLCP_LOG(PURGE, DEBUG, "Skipping resource fork '" << file.string() << "'");
                continue;
            }

            files.push_back(file);
        }

        const bool inMusicDirectory{ _classifier.containsMusicFile(files) };
        for (const std::filesystem::path& file : files)
            processFile(context, file, inMusicDirectory, backupDirectory ? &(*backupDirectory) : nullptr);
    }

    void PurgeEngine::processFile(RunContext& context, const std::filesystem::path& file, bool inMusicDirectory, BackupDirectory* backupDirectory) const
    {
        context.summary.examined++;

        const Category category{ _classifier.classify(file, inMusicDirectory) };
        const Decision decision{ decide(category, context.settings.options) };

        MLCP_LOG(PURGE, DEBUG, "'" << file.string() << "': " << getCategoryName(category) << " -> " << getDecisionName(decision));

        if (decision == Decision::Keep)
        {
            context.summary.kept++;
            return;
        }

        // decision logic is shared with the simulation, only the side effects below are gated
        if (context.settings.purge)
        {
            if (backupDirectory && !backupFile(context, file, *backupDirectory))
                return;

            if (!removeFile(context, file))
                return;
        }

        if (backupDirectory)
            context.summary.backedUp++;
        context.summary.removed++;
        addLogLine(context, std::string{ "[" } + getOperationName(context.summary.operation) + "] " + file.string());
    }

    bool PurgeEngine::backupFile(RunContext& context, const std::filesystem::path& file, BackupDirectory& backupDirectory) const
    {
        if (!backupDirectory.creationResult)
        {
            std::error_code ec;
            core::pathUtils::ensureDirectory(backupDirectory.path, ec);
            backupDirectory.creationResult = ec;

            if (ec)
                MLCP_LOG(PURGE, WARNING, "Cannot create backup directory '" << backupDirectory.path.string() << "': " << ec.message());
        }

        if (*backupDirectory.creationResult)
        {
            recordFailure(context, file, "cannot create backup directory '" + backupDirectory.path.string() + "'", *backupDirectory.creationResult);
            return false;
        }

        const std::filesystem::path backupFilePath{ backupDirectory.path / file.filename() };

        std::error_code ec;
        core::pathUtils::copyFile(file, backupFilePath, ec);
        if (ec)
        {
            recordFailure(context, file, "cannot copy to '" + backupFilePath.string() + "'", ec);
            return false;
        }

        // the copy must be confirmed before the source can go away
        const std::uintmax_t sourceSize{ std::filesystem::file_size(file, ec) };
        if (ec)
        {
            recordFailure(context, file, "cannot get file size", ec);
            return false;
        }

        const std::uintmax_t backupSize{ std::filesystem::file_size(backupFilePath, ec) };
        if (ec || backupSize != sourceSize)
        {
            recordFailure(context, file, "backup copy '" + backupFilePath.string() + "' is missing or incomplete", ec);
            return false;
        }

        if (context.settings.verifyBackup)
        {
            try
            {
                if (core::pathUtils::computeCrc32(file) != core::pathUtils::computeCrc32(backupFilePath))
                {
                    recordFailure(context, file, "backup copy '" + backupFilePath.string() + "' differs from source");
                    return false;
                }
            }
            catch (const core::MlcpException& e)
            {
                recordFailure(context, file, std::string{ "cannot verify backup copy: " } + e.what());
                return false;
            }
        }

        MLCP_LOG(PURGE, DEBUG, "Backed up '" << file.string() << "' to '" << backupFilePath.string() << "'");
        return true;
    }

    bool PurgeEngine::removeFile(RunContext& context, const std::filesystem::path& file) const
    {
        std::error_code ec;
        if (!std::filesystem::remove(file, ec))
        {
            if (ec)
            {
                recordFailure(context, file, "cannot remove file", ec);
                return false;
            }

            MLCP_LOG(PURGE, DEBUG, "'" << file.string() << "' already removed");
        }

        return true;
    }

    void PurgeEngine::addLogLine(RunContext& context, std::string line)
    {
        if (context.settings.verbose)
            context.summary.logLines.push_back(std::move(line));
    }

    void PurgeEngine::recordFailure(RunContext& context, const std::filesystem::path& file, std::string reason, std::error_code ec)
    {
        MLCP_LOG(PURGE, WARNING, "Leaving '" << file.string() << "' in place: " << reason << (ec ? ": " + ec.message() : ""));

        context.summary.skipped++;
        addLogLine(context, "[ERROR] " + file.string() + ": " + reason + (ec ? ": " + ec.message() : ""));
        context.summary.errors.push_back(FileError{ file, std::move(reason), ec });
    }
} // namespace mlcp::purge
