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

#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <system_error>

#include "core/Path.hpp"
#include "purge/Classifier.hpp"
#include "purge/IPurgeEngine.hpp"

namespace mlcp::purge
{
    static inline const std::filesystem::path excludeDirFileName{ ".mlcpignore" };

    class PurgeEngine final : public IPurgeEngine
    {
    public:
        PurgeEngine(const FileTypes& fileTypes);
        ~PurgeEngine() override = default;
        PurgeEngine(const PurgeEngine&) = delete;
        PurgeEngine& operator=(const PurgeEngine&) = delete;

    private:
        RunSummary run(const PurgeSettings& settings) override;

        // Backup directory matching the library directory being processed
        // Creation is attempted once, on the first file to back up
        struct BackupDirectory
        {
            std::filesystem::path path;
            std::optional<std::error_code> creationResult;
        };

        struct RunContext
        {
            const PurgeSettings& settings;
            const std::filesystem::path libraryRoot; // without trailing separator
            RunSummary& summary;
        };

        void checkSettings(const PurgeSettings& settings) const;
        void processDirectory(RunContext& context, const core::pathUtils::DirectoryContent& content) const;
        void processFile(RunContext& context, const std::filesystem::path& file, bool inMusicDirectory, BackupDirectory* backupDirectory) const;
        bool backupFile(RunContext& context, const std::filesystem::path& file, BackupDirectory& backupDirectory) const;
        bool removeFile(RunContext& context, const std::filesystem::path& file) const;

        static void addLogLine(RunContext& context, std::string line);
        static void recordFailure(RunContext& context, const std::filesystem::path& file, std::string reason, std::error_code ec = {});

        const Classifier _classifier;
    };
} // namespace mlcp::purge
