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

namespace mlcp::purge
{
    struct PurgeOptions
    {
        bool purgeArt{};
        bool keepDocuments{};
        bool keepOtherAudio{};
    };

    struct PurgeSettings
    {
        std::filesystem::path libraryPath;
        std::optional<std::filesystem::path> backupPath; // purged files are copied here first, mirroring the library tree

        PurgeOptions options;
        bool purge{}; // no change is made to the file system unless set
        bool verbose{};

        bool skipResourceForks{ true }; // "._*" files
        bool verifyBackup{ true };      // compare checksums before removing the source file
    };
} // namespace mlcp::purge
