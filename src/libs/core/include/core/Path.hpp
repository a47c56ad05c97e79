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

#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <system_error>
#include <vector>

namespace mlcp::core::pathUtils
{
    // throws MlcpException if the file cannot be read
    std::uint32_t computeCrc32(const std::filesystem::path& p);

    // Make sure the given path is a directory
    // Create it and its parents if needed
    bool ensureDirectory(const std::filesystem::path& dir, std::error_code& ec);

    struct DirectoryContent
    {
        enum class IgnoreReason
        {
            StatFailure,
            DirectorySymlink,
            SpecialFile,
        };

        struct IgnoredEntry
        {
            std::filesystem::path path;
            IgnoreReason reason;
            std::error_code ec;
        };

        std::filesystem::path directory;
        std::vector<std::filesystem::path> files; // sorted, regular files or symlinks to regular files
        std::vector<IgnoredEntry> ignoredEntries;
        std::error_code listingError; // set if the listing stopped early: files and subdirectories are partial
    };

    const char* getIgnoreReasonName(DirectoryContent::IgnoreReason reason);

    // Visit each directory of the tree exactly once, parents before children
    // Directory symlinks are not followed
    // Directories that contain excludeDirFileName are skipped along with their subdirectories
    // cb is called with an error if the directory cannot be listed at all
    // returns false if aborted by user
    bool exploreDirectories(const std::filesystem::path& rootDirectory, std::function<bool(std::error_code, const DirectoryContent&)> cb, const std::filesystem::path* excludeDirFileName = {});

    // Check if file's extension is one of provided extensions (lower case, without the leading dot)
    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::string> extensions);

    // Caller responsibility to call with normalized paths
    bool isPathInRootPath(const std::filesystem::path& path, const std::filesystem::path& rootPath);

    // Copy the file content, overwriting the destination if it exists
    // The last write time is carried over when the platform allows it
    void copyFile(const std::filesystem::path& source, const std::filesystem::path& destination, std::error_code& ec);
} // namespace mlcp::core::pathUtils
