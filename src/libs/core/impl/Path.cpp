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

#include "core/Path.hpp"

#include <algorithm>
#include <array>
#include <fstream>

#include "core/Exception.hpp"
#include "core/ILogger.hpp"
#include "core/String.hpp"

#include "Crc32Calculator.hpp"

namespace mlcp::core::pathUtils
{
    namespace
    {
        void addDirectoryEntry(const std::filesystem::directory_entry& entry, DirectoryContent& content, std::vector<std::filesystem::path>& subDirectories)
        {
            using IgnoreReason = DirectoryContent::IgnoreReason;

            std::error_code ec;
            const bool isSymlink{ entry.is_symlink(ec) };
            if (ec)
            {
                content.ignoredEntries.push_back({ entry.path(), IgnoreReason::StatFailure, ec });
                return;
            }

            // follows symlinks
            const std::filesystem::file_status status{ entry.status(ec) };
            if (ec || status.type() == std::filesystem::file_type::not_found)
            {
                if (!ec)
                    ec = std::make_error_code(std::errc::no_such_file_or_directory);

                content.ignoredEntries.push_back({ entry.path(), IgnoreReason::StatFailure, ec });
                return;
            }

            switch (status.type())
            {
            case std::filesystem::file_type::regular:
                content.files.push_back(entry.path());
                break;

            case std::filesystem::file_type::directory:
                if (isSymlink)
                    content.ignoredEntries.push_back({ entry.path(), IgnoreReason::DirectorySymlink, {} });
                else
                    subDirectories.push_back(entry.path());
                break;

            default:
                content.ignoredEntries.push_back({ entry.path(), IgnoreReason::SpecialFile, {} });
                break;
            }
        }
    } // namespace

    std::uint32_t computeCrc32(const std::filesystem::path& p)
    {
        Crc32Calculator crc32;

        std::ifstream ifs{ p, std::ios_base::binary };
        if (!ifs)
            throw MlcpException{ "Failed to open file '" + p.string() + "'" };

        do
        {
            std::array<char, 4096> buffer;

            ifs.read(buffer.data(), buffer.size());
            crc32.processBytes(reinterpret_cast<const std::byte*>(buffer.data()), static_cast<std::size_t>(ifs.gcount()));
        } while (ifs);

        if (ifs.bad())
            throw MlcpException{ "Failed to read file '" + p.string() + "'" };

        return crc32.getResult();
    }

    bool ensureDirectory(const std::filesystem::path& dir, std::error_code& ec)
    {
        ec.clear();

        if (std::filesystem::exists(dir, ec))
        {
            if (std::filesystem::is_directory(dir, ec))
                return true;

            if (!ec)
                ec = std::make_error_code(std::errc::not_a_directory);
            return false;
        }

        if (ec)
            return false;

        std::filesystem::create_directories(dir, ec);
        return !ec;
    }

    const char* getIgnoreReasonName(DirectoryContent::IgnoreReason reason)
    {
        switch (reason)
        {
        case DirectoryContent::IgnoreReason::StatFailure:
            return "cannot get file status";
        case DirectoryContent::IgnoreReason::DirectorySymlink:
            return "directory symlinks are not followed";
        case DirectoryContent::IgnoreReason::SpecialFile:
            return "not a regular file";
        }
        return "";
    }

    bool exploreDirectories(const std::filesystem::path& rootDirectory, std::function<bool(std::error_code, const DirectoryContent&)> cb, const std::filesystem::path* excludeDirFileName)
    {
        // explicit stack to bound recursion on deep trees
        std::vector<std::filesystem::path> pendingDirectories{ rootDirectory };

        while (!pendingDirectories.empty())
        {
            DirectoryContent content;
            content.directory = std::move(pendingDirectories.back());
            pendingDirectories.pop_back();

            std::error_code ec;
            if (excludeDirFileName && !excludeDirFileName->empty())
            {
                const std::filesystem::path excludePath{ content.directory / *excludeDirFileName };
                if (std::filesystem::exists(excludePath, ec))
                {
                    MLCP_LOG(UTILS, DEBUG, "Found '" << excludePath.string() << "': skipping directory");
                    continue;
                }
            }

            std::filesystem::directory_iterator itPath{ content.directory, ec };
            if (ec)
            {
                if (!cb(ec, content))
                    return false;

                continue;
            }

            std::vector<std::filesystem::path> subDirectories;
            const std::filesystem::directory_iterator itEnd;
            while (itPath != itEnd)
            {
                addDirectoryEntry(*itPath, content, subDirectories);

                itPath.increment(ec);
                if (ec)
                {
                    MLCP_LOG(UTILS, DEBUG, "Cannot read further in directory '" << content.directory.string() << "': " << ec.message());
                    content.listingError = ec;
                    break;
                }
            }

            std::sort(std::begin(content.files), std::end(content.files));

            // reverse order so that subdirectories get popped in lexical order
            std::sort(std::begin(subDirectories), std::end(subDirectories), std::greater{});
            for (std::filesystem::path& subDirectory : subDirectories)
                pendingDirectories.push_back(std::move(subDirectory));

            if (!cb({}, content))
                return false;
        }

        return true;
    }

    bool hasFileAnyExtension(const std::filesystem::path& file, std::span<const std::string> extensions)
    {
        std::string extension{ stringUtils::stringToLower(file.extension().string()) };
        if (extension.empty())
            return false;

        extension.erase(0, 1); // leading '.'
        return std::find(std::cbegin(extensions), std::cend(extensions), extension) != std::cend(extensions);
    }

    bool isPathInRootPath(const std::filesystem::path& path, const std::filesystem::path& rootPathArg)
    {
        std::filesystem::path curPath{ path };
        const std::filesystem::path rootPath{ rootPathArg.has_filename() ? rootPathArg : rootPathArg.parent_path() };

        while (true)
        {
            if (curPath == rootPath)
                return true;

            if (curPath == curPath.root_path())
                break;

            curPath = curPath.parent_path();
        }

        return false;
    }

    void copyFile(const std::filesystem::path& source, const std::filesystem::path& destination, std::error_code& ec)
    {
        std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
            return;

        std::error_code timeEc;
        const std::filesystem::file_time_type lastWriteTime{ std::filesystem::last_write_time(source, timeEc) };
        if (!timeEc)
            std::filesystem::last_write_time(destination, lastWriteTime, timeEc);

        if (timeEc)
            MLCP_LOG(UTILS, DEBUG, "Cannot preserve last write time on '" << destination.string() << "': " << timeEc.message());
    }
} // namespace mlcp::core::pathUtils
