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
#include <fstream>
#include <map>
#include <random>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "core/Path.hpp"

namespace mlcp::purge::tests
{
    class ScopedTemporaryDirectory final
    {
    public:
        ScopedTemporaryDirectory()
        {
            std::random_device rd;
            std::mt19937_64 gen{ rd() };

            _path = std::filesystem::temp_directory_path() / ("mlcp-test-" + std::to_string(gen()));
            std::filesystem::create_directories(_path);
        }

        ~ScopedTemporaryDirectory()
        {
            std::error_code ec;
            // restore permissions that some tests remove
            std::filesystem::permissions(_path, std::filesystem::perms::owner_all, std::filesystem::perm_options::add, ec);
            std::filesystem::remove_all(_path, ec);
        }

        ScopedTemporaryDirectory(const ScopedTemporaryDirectory&) = delete;
        ScopedTemporaryDirectory(ScopedTemporaryDirectory&&) = delete;
        ScopedTemporaryDirectory& operator=(const ScopedTemporaryDirectory&) = delete;
        ScopedTemporaryDirectory& operator=(ScopedTemporaryDirectory&&) = delete;

        const std::filesystem::path& getPath() const { return _path; }

    private:
        std::filesystem::path _path;
    };

    // content defaults to the relative path, so that every file is unique
    inline void writeFile(const std::filesystem::path& root, const std::filesystem::path& relativePath, std::string_view content = {})
    {
        const std::filesystem::path path{ root / relativePath };
        std::filesystem::create_directories(path.parent_path());

        std::ofstream ofs{ path, std::ios::binary | std::ios::trunc };
        ASSERT_TRUE(ofs) << "Cannot create '" << path << "'";
        ofs << (content.empty() ? relativePath.string() : content);
    }

    // relative path -> crc32 of each regular file (directories map to 0)
    inline std::map<std::filesystem::path, std::uint32_t> computeTreeChecksums(const std::filesystem::path& root)
    {
        std::map<std::filesystem::path, std::uint32_t> res;

        for (const std::filesystem::directory_entry& entry : std::filesystem::recursive_directory_iterator{ root })
        {
            const std::filesystem::path relativePath{ entry.path().lexically_relative(root) };
            res[relativePath] = entry.is_regular_file() ? core::pathUtils::computeCrc32(entry.path()) : 0;
        }

        return res;
    }
} // namespace mlcp::purge::tests
