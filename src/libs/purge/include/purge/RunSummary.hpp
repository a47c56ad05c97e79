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

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace mlcp::purge
{
    enum class Operation
    {
        Simulate,
        Purge,
        Backup,
    };

    const char* getOperationName(Operation operation);

    struct FileError
    {
        std::filesystem::path path;
        std::string reason;
        std::error_code ec;
    };

    struct RunSummary
    {
        Operation operation{ Operation::Simulate };

        std::size_t examined{}; // files classified
        std::size_t kept{};
        std::size_t backedUp{}; // removed files that were (or would be) backed up first
        std::size_t removed{};  // removed, or would be removed in simulation
        std::size_t skipped{};  // left in place due to a backup or removal failure
        std::size_t ignored{};  // resource forks, special files and entries that cannot be stat'ed

        std::vector<std::string> logLines; // only filled in verbose mode
        std::vector<FileError> errors;

        std::size_t getCandidateCount() const { return removed + skipped; }
    };
} // namespace mlcp::purge
