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
#include <system_error>

#include "core/Exception.hpp"

namespace mlcp::purge
{
    class Exception : public core::MlcpException
    {
    public:
        using MlcpException::MlcpException;
    };

    // Settings that prevent the run from starting, raised before any change is made
    class ConfigurationException : public Exception
    {
    public:
        ConfigurationException(std::string_view message, const std::filesystem::path& path, std::error_code err = {})
            : Exception{ std::string{ message } + " '" + path.string() + "'" + (err ? ": " + err.message() : "") }
            , _path{ path }
            , _err{ err }
        {
        }

        const std::filesystem::path& getPath() const { return _path; }
        std::error_code getErrorCode() const { return _err; }

    private:
        std::filesystem::path _path;
        std::error_code _err;
    };
} // namespace mlcp::purge
