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
#include <cstdint>

#include <boost/crc.hpp>

namespace mlcp::core
{
    class Crc32Calculator
    {
    public:
        void processBytes(const std::byte* data, std::size_t dataSize)
        {
            _result.process_bytes(data, dataSize);
        }

        std::uint32_t getResult() const
        {
            return _result.checksum();
        }

    private:
        boost::crc_32_type _result;
    };
} // namespace mlcp::core
