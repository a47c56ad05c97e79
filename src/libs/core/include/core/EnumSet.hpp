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

#include <cassert>
#include <cstdint>
#include <initializer_list>
#include <type_traits>

namespace mlcp::core
{
    // Fixed size set of enum values, stored as a bitfield
    template<typename T>
    class EnumSet
    {
        static_assert(std::is_enum_v<T>);

    public:
        using ValueType = std::uint32_t;

        constexpr EnumSet() = default;
        constexpr EnumSet(std::initializer_list<T> values)
        {
            for (T value : values)
                insert(value);
        }

        constexpr void insert(T value)
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            _bitfield |= (ValueType{ 1 } << static_cast<ValueType>(value));
        }

        constexpr void erase(T value)
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            _bitfield &= ~(ValueType{ 1 } << static_cast<ValueType>(value));
        }

        constexpr bool contains(T value) const
        {
            assert(static_cast<std::size_t>(value) < sizeof(_bitfield) * 8);
            return _bitfield & (ValueType{ 1 } << static_cast<ValueType>(value));
        }

        constexpr bool empty() const { return _bitfield == 0; }
        constexpr void clear() { _bitfield = 0; }

        constexpr bool operator==(const EnumSet& other) const = default;

    private:
        ValueType _bitfield{};
    };
} // namespace mlcp::core
