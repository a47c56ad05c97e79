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

#include <gtest/gtest.h>

#include "core/EnumSet.hpp"

namespace mlcp::core::tests
{
    enum class MyEnum
    {
        A,
        B,
        C,
        D,
    };

    TEST(EnumSet, ctr)
    {
        {
            constexpr EnumSet<MyEnum> set;
            EXPECT_TRUE(set.empty());
            EXPECT_FALSE(set.contains(MyEnum::A));
        }

        {
            constexpr EnumSet<MyEnum> set{ MyEnum::A, MyEnum::C };
            EXPECT_FALSE(set.empty());
            EXPECT_TRUE(set.contains(MyEnum::A));
            EXPECT_FALSE(set.contains(MyEnum::B));
            EXPECT_TRUE(set.contains(MyEnum::C));
            EXPECT_FALSE(set.contains(MyEnum::D));
        }
    }

    TEST(EnumSet, insertErase)
    {
        EnumSet<MyEnum> set;

        set.insert(MyEnum::B);
        EXPECT_TRUE(set.contains(MyEnum::B));

        // idempotent
        set.insert(MyEnum::B);
        EXPECT_EQ(set, EnumSet<MyEnum>{ MyEnum::B });

        set.insert(MyEnum::D);
        EXPECT_EQ(set, (EnumSet<MyEnum>{ MyEnum::D, MyEnum::B }));

        set.erase(MyEnum::B);
        EXPECT_FALSE(set.contains(MyEnum::B));
        EXPECT_TRUE(set.contains(MyEnum::D));

        set.erase(MyEnum::A);
        EXPECT_EQ(set, EnumSet<MyEnum>{ MyEnum::D });

        set.clear();
        EXPECT_TRUE(set.empty());
        EXPECT_EQ(set, EnumSet<MyEnum>{});
    }
} // namespace mlcp::core::tests
