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

#include "purge/Category.hpp"

namespace mlcp::purge
{
    const char* getCategoryName(Category category)
    {
        switch (category)
        {
        case Category::Music:
            return "music";
        case Category::OtherAudio:
            return "other audio";
        case Category::Document:
            return "document";
        case Category::AlbumArt:
            return "album art";
        case Category::Unknown:
            return "unknown";
        }
        return "";
    }
} // namespace mlcp::purge
