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

#include "purge/DecisionPolicy.hpp"

#include "purge/PurgeSettings.hpp"

namespace mlcp::purge
{
    const char* getDecisionName(Decision decision)
    {
        switch (decision)
        {
        case Decision::Keep:
            return "keep";
        case Decision::Remove:
            return "remove";
        }
        return "";
    }

    core::EnumSet<Category> getKeptCategories(const PurgeOptions& options)
    {
        core::EnumSet<Category> keptCategories{ Category::Music };

        if (!options.purgeArt)
            keptCategories.insert(Category::AlbumArt);
        if (options.keepDocuments)
            keptCategories.insert(Category::Document);
        if (options.keepOtherAudio)
            keptCategories.insert(Category::OtherAudio);

        return keptCategories;
    }

    Decision decide(Category category, const PurgeOptions& options)
    {
        return getKeptCategories(options).contains(category) ? Decision::Keep : Decision::Remove;
    }
} // namespace mlcp::purge
