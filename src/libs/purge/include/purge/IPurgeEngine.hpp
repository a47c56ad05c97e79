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

#include <memory>

#include "purge/PurgeSettings.hpp"
#include "purge/RunSummary.hpp"

namespace mlcp::purge
{
    struct FileTypes;

    class IPurgeEngine
    {
    public:
        virtual ~IPurgeEngine() = default;

        // throws ConfigurationException, before any change is made, if the settings cannot be used
        // Per file failures are reported in the summary
        virtual RunSummary run(const PurgeSettings& settings) = 0;
    };

    // fileTypes must outlive the engine
    std::unique_ptr<IPurgeEngine> createPurgeEngine(const FileTypes& fileTypes);
} // namespace mlcp::purge
