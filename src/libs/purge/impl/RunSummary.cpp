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

#include "purge/RunSummary.hpp"

namespace mlcp::purge
{
    const char* getOperationName(Operation operation)
    {
        switch (operation)
        {
        case Operation::Simulate:
            return "SIMULATED";
        case Operation::Purge:
            return "PURGED";
        case Operation::Backup:
            return "BACKED-UP";
        }
        return "";
    }
} // namespace mlcp::purge
